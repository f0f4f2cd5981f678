#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include "core/cards.hpp"
#include "poker_eval/errors.h"

using namespace poker_eval;

namespace {
    ErrorKind kind_of(const std::string& code) {
        try {
            card_from_string(code);
        } catch (const PokerError& e) {
            return e.kind();
        }
        FAIL("expected PokerError for '" << code << "'");
        return ErrorKind::INVALID_RANGE; // jamais atteint
    }
} // namespace anonyme

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card ac = make_card(Rank::ACE, Suit::CLUBS);
    Card kd = make_card(Rank::KING, Suit::DIAMONDS);
    Card kh = make_card(Rank::KING, Suit::HEARTS);
    Card _2s = make_card(Rank::TWO, Suit::SPADES);

    SECTION("Card ranks and suits are correct") {
        REQUIRE(get_rank(ac) == Rank::ACE);
        REQUIRE(get_suit(ac) == Suit::CLUBS);
        REQUIRE(get_rank(kd) == Rank::KING);
        REQUIRE(get_suit(kd) == Suit::DIAMONDS);
        REQUIRE(get_rank(kh) == Rank::KING);
        REQUIRE(get_suit(kh) == Suit::HEARTS);
        REQUIRE(get_rank(_2s) == Rank::TWO);
        REQUIRE(get_suit(_2s) == Suit::SPADES);
    }

    SECTION("Same suit and rank means same card") {
        REQUIRE(make_card(Rank::KING, Suit::DIAMONDS) == kd);
        REQUIRE(kd != kh);
    }

    SECTION("to_string uses <suit><rank>") {
        REQUIRE(to_string(ac) == "CA");
        REQUIRE(to_string(kd) == "DK");
        REQUIRE(to_string(kh) == "HK");
        REQUIRE(to_string(_2s) == "S2");
        REQUIRE(to_string(INVALID_CARD) == "??");
    }

    SECTION("to_pretty_string uses suit symbols") {
        REQUIRE(to_pretty_string(make_card(Rank::ACE, Suit::SPADES)) == "♠A");
        REQUIRE(to_pretty_string(make_card(Rank::TEN, Suit::HEARTS)) == "♥T");
        REQUIRE(to_pretty_string(kd) == "♦K");
        REQUIRE(to_pretty_string(ac) == "♣A");
    }
}

TEST_CASE("Card String Parsing", "[cards][string]") {
    SECTION("card_from_string conversions") {
        REQUIRE(card_from_string("SA") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("DT") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("C2") == make_card(Rank::TWO, Suit::CLUBS));
    }

    SECTION("Parsing is case-insensitive") {
        REQUIRE(card_from_string("sa") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("hT") == make_card(Rank::TEN, Suit::HEARTS));
        REQUIRE(card_from_string("Dq") == make_card(Rank::QUEEN, Suit::DIAMONDS));
    }

    SECTION("Errors are still std::invalid_argument") {
        REQUIRE_THROWS_AS(card_from_string("XX"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("S"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string(""), std::invalid_argument);
    }

    SECTION("Each malformed input reports its own kind") {
        REQUIRE(kind_of("") == ErrorKind::UNEXPECTED_CARD_CHAR);
        REQUIRE(kind_of("S") == ErrorKind::UNEXPECTED_CARD_CHAR);
        REQUIRE(kind_of("SAx") == ErrorKind::UNEXPECTED_CARD_CHAR);
        REQUIRE(kind_of("XA") == ErrorKind::UNEXPECTED_SUIT_CHAR);
        REQUIRE(kind_of("A2") == ErrorKind::UNEXPECTED_SUIT_CHAR);
        REQUIRE(kind_of("S1") == ErrorKind::UNEXPECTED_RANK_CHAR);
        REQUIRE(kind_of("sx") == ErrorKind::UNEXPECTED_RANK_CHAR);
    }

    SECTION("Single char parsers") {
        REQUIRE(rank_from_char('t') == Rank::TEN);
        REQUIRE(rank_from_char('A') == Rank::ACE);
        REQUIRE(suit_from_char('h') == Suit::HEARTS);
        REQUIRE_THROWS_AS(rank_from_char('1'), PokerError);
        REQUIRE_THROWS_AS(suit_from_char('x'), PokerError);
    }
}

TEST_CASE("Every card code round-trips", "[cards][string]") {
    for (Card c = 0; c < INVALID_CARD; ++c) {
        const std::string code = to_string(c);
        INFO("card " << static_cast<int>(c) << " code " << code);
        const Card parsed = card_from_string(code);
        REQUIRE(get_suit(parsed) == get_suit(c));
        REQUIRE(get_rank(parsed) == get_rank(c));
    }
}

TEST_CASE("Rank arithmetic", "[cards][rank]") {
    REQUIRE(rank_value(Rank::TWO) == 2);
    REQUIRE(rank_value(Rank::ACE) == 14);
    REQUIRE(rank_from_value(11) == Rank::JACK);
    REQUIRE_THROWS_AS(rank_from_value(1), PokerError);
    REQUIRE_THROWS_AS(rank_from_value(15), PokerError);

    REQUIRE(rank_gap(Rank::ACE, Rank::JACK) == 3);
    REQUIRE(rank_gap(Rank::JACK, Rank::ACE) == 3);
    REQUIRE(rank_gap(Rank::EIGHT, Rank::EIGHT) == 0);
    REQUIRE(gap_to_ace(Rank::EIGHT) == 6);
    REQUIRE(gap_to_ace(Rank::ACE) == 0);

    REQUIRE(Rank::TWO < Rank::ACE);
    REQUIRE(Rank::KING < Rank::ACE);
}
