// tests/range_tests.cpp
#include "poker_eval/range.h"
#include "poker_eval/errors.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace poker_eval;
using Catch::Approx;

TEST_CASE("Range token grammar", "[range][grammar]")
{
    SECTION("Valid tokens")
    {
        for (const char* token : {"AKo", "AAs", "23", "TT", "QJo", "QJs", "97o", "86s", "AKo+", "q2+", "akS"}) {
            INFO("token " << token);
            REQUIRE(is_valid_range_token(token));
        }
    }

    SECTION("Invalid tokens")
    {
        for (const char* token : {"AKx", "AAos", "11", "ZZ", "A", "K", "AK+QJ", "AKo++",
                                  "AAs--", "-Aks", "AKo-A2o", "", " AK", "AK+o"}) {
            INFO("token " << token);
            REQUIRE_FALSE(is_valid_range_token(token));
        }
    }
}

TEST_CASE("Range token classification", "[range][parse]")
{
    SECTION("Pairs")
    {
        const RangeToken t = parse_range_token("AA");
        REQUIRE(t.high == Rank::ACE);
        REQUIRE(t.low == Rank::ACE);
        REQUIRE(t.type == HandType::PAIRED);
        REQUIRE_FALSE(t.plus);
        // Un suffixe ne change pas une paire
        REQUIRE(parse_range_token("AAs").type == HandType::PAIRED);
    }

    SECTION("Unsuffixed distinct ranks are unpaired")
    {
        const RangeToken t = parse_range_token("Q2+");
        REQUIRE(t.high == Rank::QUEEN);
        REQUIRE(t.low == Rank::TWO);
        REQUIRE(t.type == HandType::UNPAIRED);
        REQUIRE(t.plus);
    }

    SECTION("Suffixes, any case")
    {
        REQUIRE(parse_range_token("KTo").type == HandType::OFFSUIT);
        REQUIRE(parse_range_token("KTs").type == HandType::SUITED);
        REQUIRE(parse_range_token("ktO").type == HandType::OFFSUIT);
        REQUIRE(parse_range_token("KTS").type == HandType::SUITED);
    }

    SECTION("Rank order in the token does not matter")
    {
        const RangeToken t = parse_range_token("TKs");
        REQUIRE(t.high == Rank::KING);
        REQUIRE(t.low == Rank::TEN);
    }

    SECTION("Grammar mismatch")
    {
        REQUIRE_THROWS_AS(parse_range_token("AKx"), PokerError);
    }
}

TEST_CASE("Range expansion", "[range][expand]")
{
    SECTION("Pairs plus goes up to aces")
    {
        const RangeCombinations c = expand_range("88+");
        REQUIRE(c.paired() == std::set<std::string>{"88", "99", "TT", "JJ", "QQ", "KK", "AA"});
        REQUIRE(c.offsuit().empty());
        REQUIRE(c.suited().empty());
    }

    SECTION("Kicker plus stops below the high card")
    {
        const RangeCombinations c = expand_range("AJo+");
        REQUIRE(c.offsuit() == std::set<std::string>{"AJ", "AQ", "AK"});
        REQUIRE(c.combination_count() == 3 * OFFSUIT_COMBINATIONS);
    }

    SECTION("Unsuffixed token fills both suited and offsuit")
    {
        const RangeCombinations c = expand_range("AK");
        REQUIRE(c.offsuit() == std::set<std::string>{"AK"});
        REQUIRE(c.suited() == std::set<std::string>{"AK"});
        REQUIRE(c.combination_count() == 16);
    }

    SECTION("Insertion is idempotent")
    {
        RangeCombinations c;
        REQUIRE(c.insert_paired(Rank::EIGHT));
        REQUIRE_FALSE(c.insert_paired(Rank::EIGHT));
        REQUIRE(c.insert_suited(Rank::ACE, Rank::KING));
        REQUIRE_FALSE(c.insert_suited(Rank::ACE, Rank::KING));
        REQUIRE(c.combination_count() == PAIRED_COMBINATIONS + SUITED_COMBINATIONS);
    }

    SECTION("Whole space")
    {
        RangeCombinations c = expand_range("22+");
        for (const char* hi : {"A", "K", "Q", "J", "T", "9", "8", "7", "6", "5", "4", "3"}) {
            add_range_token(c, parse_range_token(std::string(hi) + "2+"));
        }
        REQUIRE(c.combination_count() == HAND_COMBINATIONS);
        REQUIRE(c.fraction() == Approx(1.0));
    }
}

TEST_CASE("Range percentages", "[range][measure]")
{
    const std::vector<std::pair<std::string, double>> cases = {
        {"KK+", 0.009},
        {"JJ+, AK", 0.0302},
        {"99+, AQ+", 0.0513},
        {"88+, AJo+, ATs+", 0.0709},
        {"77+, ATo+, A8s+, KQ", 0.1026},
        {"77+, ATo+, A8s+, KQ, KQo, KQs", 0.1026},
        {"66+, A8o+, A5s+, KJo+, KTs+, QJs", 0.1523},
        {"22+, A2+, K4o+, K2s+, Q6o+, Q3s+, J8o+, J7s+, T9o+, T7s+, 98o+, 97s+, 87o+, 86s+, 75s+, 65s, 54s", 0.4992},
        {"22+, 33+", 0.05882},
    };

    for (const auto& [input, expected] : cases) {
        INFO("range \"" << input << "\"");
        REQUIRE(measure(input) == Approx(expected).margin(0.0001));
    }

    SECTION("Exact percentages")
    {
        REQUIRE(measure("KK+") == Approx(12.0 / 1326.0));
        REQUIRE(measure("JJ+, AK") == Approx(40.0 / 1326.0));
    }
}

TEST_CASE("Range measure invariants", "[range][measure]")
{
    SECTION("Overlapping tokens are counted once")
    {
        REQUIRE(measure("88+,22+") == Approx(measure("22+")));
        REQUIRE(measure("KT+, K9s+") == Approx(measure("K9s, KT+")));
        REQUIRE(measure("AK, AKo, AKs") == Approx(measure("AK")));
    }

    SECTION("Token order does not matter")
    {
        REQUIRE(measure("88+, AJo+, ATs+") == Approx(measure("ATs+, 88+, AJo+")));
    }

    SECTION("Whitespace and case are normalized")
    {
        REQUIRE(measure("  jj+ ,ak  ") == Approx(measure("JJ+, AK")));
        REQUIRE(measure("88+ ,\tAJo+") == Approx(measure("88+,AJo+")));
    }
}

TEST_CASE("Range parse errors", "[range][errors]")
{
    for (const char* input : {"AKx", "AAos", "11", "ZZ", "A", "K", "AK+QJ", "AKo++", "AAs--", "-Aks",
                              "", "KK+,", "KK+,,QQ", "KK+ QQ"}) {
        INFO("input \"" << input << "\"");
        REQUIRE_THROWS_AS(measure(input), PokerError);
    }

    SECTION("Error kind is INVALID_RANGE")
    {
        try {
            measure("JJ+, AKx");
            FAIL("expected a parse error");
        } catch (const PokerError& e) {
            REQUIRE(e.kind() == ErrorKind::INVALID_RANGE);
        }
    }
}
