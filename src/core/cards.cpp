#include "core/cards.hpp"
#include "poker_eval/errors.h"
#include <cctype>
#include <map>

namespace poker_eval {

// Tables de conversion char <-> Rank/Suit (clés en majuscules)
const std::map<char, Rank> CHAR_TO_RANK = {
    {'2', Rank::TWO}, {'3', Rank::THREE}, {'4', Rank::FOUR}, {'5', Rank::FIVE},
    {'6', Rank::SIX}, {'7', Rank::SEVEN}, {'8', Rank::EIGHT}, {'9', Rank::NINE},
    {'T', Rank::TEN}, {'J', Rank::JACK}, {'Q', Rank::QUEEN}, {'K', Rank::KING},
    {'A', Rank::ACE}
};
const std::map<char, Suit> CHAR_TO_SUIT = {
    {'C', Suit::CLUBS}, {'D', Suit::DIAMONDS}, {'H', Suit::HEARTS}, {'S', Suit::SPADES}
};
const std::map<Rank, char> RANK_TO_CHAR = {
    {Rank::TWO, '2'}, {Rank::THREE, '3'}, {Rank::FOUR, '4'}, {Rank::FIVE, '5'},
    {Rank::SIX, '6'}, {Rank::SEVEN, '7'}, {Rank::EIGHT, '8'}, {Rank::NINE, '9'},
    {Rank::TEN, 'T'}, {Rank::JACK, 'J'}, {Rank::QUEEN, 'Q'}, {Rank::KING, 'K'},
    {Rank::ACE, 'A'}
};
const std::map<Suit, char> SUIT_TO_CHAR = {
    {Suit::CLUBS, 'C'}, {Suit::DIAMONDS, 'D'}, {Suit::HEARTS, 'H'}, {Suit::SPADES, 'S'}
};
const std::map<Suit, std::string> SUIT_TO_ICON = {
    {Suit::CLUBS, "♣"}, {Suit::DIAMONDS, "♦"}, {Suit::HEARTS, "♥"}, {Suit::SPADES, "♠"}
};


// --- Implémentations des fonctions de conversion ---

Rank rank_from_char(char r) {
    auto it = CHAR_TO_RANK.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (it == CHAR_TO_RANK.end()) {
        throw PokerError(ErrorKind::UNEXPECTED_RANK_CHAR, "'" + std::string(1, r) + "'");
    }
    return it->second;
}

Suit suit_from_char(char s) {
    auto it = CHAR_TO_SUIT.find(static_cast<char>(std::toupper(static_cast<unsigned char>(s))));
    if (it == CHAR_TO_SUIT.end()) {
        throw PokerError(ErrorKind::UNEXPECTED_SUIT_CHAR, "'" + std::string(1, s) + "'");
    }
    return it->second;
}

Rank rank_from_value(int value) {
    if (value < rank_value(Rank::TWO) || value > rank_value(Rank::ACE)) {
        throw PokerError(ErrorKind::UNEXPECTED_RANK_CHAR, "rank value " + std::to_string(value));
    }
    return static_cast<Rank>(value - 2);
}

char rank_to_char(Rank r) {
    auto it = RANK_TO_CHAR.find(r);
    return it == RANK_TO_CHAR.end() ? '?' : it->second;
}

char suit_to_char(Suit s) {
    auto it = SUIT_TO_CHAR.find(s);
    return it == SUIT_TO_CHAR.end() ? '?' : it->second;
}

std::string to_string(Rank r) {
    return std::string(1, rank_to_char(r));
}

std::string to_string(Suit s) {
    return std::string(1, suit_to_char(s));
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_suit(c)) + to_string(get_rank(c));
}

std::string to_pretty_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return SUIT_TO_ICON.at(get_suit(c)) + to_string(get_rank(c));
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw PokerError(ErrorKind::UNEXPECTED_CARD_CHAR,
                         "'" + s + "', expected <suit><rank> such as 'SA'");
    }
    // La couleur est lue avant le rang : une couleur invalide est signalée en priorité
    Suit su = suit_from_char(s[0]);
    Rank r = rank_from_char(s[1]);
    return make_card(r, su);
}

} // namespace poker_eval
