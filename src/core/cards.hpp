#ifndef POKER_EVAL_CARDS_HPP
#define POKER_EVAL_CARDS_HPP

#include <cstdint>
#include <string>

namespace poker_eval {

// Une carte = index 0-51 (suit * 13 + rank), donc égalité <=> même paire (couleur, rang)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;
constexpr int  NUM_RANKS    = 13;
constexpr int  NUM_SUITS    = 4;

// Couleurs : simple index de plan de bits, aucun ordre significatif pour le classement
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// Rangs : l'index est aussi la position du bit dans un RankMask (TWO = bit 0, ACE = bit 12)
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / 13);
}

// --- Arithmétique sur les rangs ---

// Valeur "poker" du rang : 2..14 (As = 14)
constexpr int rank_value(Rank r) {
    return static_cast<int>(r) + 2;
}

// Distance absolue entre deux rangs
constexpr int rank_gap(Rank a, Rank b) {
    int d = static_cast<int>(a) - static_cast<int>(b);
    return d < 0 ? -d : d;
}

// Distance jusqu'à l'As
constexpr int gap_to_ace(Rank r) {
    return static_cast<int>(Rank::ACE) - static_cast<int>(r);
}

// 2..14 -> Rank, lance PokerError(UNEXPECTED_RANK_CHAR) hors domaine
Rank rank_from_value(int value);

// --- Conversions string <-> Card/Rank/Suit ---
// Format d'un code carte : <couleur><rang>, ex. "SA", "hT" (insensible à la casse)
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);
std::string to_pretty_string(Card c); // Avec symbole de couleur, ex. "♠A"

char rank_to_char(Rank r);
char suit_to_char(Suit s);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace poker_eval

#endif // POKER_EVAL_CARDS_HPP
