#ifndef POKER_EVAL_BITBOARD_HPP
#define POKER_EVAL_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace poker_eval {

// --- Ensembles de cartes (52 bits) ---

using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << 52) - 1;

inline void set_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) {
        board |= (1ULL << c);
    }
}

inline void clear_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) {
        board &= ~(1ULL << c);
    }
}

inline bool test_card(Bitboard board, Card c) {
    if (c >= INVALID_CARD) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Extrait la carte du bit le moins significatif et l'enlève du board
inline Card pop_lsb(Bitboard& board) {
    if (board == 0) {
        return INVALID_CARD;
    }
    int lsb_index = std::countr_zero(board);
    board &= (board - 1);
    return static_cast<Card>(lsb_index);
}

std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(const std::vector<Card>& cards);

// --- Masques de rangs (13 bits utiles, bit r = Rank r) ---

using RankMask = uint16_t;

constexpr int RANK_MASK_BITS = 16;

// A-2-3-4-5 : la roue, plus petite quinte malgré l'As
constexpr RankMask WHEEL_MASK = 0b1'0000'0000'1111;

constexpr RankMask rank_bit(Rank r) {
    return static_cast<RankMask>(1u << static_cast<unsigned>(r));
}

inline int count_ranks(RankMask mask) {
    return std::popcount(mask);
}

// Ne garde que le bit le plus haut (0 si le masque est vide)
inline RankMask keep_highest(RankMask mask) {
    if (mask == 0) return 0;
    return static_cast<RankMask>(1u << (RANK_MASK_BITS - std::countl_zero(mask) - 1));
}

// Efface les bits les plus bas jusqu'à ce qu'il en reste exactement n
inline RankMask keep_n(RankMask mask, int n) {
    RankMask result = mask;
    while (std::popcount(result) > n) {
        result &= static_cast<RankMask>(result - 1);
    }
    return result;
}

// Rang le plus haut présent dans le masque (masque non vide)
inline Rank highest_rank(RankMask mask) {
    return static_cast<Rank>(RANK_MASK_BITS - std::countl_zero(mask) - 1);
}

std::string rank_mask_to_string(RankMask mask); // Du plus haut au plus bas, ex. "AKT95"

} // namespace poker_eval

#endif // POKER_EVAL_BITBOARD_HPP
