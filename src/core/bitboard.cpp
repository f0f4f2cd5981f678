#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include <algorithm> // for std::sort

namespace poker_eval {

std::string board_to_string(Bitboard board) {
    std::vector<Card> cards = board_to_cards(board);
    // Tri par index pour un affichage stable
    std::sort(cards.begin(), cards.end());

    std::string out;
    for (Card c : cards) {
        out += to_string(c);
    }
    return out;
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board));
    while (board != 0) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        set_card(board, c);
    }
    return board;
}

std::string rank_mask_to_string(RankMask mask) {
    std::string out;
    for (int r = NUM_RANKS - 1; r >= 0; --r) {
        if (mask & (1u << r)) {
            out += rank_to_char(static_cast<Rank>(r));
        }
    }
    return out;
}

} // namespace poker_eval
