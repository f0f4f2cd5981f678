// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur 5-7 cartes par masques de bits (13 bits par rang).
//  Aucune table de lookup : tout se calcule à partir de trois familles de masques
//  (rangs présents, rangs par couleur, rangs groupés par nombre d'occurrences).
// ─────────────────────────────────────────────────────────────────────────────
#include "hand_evaluator.hpp"
#include "poker_eval/errors.h"
#include <array>

namespace poker_eval {

namespace {

// Masques calculés en une passe sur les cartes
struct RankCounts {
    // count_to_value[k] : bit r à 1 si le rang r apparaît exactement k fois
    std::array<RankMask, 5> count_to_value{};
    // suit_masks[s] : bit r à 1 si la couleur s possède le rang r
    std::array<RankMask, NUM_SUITS> suit_masks{};
    // Rangs présents (sans multiplicité)
    RankMask present = 0;
};

RankCounts compute_counts(const std::vector<Card>& cards) {
    RankCounts counts;
    std::array<uint8_t, NUM_RANKS> value_to_count{};

    for (Card c : cards) {
        const auto r = static_cast<unsigned>(get_rank(c));
        const auto s = static_cast<unsigned>(get_suit(c));
        const auto bit = static_cast<RankMask>(1u << r);
        counts.present |= bit;
        counts.suit_masks[s] |= bit;
        // Précondition : cartes distinctes, donc au plus 4 occurrences
        if (value_to_count[r] < 4) {
            ++value_to_count[r];
        }
    }

    for (int r = 0; r < NUM_RANKS; ++r) {
        counts.count_to_value[value_to_count[r]] |= static_cast<RankMask>(1u << r);
    }
    return counts;
}

// Index de la première couleur avec au moins 5 cartes, -1 sinon
int find_flush(const std::array<RankMask, NUM_SUITS>& suit_masks) {
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (count_ranks(suit_masks[s]) >= 5) {
            return s;
        }
    }
    return -1;
}

constexpr uint32_t pack(RankMask major, RankMask minor) {
    return (static_cast<uint32_t>(major) << MAJOR_SHIFT) | minor;
}

constexpr HandRank make_rank(HandCategory category, uint32_t value) {
    return HandRank{category, value};
}

} // namespace

int rank_straight(RankMask mask) {
    // Un bit survit à la position haute de chaque suite de 5 rangs consécutifs
    const uint32_t m = mask;
    const auto runs = static_cast<RankMask>(m & (m << 1) & (m << 2) & (m << 3) & (m << 4));
    if (runs != 0) {
        // Hauteur p (bit 4 = six, bit 12 = As) -> rang de quinte p - 3 (1..9)
        return static_cast<int>(highest_rank(runs)) - 3;
    }
    if ((mask & WHEEL_MASK) == WHEEL_MASK) {
        return 0;
    }
    return NO_STRAIGHT;
}

// --- Évaluation générale (5 à 7 cartes) ---

HandRank rank(const std::vector<Card>& cards) {
    const RankCounts counts = compute_counts(cards);
    const auto& ctv = counts.count_to_value;
    const RankMask present = counts.present;

    // Couleur / quinte flush : avec au plus 7 cartes, une seule couleur peut en avoir 5
    const int flush_suit = find_flush(counts.suit_masks);
    RankMask flush_ranks = 0;
    if (flush_suit >= 0) {
        const RankMask suited = counts.suit_masks[flush_suit];
        const int straight = rank_straight(suited);
        if (straight != NO_STRAIGHT) {
            return make_rank(HandCategory::STRAIGHT_FLUSH, static_cast<uint32_t>(straight));
        }
        flush_ranks = keep_n(suited, 5);
    }

    if (ctv[4] != 0) {
        const RankMask kicker = keep_highest(present ^ ctv[4]);
        return make_rank(HandCategory::FOUR_OF_A_KIND, pack(ctv[4], kicker));
    }

    // Deux brelans : le plus haut fait le brelan, l'autre la paire
    if (count_ranks(ctv[3]) >= 2) {
        const RankMask set = keep_highest(ctv[3]);
        const RankMask pair = keep_highest(static_cast<RankMask>((ctv[3] ^ set) | ctv[2]));
        return make_rank(HandCategory::FULL_HOUSE, pack(set, pair));
    }

    if (ctv[3] != 0 && ctv[2] != 0) {
        return make_rank(HandCategory::FULL_HOUSE, pack(ctv[3], keep_highest(ctv[2])));
    }

    if (flush_suit >= 0) {
        return make_rank(HandCategory::FLUSH, flush_ranks);
    }

    const int straight = rank_straight(present);
    if (straight != NO_STRAIGHT) {
        return make_rank(HandCategory::STRAIGHT, static_cast<uint32_t>(straight));
    }

    if (ctv[3] != 0) {
        const RankMask kickers = keep_n(present ^ ctv[3], 2);
        return make_rank(HandCategory::THREE_OF_A_KIND, pack(ctv[3], kickers));
    }

    if (count_ranks(ctv[2]) >= 2) {
        const RankMask pairs = keep_n(ctv[2], 2);
        const RankMask kicker = keep_highest(present ^ pairs);
        return make_rank(HandCategory::TWO_PAIR, pack(pairs, kicker));
    }

    if (ctv[2] != 0) {
        const RankMask kickers = keep_n(present ^ ctv[2], 3);
        return make_rank(HandCategory::ONE_PAIR, pack(ctv[2], kickers));
    }

    return make_rank(HandCategory::HIGH_CARD, keep_n(present, 5));
}

HandRank rank(const Hand& hand) {
    return rank(hand.cards());
}

// --- Chemin rapide 5 cartes ---

HandRank rank_five(const std::vector<Card>& cards) {
    const RankCounts counts = compute_counts(cards);
    const auto& ctv = counts.count_to_value;
    const RankMask present = counts.present;

    switch (count_ranks(present)) {
        case 5: {
            bool is_flush = false;
            for (RankMask sv : counts.suit_masks) {
                if (count_ranks(sv) == 5) is_flush = true;
            }
            const int straight = rank_straight(present);
            if (straight != NO_STRAIGHT) {
                return make_rank(is_flush ? HandCategory::STRAIGHT_FLUSH : HandCategory::STRAIGHT,
                                 static_cast<uint32_t>(straight));
            }
            return make_rank(is_flush ? HandCategory::FLUSH : HandCategory::HIGH_CARD, present);
        }
        case 4:
            return make_rank(HandCategory::ONE_PAIR, pack(ctv[2], present ^ ctv[2]));
        case 3:
            if (ctv[3] != 0) {
                return make_rank(HandCategory::THREE_OF_A_KIND, pack(ctv[3], present ^ ctv[3]));
            }
            return make_rank(HandCategory::TWO_PAIR, pack(ctv[2], present ^ ctv[2]));
        case 2:
            if (ctv[3] != 0) {
                return make_rank(HandCategory::FULL_HOUSE, pack(ctv[3], present ^ ctv[3]));
            }
            return make_rank(HandCategory::FOUR_OF_A_KIND, pack(ctv[4], present ^ ctv[4]));
        default:
            // Hors précondition (pas 5 cartes distinctes) : chemin général
            return rank(cards);
    }
}

HandRank rank_five(const Hand& hand) {
    return rank_five(hand.cards());
}

// --- Comparaison ---

std::vector<size_t> compare(const std::vector<HandRank>& ranks) {
    std::vector<size_t> winners;
    if (ranks.empty()) {
        return winners;
    }

    HandRank best = ranks[0];
    winners.push_back(0);

    for (size_t i = 1; i < ranks.size(); ++i) {
        if (best < ranks[i]) {
            best = ranks[i];
            winners.clear();
            winners.push_back(i);
        } else if (ranks[i] == best) {
            winners.push_back(i);
        }
    }
    return winners;
}

// --- Main de départ (2 cartes) ---

HandType classify_starting_hand(const std::vector<Card>& cards) {
    if (cards.size() != 2) {
        throw PokerError(ErrorKind::INVALID_HAND_SIZE,
                         "got " + std::to_string(cards.size()) + " cards");
    }
    if (get_rank(cards[0]) == get_rank(cards[1])) {
        return HandType::PAIRED;
    }
    if (get_suit(cards[0]) == get_suit(cards[1])) {
        return HandType::SUITED;
    }
    return HandType::OFFSUIT;
}

HandType classify_starting_hand(const Hand& hand) {
    return classify_starting_hand(hand.cards());
}

// --- Affichage ---

std::string hand_rank_to_string(const HandRank& rank) {
    std::string out = hand_category_to_string(rank.category);

    if (rank.category == HandCategory::STRAIGHT || rank.category == HandCategory::STRAIGHT_FLUSH) {
        // 0 = roue (5 haut), sinon la hauteur est rang + 3
        const Rank high = rank.value == 0 ? Rank::FIVE : static_cast<Rank>(rank.value + 3);
        return out + ": " + to_string(high) + " high";
    }

    const auto major_mask = static_cast<RankMask>(rank.value >> MAJOR_SHIFT);
    const auto minor_mask = static_cast<RankMask>(rank.value & ((1u << MAJOR_SHIFT) - 1));

    if (rank.category == HandCategory::FULL_HOUSE) {
        return out + ": " + rank_mask_to_string(major_mask) + " over " + rank_mask_to_string(minor_mask);
    }

    out += ": ";
    if (major_mask != 0) {
        out += rank_mask_to_string(major_mask);
        if (minor_mask != 0) out += " + ";
    }
    out += rank_mask_to_string(minor_mask);
    return out;
}

} // namespace poker_eval
