#ifndef POKER_EVAL_COMMON_TYPES_H
#define POKER_EVAL_COMMON_TYPES_H

#include <cstdint>

namespace poker_eval {

// Catégories de mains, de la plus faible à la plus forte.
// L'ordre numérique est utilisé explicitement par HandRank (pas d'ordre implicite).
enum class HandCategory : uint8_t {
    HIGH_CARD       = 0,
    ONE_PAIR        = 1,
    TWO_PAIR        = 2,
    THREE_OF_A_KIND = 3,
    STRAIGHT        = 4,
    FLUSH           = 5,
    FULL_HOUSE      = 6,
    FOUR_OF_A_KIND  = 7,
    STRAIGHT_FLUSH  = 8
};

// Type d'une main de départ (2 cartes) ou d'un token de range.
// UNPAIRED = deux rangs distincts sans suffixe (suited ET offsuit).
enum class HandType {
    OFFSUIT,
    SUITED,
    PAIRED,
    UNPAIRED
};

inline const char* hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::ONE_PAIR:        return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        default:                            return "Unknown";
    }
}

inline const char* hand_type_to_string(HandType type) {
    switch (type) {
        case HandType::OFFSUIT:  return "Offsuit";
        case HandType::SUITED:   return "Suited";
        case HandType::PAIRED:   return "Paired";
        case HandType::UNPAIRED: return "Unpaired";
        default:                 return "Unknown";
    }
}

} // namespace poker_eval

#endif // POKER_EVAL_COMMON_TYPES_H
