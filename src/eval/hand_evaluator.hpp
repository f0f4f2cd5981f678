#ifndef POKER_EVAL_HAND_EVALUATOR_HPP
#define POKER_EVAL_HAND_EVALUATOR_HPP

#include <vector>
#include <cstdint>
#include <string>

#include "core/cards.hpp"
#include "core/bitboard.hpp"
#include "core/hand.hpp"
#include "poker_eval/common_types.h"

namespace poker_eval {

// Force d'une main : catégorie + valeur de départage.
// La catégorie domine toujours ; value ne départage qu'à catégorie égale.
// Encodage de value : (bits du groupe majeur << 13) | bits des kickers,
// sauf quinte / quinte flush où value = rang de la quinte (0 = roue, 9 = As haut).
struct HandRank {
    HandCategory category = HandCategory::HIGH_CARD;
    uint32_t     value    = 0;

    bool operator<(const HandRank& other) const {
        if (category != other.category) {
            return static_cast<int>(category) < static_cast<int>(other.category);
        }
        return value < other.value;
    }

    bool operator==(const HandRank& other) const {
        return category == other.category && value == other.value;
    }

    bool operator>(const HandRank& other) const { return other < *this; }
    bool operator<=(const HandRank& other) const { return !(other < *this); }
    bool operator>=(const HandRank& other) const { return !(*this < other); }
};

// Décalage du groupe majeur dans HandRank::value
constexpr int MAJOR_SHIFT = 13;

// Marqueur "pas de quinte" pour rank_straight
constexpr int NO_STRAIGHT = -1;

// --- Interface de l'évaluateur ---

/**
 * @brief Classe la meilleure main de 5 cartes parmi 5, 6 ou 7 cartes distinctes.
 * Pas d'énumération des C(7,5) sous-mains : tout passe par des masques de rangs.
 * Précondition (non vérifiée) : 5 à 7 cartes, sans doublon.
 */
HandRank rank(const std::vector<Card>& cards);
HandRank rank(const Hand& hand);

/**
 * @brief Chemin rapide pour exactement 5 cartes distinctes.
 * Dispatch sur le nombre de rangs distincts (5/4/3/2).
 */
HandRank rank_five(const std::vector<Card>& cards);
HandRank rank_five(const Hand& hand);

/**
 * @brief Indices (ordre d'entrée) de toutes les mains à égalité au maximum.
 * Entrée vide -> résultat vide.
 */
std::vector<size_t> compare(const std::vector<HandRank>& ranks);

/**
 * @brief Type d'une main de départ : PAIRED, SUITED ou OFFSUIT.
 * @throws PokerError(INVALID_HAND_SIZE) si la main n'a pas exactement 2 cartes.
 */
HandType classify_starting_hand(const std::vector<Card>& cards);
HandType classify_starting_hand(const Hand& hand);

// Rang de quinte d'un masque (0..9) ou NO_STRAIGHT
int rank_straight(RankMask mask);

// Affichage, ex. "Full House: 9 over A", "Straight: 5 high"
std::string hand_rank_to_string(const HandRank& rank);

} // namespace poker_eval

#endif // POKER_EVAL_HAND_EVALUATOR_HPP
