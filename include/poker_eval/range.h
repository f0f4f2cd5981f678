#ifndef POKER_EVAL_RANGE_H
#define POKER_EVAL_RANGE_H

#include <set>
#include <string>
#include "core/cards.hpp"
#include "poker_eval/common_types.h"

namespace poker_eval {

// Nombre total de mains de départ : C(52, 2)
constexpr int HAND_COMBINATIONS = 1326;

// Nombre de donnes par classe de main précise (ex. "AK" offsuit = 12)
constexpr int OFFSUIT_COMBINATIONS = 12;
constexpr int SUITED_COMBINATIONS  = 4;
constexpr int PAIRED_COMBINATIONS  = 6;

// Un token de range décodé, ex. "AJo+" -> {ACE, JACK, OFFSUIT, plus}
// high >= low toujours, quel que soit l'ordre d'écriture du token.
struct RangeToken {
    Rank     high = Rank::TWO;
    Rank     low  = Rank::TWO;
    HandType type = HandType::PAIRED;
    bool     plus = false;
};

// Classes de mains couvertes par une range, dédupliquées.
// Étiquettes : "AK" pour offsuit / suited, "88" pour les paires.
class RangeCombinations {
public:
    // Retournent false si l'étiquette était déjà présente (insertion idempotente)
    bool insert_offsuit(Rank high, Rank low);
    bool insert_suited(Rank high, Rank low);
    bool insert_paired(Rank r);

    const std::set<std::string>& offsuit() const { return offsuit_; }
    const std::set<std::string>& suited() const { return suited_; }
    const std::set<std::string>& paired() const { return paired_; }

    // offsuit*12 + suited*4 + paired*6
    int combination_count() const;

    // combination_count() / 1326
    double fraction() const;

private:
    std::set<std::string> offsuit_;
    std::set<std::string> suited_;
    std::set<std::string> paired_;
};

// Vérifie uniquement la grammaire <rang><rang>[o|s]?[+]? (insensible à la casse)
bool is_valid_range_token(const std::string& token);

// @throws PokerError(INVALID_RANGE) si le token ne respecte pas la grammaire
RangeToken parse_range_token(const std::string& token);

// Ajoute les classes couvertes par un token (expansion du '+' comprise)
void add_range_token(RangeCombinations& combos, const RangeToken& token);

// Découpe "88+, AJo+" en tokens et les développe.
// @throws PokerError(INVALID_RANGE) au premier token invalide, sans résultat partiel
RangeCombinations expand_range(const std::string& range_text);

// Fraction des 1326 mains de départ couverte par la range (0.0 - 1.0)
double measure(const std::string& range_text);

} // namespace poker_eval

#endif // POKER_EVAL_RANGE_H
