#ifndef POKER_EVAL_CORE_HAND_HPP
#define POKER_EVAL_CORE_HAND_HPP

#include "core/cards.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace poker_eval {

// Séquence ordonnée de cartes (2 à 7 en Hold'em), modifiable.
// Aucune vérification de doublons : c'est une précondition de l'appelant.
class Hand {
public:
    Hand() = default;
    explicit Hand(std::vector<Card> cards);
    Hand(std::initializer_list<Card> cards);

    // Construit à partir de codes carte ("SA", "hT"...).
    // Le premier code invalide interrompt la construction (PokerError).
    static Hand from_strings(const std::vector<std::string>& codes);

    Hand& push(Card c);
    Hand& remove(size_t index);   // Lance std::out_of_range si index invalide
    Hand& truncate(size_t len);
    Hand& extend(const std::vector<Card>& cards);

    size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }

    const Card& operator[](size_t index) const { return cards_[index]; }
    const std::vector<Card>& cards() const { return cards_; }

    std::vector<Card>::const_iterator begin() const { return cards_.begin(); }
    std::vector<Card>::const_iterator end() const { return cards_.end(); }

    // "♠A, ♥T, ..." avec un retour à la ligne toutes les 10 cartes
    std::string to_string() const;

private:
    std::vector<Card> cards_;
};

} // namespace poker_eval

#endif // POKER_EVAL_CORE_HAND_HPP
