#ifndef POKER_EVAL_CORE_DECK_HPP
#define POKER_EVAL_CORE_DECK_HPP

#include "core/cards.hpp"
#include "core/bitboard.hpp"
#include <vector>
#include <random>
#include <string>

namespace poker_eval {

// Ensemble de cartes (au plus les 52) avec tirage aléatoire.
// L'appartenance est portée par un Bitboard, l'ordre de tirage par order_.
class Deck {
public:
    Deck();                       // 52 cartes, graine aléatoire
    explicit Deck(uint32_t seed); // 52 cartes, graine fixe (tests)
    ~Deck() = default;

    static Deck make_empty();

    bool insert(Card c);          // false si déjà présente
    bool remove(Card c);          // false si absente
    bool contains(Card c) const;
    size_t size() const;
    bool empty() const;
    std::vector<Card> cards() const;

    Card deal_card();             // Lance std::runtime_error si vide
    void shuffle();
    void reset();                 // Remet les 52 cartes et mélange

    std::string to_string() const;

private:
    Bitboard          cards_;
    std::vector<Card> order_;
    std::mt19937      rng_;
};

} // namespace poker_eval

#endif // POKER_EVAL_CORE_DECK_HPP
