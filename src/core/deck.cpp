#include "core/deck.hpp"
#include <stdexcept>
#include <algorithm>

namespace poker_eval {

Deck::Deck()
    : cards_(FULL_DECK)
{
    std::random_device rd;
    rng_.seed(rd());
    shuffle();
}

Deck::Deck(uint32_t seed)
    : cards_(FULL_DECK),
      rng_(seed)
{
    shuffle();
}

Deck Deck::make_empty() {
    Deck deck(0u);
    deck.cards_ = EMPTY_BOARD;
    deck.order_.clear();
    return deck;
}

bool Deck::insert(Card c) {
    if (c >= INVALID_CARD || test_card(cards_, c)) {
        return false;
    }
    set_card(cards_, c);
    // La carte réinsérée passe en fin de file de tirage
    order_.insert(order_.begin(), c);
    return true;
}

bool Deck::remove(Card c) {
    if (!test_card(cards_, c)) {
        return false;
    }
    clear_card(cards_, c);
    order_.erase(std::remove(order_.begin(), order_.end(), c), order_.end());
    return true;
}

bool Deck::contains(Card c) const {
    return test_card(cards_, c);
}

size_t Deck::size() const {
    return static_cast<size_t>(count_set_bits(cards_));
}

bool Deck::empty() const {
    return cards_ == EMPTY_BOARD;
}

std::vector<Card> Deck::cards() const {
    return board_to_cards(cards_);
}

Card Deck::deal_card() {
    if (order_.empty()) {
        throw std::runtime_error("Deck is empty, cannot deal card.");
    }
    // On tire depuis la fin du vecteur (O(1))
    Card c = order_.back();
    order_.pop_back();
    clear_card(cards_, c);
    return c;
}

void Deck::shuffle() {
    order_ = board_to_cards(cards_);
    std::shuffle(order_.begin(), order_.end(), rng_);
}

void Deck::reset() {
    cards_ = FULL_DECK;
    shuffle();
}

std::string Deck::to_string() const {
    std::string out;
    size_t i = 0;
    for (Card c : cards()) {
        if (i > 0) {
            out += (i % 10 == 0) ? "\n" : ", ";
        }
        out += to_pretty_string(c);
        ++i;
    }
    return out;
}

} // namespace poker_eval
