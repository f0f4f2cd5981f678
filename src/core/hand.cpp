#include "core/hand.hpp"
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace poker_eval {

Hand::Hand(std::vector<Card> cards)
    : cards_(std::move(cards)) {}

Hand::Hand(std::initializer_list<Card> cards)
    : cards_(cards) {}

Hand Hand::from_strings(const std::vector<std::string>& codes) {
    std::vector<Card> cards;
    cards.reserve(codes.size());
    for (const auto& code : codes) {
        cards.push_back(card_from_string(code));
    }
    return Hand(std::move(cards));
}

Hand& Hand::push(Card c) {
    cards_.push_back(c);
    return *this;
}

Hand& Hand::remove(size_t index) {
    if (index >= cards_.size()) {
        throw std::out_of_range("Hand::remove: index " + std::to_string(index) +
                                " out of range (size " + std::to_string(cards_.size()) + ")");
    }
    cards_.erase(cards_.begin() + static_cast<std::ptrdiff_t>(index));
    return *this;
}

Hand& Hand::truncate(size_t len) {
    if (len < cards_.size()) {
        cards_.resize(len);
    }
    return *this;
}

Hand& Hand::extend(const std::vector<Card>& cards) {
    cards_.insert(cards_.end(), cards.begin(), cards.end());
    return *this;
}

std::string Hand::to_string() const {
    std::string out;
    for (size_t i = 0; i < cards_.size(); ++i) {
        if (i > 0) {
            out += (i % 10 == 0) ? "\n" : ", ";
        }
        out += to_pretty_string(cards_[i]);
    }
    return out;
}

} // namespace poker_eval
