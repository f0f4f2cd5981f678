#include "poker_eval/errors.h"

namespace poker_eval {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNEXPECTED_RANK_CHAR: return "Unable to parse rank";
        case ErrorKind::UNEXPECTED_SUIT_CHAR: return "Unable to parse suit";
        case ErrorKind::UNEXPECTED_CARD_CHAR: return "Error reading characters while parsing";
        case ErrorKind::INVALID_HAND_SIZE:    return "Hand must contain exactly 2 cards";
        case ErrorKind::INVALID_RANGE:        return "Invalid hand range";
        default:                              return "Unknown error";
    }
}

PokerError::PokerError(ErrorKind kind, const std::string& detail)
    : std::invalid_argument(detail.empty()
                                ? std::string(error_kind_to_string(kind))
                                : std::string(error_kind_to_string(kind)) + ": " + detail),
      kind_(kind) {}

} // namespace poker_eval
