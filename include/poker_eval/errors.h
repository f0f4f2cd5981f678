#ifndef POKER_EVAL_ERRORS_H
#define POKER_EVAL_ERRORS_H

#include <stdexcept>
#include <string>

namespace poker_eval {

// Types d'erreurs remontées à l'appelant (toutes des erreurs de validation d'entrée)
enum class ErrorKind {
    UNEXPECTED_RANK_CHAR, // Caractère de rang inconnu
    UNEXPECTED_SUIT_CHAR, // Caractère de couleur inconnu
    UNEXPECTED_CARD_CHAR, // Code carte trop court / trop long
    INVALID_HAND_SIZE,    // Classification 2 cartes uniquement
    INVALID_RANGE         // Token de range qui ne respecte pas la grammaire
};

const char* error_kind_to_string(ErrorKind kind);

// Exception de base de la librairie.
// Dérive de std::invalid_argument : un catch sur invalid_argument l'intercepte aussi.
class PokerError : public std::invalid_argument {
public:
    PokerError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace poker_eval

#endif // POKER_EVAL_ERRORS_H
