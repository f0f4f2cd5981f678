#include "poker_eval/range.h"
#include "poker_eval/errors.h"
#include "spdlog/spdlog.h"

#include <cctype>
#include <regex>
#include <vector>

namespace poker_eval {

namespace {

// Matchers construits au premier appel puis jamais modifiés (init statique thread-safe)
const std::regex& token_regex() {
    static const std::regex re(R"([AKQJT2-9]{2}[OS]?\+?)", std::regex::icase | std::regex::optimize);
    return re;
}

const std::regex& comma_regex() {
    static const std::regex re(R"(\s*,\s*)");
    return re;
}

std::string trim(const std::string& s) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

// "  88+ , AJo+ " -> {"88+", "AJo+"}
std::vector<std::string> split_tokens(const std::string& range_text) {
    const std::string normalized = trim(std::regex_replace(range_text, comma_regex(), ","));

    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        const size_t comma = normalized.find(',', start);
        if (comma == std::string::npos) {
            tokens.push_back(normalized.substr(start));
            break;
        }
        tokens.push_back(normalized.substr(start, comma - start));
        start = comma + 1;
    }
    return tokens;
}

std::string label(Rank high, Rank low) {
    return std::string{rank_to_char(high), rank_to_char(low)};
}

} // namespace

// --- RangeCombinations ---

bool RangeCombinations::insert_offsuit(Rank high, Rank low) {
    return offsuit_.insert(label(high, low)).second;
}

bool RangeCombinations::insert_suited(Rank high, Rank low) {
    return suited_.insert(label(high, low)).second;
}

bool RangeCombinations::insert_paired(Rank r) {
    return paired_.insert(label(r, r)).second;
}

int RangeCombinations::combination_count() const {
    return static_cast<int>(offsuit_.size()) * OFFSUIT_COMBINATIONS
         + static_cast<int>(suited_.size()) * SUITED_COMBINATIONS
         + static_cast<int>(paired_.size()) * PAIRED_COMBINATIONS;
}

double RangeCombinations::fraction() const {
    return static_cast<double>(combination_count()) / HAND_COMBINATIONS;
}

// --- Parsing ---

bool is_valid_range_token(const std::string& token) {
    return std::regex_match(token, token_regex());
}

RangeToken parse_range_token(const std::string& token) {
    if (!is_valid_range_token(token)) {
        spdlog::debug("Range: token '{}' rejeté (grammaire).", token);
        throw PokerError(ErrorKind::INVALID_RANGE, "'" + token + "'");
    }

    const Rank first = rank_from_char(token[0]);
    const Rank second = rank_from_char(token[1]);

    RangeToken parsed;
    parsed.high = first < second ? second : first;
    parsed.low = first < second ? first : second;
    parsed.plus = token.back() == '+';

    const char suffix = token.size() > 2
        ? static_cast<char>(std::tolower(static_cast<unsigned char>(token[2])))
        : '\0';

    if (first == second) {
        // Une paire reste une paire, même avec un suffixe o/s
        parsed.type = HandType::PAIRED;
    } else if (suffix == 'o') {
        parsed.type = HandType::OFFSUIT;
    } else if (suffix == 's') {
        parsed.type = HandType::SUITED;
    } else {
        parsed.type = HandType::UNPAIRED;
    }
    return parsed;
}

void add_range_token(RangeCombinations& combos, const RangeToken& token) {
    if (token.type == HandType::PAIRED) {
        // "88+" : 88 jusqu'à AA inclus
        const int last = token.plus ? static_cast<int>(Rank::ACE) : static_cast<int>(token.high);
        for (int r = static_cast<int>(token.high); r <= last; ++r) {
            combos.insert_paired(static_cast<Rank>(r));
        }
        return;
    }

    // "AJo+" : la haute carte reste fixe, le kicker monte jusqu'à high - 1
    const int first_low = static_cast<int>(token.low);
    const int last_low = token.plus ? static_cast<int>(token.high) - 1 : first_low;
    for (int l = first_low; l <= last_low; ++l) {
        const Rank low = static_cast<Rank>(l);
        if (token.type == HandType::OFFSUIT || token.type == HandType::UNPAIRED) {
            combos.insert_offsuit(token.high, low);
        }
        if (token.type == HandType::SUITED || token.type == HandType::UNPAIRED) {
            combos.insert_suited(token.high, low);
        }
    }
}

RangeCombinations expand_range(const std::string& range_text) {
    RangeCombinations combos;
    for (const auto& text : split_tokens(range_text)) {
        const RangeToken token = parse_range_token(text);
        add_range_token(combos, token);
        spdlog::trace("Range: '{}' -> {} {}{}{} ({} combos cumulés)",
                      text, hand_type_to_string(token.type),
                      to_string(token.high), to_string(token.low),
                      token.plus ? "+" : "", combos.combination_count());
    }
    return combos;
}

double measure(const std::string& range_text) {
    return expand_range(range_text).fraction();
}

} // namespace poker_eval
