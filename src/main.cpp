#include "poker_eval/range.h"
#include "poker_eval/errors.h"
#include "core/hand.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <iostream>   // std::cout, std::cerr, std::getline
#include <string>     // std::string
#include <vector>     // std::vector
#include <exception>  // std::exception
#include <sstream>    // std::stringstream
#include <iomanip>    // std::setprecision

namespace {

void print_usage(const char* prog)
{
    std::cerr << "Usage:\n"
              << "  " << prog << " [-v] \"<range>\"           ex. \"88+, AJo+, ATs+\"\n"
              << "  " << prog << " [-v]                     (range lue sur stdin)\n"
              << "  " << prog << " [-v] --hand <cartes...>  ex. --hand SA SK SQ SJ ST\n";
}

int run_range(const std::string& range_text)
{
    spdlog::info("Calcul de la range \"{}\"", range_text);
    const poker_eval::RangeCombinations combos = poker_eval::expand_range(range_text);

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << combos.fraction() * 100.0;
    std::cout << "Range percent: " << ss.str() << "%\n";

    spdlog::debug("{} combinaisons ({} offsuit, {} suited, {} paires) sur {}",
                  combos.combination_count(), combos.offsuit().size(),
                  combos.suited().size(), combos.paired().size(),
                  poker_eval::HAND_COMBINATIONS);
    return 0;
}

int run_hand(const std::vector<std::string>& codes)
{
    if (codes.size() < 5 || codes.size() > 7) {
        std::cerr << "Error: --hand expects 5 to 7 card codes, got " << codes.size() << '\n';
        return 1;
    }
    const poker_eval::Hand hand = poker_eval::Hand::from_strings(codes);
    const poker_eval::HandRank rank = poker_eval::rank(hand);

    spdlog::debug("Main {} -> catégorie {}, valeur {}", hand.to_string(),
                  static_cast<int>(rank.category), rank.value);
    std::cout << hand.to_string() << " => " << poker_eval::hand_rank_to_string(rank) << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Arguments & logging
    // ─────────────────────────────────────────────────────────────
    bool verbose = false;
    bool hand_mode = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--hand") {
            hand_mode = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    // Les logs vont sur stderr, le résultat seul sur stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("range_calc"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    try
    {
        if (hand_mode) {
            return run_hand(args);
        }

        std::string range_text;
        if (args.empty()) {
            if (!std::getline(std::cin, range_text)) {
                print_usage(argv[0]);
                return 1;
            }
        } else {
            // "88+," "AJo+" passés séparément par le shell -> une seule range
            for (size_t i = 0; i < args.size(); ++i) {
                if (i > 0) range_text += ' ';
                range_text += args[i];
            }
        }
        return run_range(range_text);
    }
    catch (const poker_eval::PokerError& e)
    {
        spdlog::error("Entrée invalide : {}", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
