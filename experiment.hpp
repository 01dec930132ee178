/* One strategy, in this process, with a log of every turn: how many candidates were left
   after it and how many bits of uncertainty that is. For developing a strategy, not for
   ranking it (nothing is isolated, a crash here takes the whole run down).
*/

#pragma once
#include <string>
#include <vector>
#include <iostream>
#include <cstdint>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <json/json.h>
#include "lexicon.hpp"
#include "strategy.hpp"
#include "game.hpp"

namespace Experiment {
    struct Config {
        Config();
        int num_games;
        uint64_t seed;
        int max_guesses;
        bool allow_non_words;
        boost::posix_time::time_duration game_timeout;
    };

    struct Step {
        Word guess;
        Feedback feedback;
        int remaining;       // candidates still consistent after this turn
        double entropy_bits; // log2(remaining), 0 once one is left
    };

    struct Game_log {
        int game;
        Game::GameResult result;
        std::vector<Step> steps;
    };

    double entropy_bits(size_t remaining);

    // [verbose] gets a line per turn when not null
    std::vector<Game_log> run(Strategy::Strategy_intf& strategy, const Lexicon& lex, const Config& config,
                              std::ostream* verbose = nullptr);

    void print_summary(std::ostream& os, const std::vector<Game_log>& logs, const std::string& strategy);

    Json::Value to_json(const std::vector<Game_log>& logs, const std::string& strategy, const Lexicon& lex,
                        const Config& config);

    void test();
}
