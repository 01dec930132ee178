/* Rounds, repetitions, scoring and the tournament report.

   A round is one (word length, mode) variant. For every repetition each round gets a seed
   from the master seed, samples its secrets with it, and plays one isolated episode per
   (strategy, secret) through an Isolation::Pool. Once every episode of the round is back
   the round is summarised; only then does anything shared get written.

   Scoring is per round: strategies sorted by mean guesses, the best of N gets N points and
   the worst 1, tied strategies share the mean of the points their places would have got.
   Points add up over every complete round of every repetition.
*/

#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <cstdint>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <json/json.h>
#include "lexicon.hpp"
#include "strategy.hpp"
#include "game.hpp"
#include "isolation.hpp"

namespace Tournament {
    struct Round_spec {
        int word_length;
        Mode mode;
    };

    // {4, 5, 6} x {uniform, frequency}
    const std::vector<Round_spec>& canonical_rounds();

    struct Config {
        Config();
        std::string name;
        std::string tournament_id; // filled in by run() when empty
        uint64_t master_seed;
        int num_games;             // secrets per round, 0 for the whole vocabulary
        int repetitions;
        double shock;              // perturbation of frequency rounds, 0 for none
        std::vector<Round_spec> rounds;
        std::string words_path;    // a corpus file, overrides data_dir
        std::string data_dir;
        int max_guesses;
        bool allow_non_words;
        int workers;
        boost::posix_time::time_duration game_timeout;
        int memory_mb;
        std::string team;
    };

    struct Strategy_stats {
        Strategy_stats();
        std::string name;
        int games_played;
        int games_solved;
        double solve_rate;
        double mean_guesses;
        double median_guesses;
        int max_guesses;
        int timed_out;
        int faulted;
        std::map<std::string, int> guess_distribution; // "1".."N" for solved games, "failed"
    };

    struct Round_result {
        Round_result();
        std::string round_id;
        int word_length;
        Mode mode;
        int repetition;
        uint64_t seed;
        int num_games;
        bool complete; // false if a stop request cut the round short
        std::vector<Game::GameResult> games;
        std::vector<Strategy_stats> strategies;
    };

    struct Leaderboard_entry {
        Leaderboard_entry();
        int rank;
        std::string strategy;
        double total_points;
        std::vector<std::pair<std::string, double>> round_points; // (round_id, points)
        double overall_solve_rate;   // mean of the per-round rates
        double overall_mean_guesses; // mean of the per-round means
    };

    struct Report {
        Config config;
        std::string timestamp;
        std::vector<Round_result> rounds;
        std::vector<Leaderboard_entry> leaderboard;
        std::vector<std::string> errors;
    };

    // Loads (or builds) the lexicon of a round, throws Lexicon::Configuration_error
    typedef std::function<Lexicon(int word_length, Mode mode)> Lexicon_source;

    // strategies in order of first appearance in [games]
    std::vector<Strategy_stats> compute_round_summary(const std::vector<Game::GameResult>& games);

    // incomplete rounds are skipped
    std::vector<Leaderboard_entry> compute_leaderboard(const std::vector<Round_result>& rounds);

    // [num_games] distinct words, or all of them if num_games is 0 or too big
    std::vector<Word> sample_secrets(const std::vector<Word>& vocabulary, int num_games, uint64_t seed);

    Round_result play_round
    (const Lexicon& lex,
     const std::vector<Strategy::Entry>& entries,
     const Round_spec& spec,
     int repetition,
     uint64_t seed,
     const Config& config,
     Isolation::Pool& pool);

    // every round of [config] x repetitions with the registry's strategies
    Report run(const Config& config);
    Report run(const Config& config, const std::vector<Strategy::Entry>& entries, const Lexicon_source& source);

    Lexicon_source default_source(const Config& config);

    void print_round_summary(std::ostream& os, const Round_result& round);
    void print_leaderboard(std::ostream& os, const std::vector<Leaderboard_entry>& entries);

    Json::Value to_json(const Report& report);
    void write_json(const Report& report, const std::string& path);
    void write_csv(const Report& report, const std::string& path);

    // mutes the progress lines on std::cerr
    extern bool silence;

    void test();
}
