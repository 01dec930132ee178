#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <boost/lexical_cast.hpp>
#include "experiment.hpp"
#include "filter.hpp"
#include "tournament.hpp"
#include "strategies.hpp"

using std::string;
using std::vector;
using std::endl;
using Strategy::Turn;

namespace Experiment {
    Config::Config() :
        num_games(10), seed(42), max_guesses(6), allow_non_words(true), game_timeout(boost::posix_time::seconds(5)) {}

    double entropy_bits(size_t remaining) {
        return remaining > 1 ? std::log2((double)remaining) : 0.0;
    }

    vector<Game_log> run(Strategy::Strategy_intf& strategy, const Lexicon& lex, const Config& config, std::ostream* verbose) {
        vector<Word> secrets = Tournament::sample_secrets(lex.words(), config.num_games, config.seed);
        Strategy::GameConfig gc = Strategy::GameConfig::of_lexicon(lex, config.max_guesses, config.allow_non_words);

        vector<Game_log> logs;
        for (size_t i = 0; i < secrets.size(); i++) {
            Game_log log;
            log.game = i + 1;
            vector<Word> candidates = lex.words();
            if (verbose) {
                *verbose << endl << "--- Game " << log.game << "/" << secrets.size() << " | Secret: " << secrets[i]
                         << " ---" << endl;
            }

            log.result = Game::run_episode(strategy, gc, secrets[i], config.game_timeout, [&] (const Turn& t) {
                    candidates = Filter::filter_candidates(candidates, t.guess, t.feedback);
                    Step s = { t.guess, t.feedback, (int)candidates.size(), entropy_bits(candidates.size()) };
                    log.steps.push_back(s);
                    if (verbose) {
                        *verbose << "  Guess " << log.steps.size() << ": " << t.guess << "  " << t.feedback.to_ansi(t.guess)
                                 << "  remaining=" << s.remaining << "  H=" << std::fixed << std::setprecision(2)
                                 << s.entropy_bits << " bits" << endl;
                        verbose->unsetf(std::ios_base::floatfield);
                    }
                });

            if (verbose) {
                if (log.result.solved()) {
                    *verbose << "  -> SOLVED in " << log.result.num_guesses << " guesses" << endl;
                } else {
                    *verbose << "  -> " << log.result.outcome << " after " << log.result.guesses.size() << " guesses";
                    if (!log.result.reason.empty()) *verbose << " (" << log.result.reason << ")";
                    *verbose << endl;
                }
            }
            logs.push_back(log);
        }
        return logs;
    }

    void print_summary(std::ostream& os, const vector<Game_log>& logs, const string& strategy) {
        if (logs.empty()) {
            os << endl << "=== " << strategy << ", no games ===" << endl;
            return;
        }
        vector<Game::GameResult> results;
        for (const Game_log& g : logs) results.push_back(g.result);
        Tournament::Strategy_stats s = Tournament::compute_round_summary(results)[0];

        os << endl << "=== " << strategy << ", " << s.games_played << " games ===" << endl << std::fixed
           << "  Solved: " << s.games_solved << "/" << s.games_played << " (" << std::setprecision(1)
           << s.solve_rate * 100 << "%)" << endl
           << "  Guesses: mean " << std::setprecision(2) << s.mean_guesses << ", median " << std::setprecision(1)
           << s.median_guesses << ", max " << s.max_guesses << endl;
        os.unsetf(std::ios_base::floatfield);
        if (s.timed_out || s.faulted) {
            os << "  Timed out: " << s.timed_out << ", faulted: " << s.faulted << endl;
        }
    }

    Json::Value to_json(const vector<Game_log>& logs, const string& strategy, const Lexicon& lex, const Config& config) {
        Json::Value root;
        root["strategy"] = strategy;
        root["word_length"] = lex.word_length();
        root["mode"] = to_string(lex.mode());
        root["vocabulary_size"] = static_cast<Json::UInt64>(lex.words().size());
        root["seed"] = static_cast<Json::UInt64>(config.seed);
        root["max_guesses"] = config.max_guesses;
        root["allow_non_words"] = config.allow_non_words;

        Json::Value games(Json::arrayValue);
        for (const Game_log& g : logs) {
            Json::Value gv;
            gv["game"] = g.game;
            gv["secret"] = g.result.secret.to_string();
            gv["solved"] = g.result.solved();
            gv["outcome"] = boost::lexical_cast<string>(g.result.outcome);
            gv["num_guesses"] = g.result.num_guesses;
            if (!g.result.reason.empty()) gv["reason"] = g.result.reason;
            Json::Value steps(Json::arrayValue);
            for (const Step& s : g.steps) {
                Json::Value sv;
                sv["guess"] = s.guess.to_string();
                sv["feedback"] = s.feedback.to_string();
                sv["remaining"] = s.remaining;
                sv["entropy_bits"] = s.entropy_bits;
                steps.append(sv);
            }
            gv["steps"] = steps;
            games.append(gv);
        }
        root["games"] = games;
        return root;
    }

    void test() {
        Lexicon lex = Lexicon::from_counts({{"gato", 1}, {"pato", 1}, {"rato", 1}, {"sapo", 1},
                                            {"mapa", 1}, {"capa", 1}, {"copa", 1}, {"ropa", 1}},
                                           4, Mode::uniform);
        Config config;
        config.num_games = 3;
        config.seed = 5;

        Strategy::Max_prob_strategy strategy;
        std::stringstream verbose;
        vector<Game_log> logs = run(strategy, lex, config, &verbose);

        std::stringstream output;
        std::stringstream expected;
        output << logs.size() << " " << entropy_bits(8) << " " << entropy_bits(1) << " " << entropy_bits(0) << endl;
        expected << "3 3 0 0" << endl;

        for (const Game_log& g : logs) {
            bool shrinking = true;
            int prev = lex.words().size();
            for (const Step& s : g.steps) {
                if (s.remaining > prev || s.remaining < 1) shrinking = false;
                prev = s.remaining;
            }
            output << g.result.solved() << (g.steps.size() == g.result.guesses.size()) << shrinking
                   << (g.steps.back().remaining == 1) << (g.steps.back().entropy_bits == 0) << " ";
            expected << "11111 ";
        }
        output << endl;
        expected << endl;

        Json::Value j = to_json(logs, strategy.name(), lex, config);
        output << j["games"].size() << " " << j["strategy"].asString() << " "
               << (verbose.str().find("--- Game 3/3") != string::npos) << endl;
        expected << "3 MaxProb 1" << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Experiment::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }
}
