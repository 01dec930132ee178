#include <sstream>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <random>
#include <thread>
#include <cmath>
#include <csignal>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include "tournament.hpp"
#include "strategies.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
using boost::posix_time::second_clock;
using boost::posix_time::milliseconds;
using boost::posix_time::time_duration;
using Game::GameResult;

namespace Tournament {
    bool silence = false;

    // mean guesses closer than this count as a tie
    static const double tie_tolerance = 1e-9;

    static ptime now() {
        return microsec_clock::universal_time();
    }

    const vector<Round_spec>& canonical_rounds() {
        static const vector<Round_spec> rounds = {
            {4, Mode::uniform}, {4, Mode::frequency},
            {5, Mode::uniform}, {5, Mode::frequency},
            {6, Mode::uniform}, {6, Mode::frequency} };
        return rounds;
    }

    Config::Config() :
        master_seed(42), num_games(0), repetitions(1), shock(0), rounds(1, Round_spec{5, Mode::uniform}), data_dir("data"),
        max_guesses(6), allow_non_words(true), workers(std::max(1, std::min(4, (int)std::thread::hardware_concurrency()))),
        game_timeout(boost::posix_time::seconds(5)), memory_mb(2048) {}

    Strategy_stats::Strategy_stats() :
        games_played(0), games_solved(0), solve_rate(0), mean_guesses(0), median_guesses(0), max_guesses(0),
        timed_out(0), faulted(0) {}

    Round_result::Round_result() : word_length(0), mode(Mode::uniform), repetition(1), seed(0), num_games(0), complete(true) {}

    Leaderboard_entry::Leaderboard_entry() : rank(0), total_points(0), overall_solve_rate(0), overall_mean_guesses(0) {}

    //////////////////
    // Scoring

    vector<Strategy_stats> compute_round_summary(const vector<GameResult>& games) {
        vector<string> order;
        std::map<string, vector<const GameResult*>> by_strategy;
        for (const GameResult& g : games) {
            if (by_strategy.find(g.strategy) == by_strategy.end()) order.push_back(g.strategy);
            by_strategy[g.strategy].push_back(&g);
        }

        vector<Strategy_stats> rv;
        for (const string& name : order) {
            const vector<const GameResult*>& results = by_strategy[name];
            Strategy_stats s;
            s.name = name;
            s.games_played = results.size();
            vector<int> guesses;
            for (const GameResult* g : results) {
                guesses.push_back(g->num_guesses);
                if (g->solved()) {
                    s.games_solved++;
                    s.guess_distribution[boost::lexical_cast<string>(g->num_guesses)]++;
                } else {
                    s.guess_distribution["failed"]++;
                }
                if (g->outcome == Outcome::timed_out) s.timed_out++;
                if (g->outcome == Outcome::faulted) s.faulted++;
            }
            std::sort(guesses.begin(), guesses.end());
            size_t n = guesses.size();
            double sum = 0;
            for (int g : guesses) sum += g;
            s.solve_rate = (double)s.games_solved / n;
            s.mean_guesses = sum / n;
            s.median_guesses = n % 2 == 1 ? guesses[n / 2] : (guesses[n / 2 - 1] + guesses[n / 2]) / 2.0;
            s.max_guesses = guesses.back();
            rv.push_back(s);
        }
        return rv;
    }

    vector<Leaderboard_entry> compute_leaderboard(const vector<Round_result>& rounds) {
        vector<Leaderboard_entry> entries;
        std::map<string, size_t> index;
        std::map<string, vector<double>> rates;
        std::map<string, vector<double>> means;

        for (const Round_result& r : rounds) {
            if (!r.complete) continue;

            vector<const Strategy_stats*> ranked;
            for (const Strategy_stats& s : r.strategies) ranked.push_back(&s);
            std::stable_sort(ranked.begin(), ranked.end(), [] (const Strategy_stats* a, const Strategy_stats* b) {
                    return a->mean_guesses < b->mean_guesses;
                });

            // places i..j-1 are tied and share the mean of n-i .. n-j+1 points
            size_t n = ranked.size();
            size_t i = 0;
            while (i < n) {
                size_t j = i;
                while (j < n && std::fabs(ranked[j]->mean_guesses - ranked[i]->mean_guesses) <= tie_tolerance) j++;
                double points = 0;
                for (size_t k = i; k < j; k++) points += n - k;
                points /= (j - i);
                for (size_t k = i; k < j; k++) {
                    const string& name = ranked[k]->name;
                    if (index.find(name) == index.end()) {
                        index[name] = entries.size();
                        entries.push_back(Leaderboard_entry());
                        entries.back().strategy = name;
                    }
                    Leaderboard_entry& e = entries[index[name]];
                    e.total_points += points;
                    e.round_points.push_back(std::make_pair(r.round_id, points));
                }
                i = j;
            }

            for (const Strategy_stats& s : r.strategies) {
                rates[s.name].push_back(s.solve_rate);
                means[s.name].push_back(s.mean_guesses);
            }
        }

        for (Leaderboard_entry& e : entries) {
            const vector<double>& r = rates[e.strategy];
            const vector<double>& m = means[e.strategy];
            double rsum = 0, msum = 0;
            for (double x : r) rsum += x;
            for (double x : m) msum += x;
            e.overall_solve_rate = r.empty() ? 0 : rsum / r.size();
            e.overall_mean_guesses = m.empty() ? 0 : msum / m.size();
        }

        std::sort(entries.begin(), entries.end(), [] (const Leaderboard_entry& a, const Leaderboard_entry& b) {
                if (std::fabs(a.total_points - b.total_points) > tie_tolerance) return a.total_points > b.total_points;
                return a.strategy < b.strategy;
            });
        for (size_t i = 0; i < entries.size(); i++) {
            if (i > 0 && std::fabs(entries[i].total_points - entries[i - 1].total_points) <= tie_tolerance) {
                entries[i].rank = entries[i - 1].rank;
            } else {
                entries[i].rank = i + 1;
            }
        }
        return entries;
    }

    //////////////////
    // Playing

    vector<Word> sample_secrets(const vector<Word>& vocabulary, int num_games, uint64_t seed) {
        vector<Word> pool(vocabulary);
        if (num_games <= 0 || (size_t)num_games >= pool.size()) return pool;
        std::mt19937_64 rng(seed);
        for (int i = 0; i < num_games; i++) {
            std::uniform_int_distribution<size_t> pick(i, pool.size() - 1);
            std::swap(pool[i], pool[pick(rng)]);
        }
        pool.resize(num_games);
        return pool;
    }

    static string round_id(const Round_spec& spec, int repetition, int repetitions) {
        string id = boost::lexical_cast<string>(spec.word_length) + "_" + to_string(spec.mode);
        if (repetitions > 1) id += "_r" + boost::lexical_cast<string>(repetition);
        return id;
    }

    static bool starts_with(const string& s, const string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    // Turns what a unit sent back into the episode's result. A unit that never got to send
    // its result keeps the guesses it streamed, and gets the penalty.
    static GameResult collect(const Isolation::Job_result& jr, const string& strategy, const Word& secret, int max_guesses) {
        GameResult rv;
        rv.strategy = strategy;
        rv.secret = secret;
        rv.num_guesses = max_guesses + 1;
        rv.elapsed_microseconds = jr.elapsed_microseconds;

        try {
            for (const string& line : jr.messages) {
                if (starts_with(line, "result ")) {
                    GameResult r = GameResult::of_string(line.substr(7));
                    r.strategy = strategy;
                    return r;
                }
                if (starts_with(line, "turn ")) {
                    rv.guesses.push_back(Word(line.substr(5, line.find(' ', 5) - 5)));
                }
            }
        } catch (const std::exception& e) {
            rv.outcome = Outcome::faulted;
            rv.reason = string("unreadable result from unit: ") + e.what();
            return rv;
        }

        if (jr.state == Isolation::State::killed) {
            rv.outcome = Outcome::timed_out;
            rv.reason = "no result within the time budget, unit killed";
        } else if (jr.state == Isolation::State::crashed) {
            rv.outcome = Outcome::faulted;
            rv.reason = "unit " + jr.exit_description;
        } else {
            rv.outcome = Outcome::faulted;
            rv.reason = "unit finished without a result";
        }
        return rv;
    }

    Round_result play_round(const Lexicon& lex,
                            const vector<Strategy::Entry>& entries,
                            const Round_spec& spec,
                            int repetition,
                            uint64_t seed,
                            const Config& config,
                            Isolation::Pool& pool) {
        Round_result rv;
        rv.round_id = round_id(spec, repetition, config.repetitions);
        rv.word_length = spec.word_length;
        rv.mode = spec.mode;
        rv.repetition = repetition;
        rv.seed = seed;

        vector<Word> secrets = sample_secrets(lex.words(), config.num_games, seed);
        rv.num_games = secrets.size();
        Strategy::GameConfig gc = Strategy::GameConfig::of_lexicon(lex, config.max_guesses, config.allow_non_words);
        boost::posix_time::time_duration budget = config.game_timeout;

        // a separate stream from the secret sampling
        std::mt19937_64 agent_seeds(seed ^ 0x5bd1e9955bd1e995ULL);

        vector<Isolation::Job> jobs;
        vector<std::pair<size_t, size_t>> cells;
        for (size_t e = 0; e < entries.size(); e++) {
            for (size_t s = 0; s < secrets.size(); s++) {
                Strategy::Entry entry = entries[e];
                Word secret = secrets[s];
                uint64_t agent_seed = agent_seeds();
                Isolation::Job job;
                job.budget = budget;
                job.task = [entry, gc, secret, budget, agent_seed] (const Isolation::Send& send) {
                    // the result goes out before end_game, which may outlive the deadline
                    bool sent = false;
                    GameResult r;
                    try {
                        std::unique_ptr<Strategy::Strategy_intf> strategy = entry.factory(agent_seed);
                        Game::run_episode(*strategy, gc, secret, budget,
                            [&send] (const Strategy::Turn& t) {
                                send("turn " + t.guess.to_string() + " " + t.feedback.to_string());
                            },
                            [&send, &sent, &entry] (const GameResult& f) {
                                GameResult named = f;
                                named.strategy = entry.name;
                                send("result " + named.to_string());
                                sent = true;
                            });
                    } catch (const std::exception& e) {
                        r.secret = secret;
                        r.num_guesses = gc.max_guesses + 1;
                        r.outcome = Outcome::faulted;
                        r.reason = string("could not start the episode: ") + e.what();
                    }
                    if (!sent) {
                        r.strategy = entry.name;
                        send("result " + r.to_string());
                    }
                };
                jobs.push_back(job);
                cells.push_back(std::make_pair(e, s));
            }
        }

        ptime start = now();
        if (!silence) {
            cerr << "Round " << rv.round_id << ": " << secrets.size() << " secrets x " << entries.size()
                 << " strategies, " << lex.words().size() << " words" << endl;
        }

        vector<Isolation::Job_result> results = pool.run(jobs);

        for (size_t i = 0; i < results.size(); i++) {
            if (results[i].state == Isolation::State::cancelled) {
                rv.complete = false;
                continue;
            }
            rv.games.push_back(collect(results[i], entries[cells[i].first].name, secrets[cells[i].second],
                                       config.max_guesses));
        }
        rv.strategies = compute_round_summary(rv.games);

        if (!silence) {
            cerr << "Round " << rv.round_id << (rv.complete ? " done" : " stopped") << ", " << rv.games.size()
                 << " games, took " << (now() - start).total_microseconds() / 1e6 << "s" << endl;
        }
        return rv;
    }

    Lexicon_source default_source(const Config& config) {
        string words_path = config.words_path;
        string data_dir = config.data_dir;
        return [words_path, data_dir] (int word_length, Mode mode) {
            if (!words_path.empty()) return Lexicon::load(words_path, word_length, mode);
            return Lexicon::load_default(data_dir, word_length, mode);
        };
    }

    Report run(const Config& config) {
        return run(config, Strategy::Registry::select(config.team), default_source(config));
    }

    Report run(const Config& config, const vector<Strategy::Entry>& entries, const Lexicon_source& source) {
        if (entries.empty()) throw std::runtime_error("Tournament::run: no strategies to play");
        if (config.repetitions < 1) throw std::runtime_error("Tournament::run: repetitions must be at least 1");

        Report report;
        report.config = config;
        ptime started = second_clock::local_time();
        if (report.config.tournament_id.empty()) {
            string id = boost::posix_time::to_iso_string(started);
            std::replace(id.begin(), id.end(), 'T', '_');
            report.config.tournament_id = id;
        }
        report.timestamp = boost::posix_time::to_iso_extended_string(started);

        Isolation::Limits limits;
        limits.memory_mb = config.memory_mb;
        Isolation::Pool pool(config.workers, limits);

        ptime start = now();
        std::mt19937_64 rng(config.master_seed);
        bool stopped = false;
        for (int rep = 1; rep <= config.repetitions && !stopped; rep++) {
            for (const Round_spec& spec : config.rounds) {
                // drawn before anything can fail, so one bad round leaves the others' seeds alone
                uint64_t seed = rng();
                if (Isolation::Stop_flag::requested()) {
                    stopped = true;
                    break;
                }
                string id = round_id(spec, rep, config.repetitions);
                try {
                    Lexicon lex = source(spec.word_length, spec.mode);
                    if (config.shock > 0 && spec.mode == Mode::frequency) {
                        lex = lex.with_probabilities(Lexicon::perturb(lex.probabilities(), config.shock, seed));
                    }
                    report.rounds.push_back(play_round(lex, entries, spec, rep, seed, config, pool));
                } catch (const Lexicon::Configuration_error& e) {
                    if (!silence) cerr << "Round " << id << " aborted: " << e.what() << endl;
                    report.errors.push_back(id + ": " + e.what());
                }
            }
        }

        // a stop during the last round leaves no later round to notice it
        if (Isolation::Stop_flag::requested()) stopped = true;

        report.leaderboard = compute_leaderboard(report.rounds);
        if (!silence) {
            cerr << "Tournament " << report.config.tournament_id << (stopped ? " stopped" : " finished") << ", "
                 << report.rounds.size() << " rounds, took " << (now() - start).total_microseconds() / 1e6 << "s" << endl;
        }
        return report;
    }

    //////////////////
    // Output

    void print_round_summary(std::ostream& os, const Round_result& round) {
        vector<const Strategy_stats*> ranked;
        for (const Strategy_stats& s : round.strategies) ranked.push_back(&s);
        std::stable_sort(ranked.begin(), ranked.end(), [] (const Strategy_stats* a, const Strategy_stats* b) {
                return a->mean_guesses < b->mean_guesses;
            });

        os << endl << "Round " << round.round_id << " (" << round.word_length << " letters, " << round.mode << ", "
           << round.num_games << " secrets" << (round.complete ? "" : ", INCOMPLETE") << ")" << endl;
        os << std::left << std::setw(25) << "Strategy" << std::right
           << std::setw(7) << "Games" << std::setw(8) << "Solved" << std::setw(8) << "Rate"
           << std::setw(7) << "Mean" << std::setw(8) << "Median" << std::setw(5) << "Max"
           << std::setw(9) << "Timeout" << std::setw(8) << "Fault" << endl;
        os << string(85, '-') << endl;
        for (const Strategy_stats* s : ranked) {
            os << std::left << std::setw(25) << s->name << std::right << std::fixed
               << std::setw(7) << s->games_played << std::setw(8) << s->games_solved
               << std::setw(7) << std::setprecision(1) << s->solve_rate * 100 << "%"
               << std::setw(7) << std::setprecision(2) << s->mean_guesses
               << std::setw(8) << std::setprecision(1) << s->median_guesses
               << std::setw(5) << s->max_guesses << std::setw(9) << s->timed_out << std::setw(8) << s->faulted << endl;
        }
        os.unsetf(std::ios_base::floatfield);
    }

    void print_leaderboard(std::ostream& os, const vector<Leaderboard_entry>& entries) {
        os << endl << string(72, '=') << endl << "  LEADERBOARD" << endl << string(72, '=') << endl;
        os << "  " << std::left << std::setw(6) << "Rank" << std::setw(25) << "Strategy" << std::right
           << std::setw(8) << "Points" << std::setw(8) << "Solve%" << std::setw(8) << "MeanG" << endl;
        os << "  " << string(55, '-') << endl;
        for (const Leaderboard_entry& e : entries) {
            os << "  " << std::left << std::setw(6) << e.rank << std::setw(25) << e.strategy << std::right << std::fixed
               << std::setw(8) << std::setprecision(1) << e.total_points
               << std::setw(7) << std::setprecision(1) << e.overall_solve_rate * 100 << "%"
               << std::setw(8) << std::setprecision(2) << e.overall_mean_guesses << endl;
        }
        os.unsetf(std::ios_base::floatfield);
        os << endl;
    }

    static Json::Value stats_json(const Strategy_stats& s) {
        Json::Value v;
        v["name"] = s.name;
        v["games_played"] = s.games_played;
        v["games_solved"] = s.games_solved;
        v["solve_rate"] = s.solve_rate;
        v["mean_guesses"] = s.mean_guesses;
        v["median_guesses"] = s.median_guesses;
        v["max_guesses"] = s.max_guesses;
        v["timed_out"] = s.timed_out;
        v["faulted"] = s.faulted;
        Json::Value dist(Json::objectValue);
        for (const auto& d : s.guess_distribution) dist[d.first] = d.second;
        v["guess_distribution"] = dist;
        return v;
    }

    Json::Value to_json(const Report& report) {
        const Config& c = report.config;
        Json::Value root;
        root["tournament_id"] = c.tournament_id;
        root["name"] = c.name.empty() ? Json::Value() : Json::Value(c.name);
        root["timestamp"] = report.timestamp;

        Json::Value config;
        config["master_seed"] = static_cast<Json::UInt64>(c.master_seed);
        config["num_games"] = c.num_games > 0 ? Json::Value(c.num_games) : Json::Value();
        config["repetitions"] = c.repetitions;
        config["shock_scale"] = c.shock;
        config["game_timeout"] = c.game_timeout.total_microseconds() / 1e6;
        config["max_guesses"] = c.max_guesses;
        config["allow_non_words"] = c.allow_non_words;
        config["workers"] = c.workers;
        config["memory_mb"] = c.memory_mb;
        config["team"] = c.team.empty() ? Json::Value() : Json::Value(c.team);
        Json::Value rounds(Json::arrayValue);
        for (const Round_spec& r : c.rounds) {
            Json::Value rv;
            rv["word_length"] = r.word_length;
            rv["mode"] = to_string(r.mode);
            rounds.append(rv);
        }
        config["rounds"] = rounds;
        root["config"] = config;

        Json::Value played(Json::arrayValue);
        for (const Round_result& r : report.rounds) {
            Json::Value rv;
            rv["round_id"] = r.round_id;
            rv["word_length"] = r.word_length;
            rv["mode"] = to_string(r.mode);
            rv["repetition"] = r.repetition;
            rv["seed"] = static_cast<Json::UInt64>(r.seed);
            rv["num_games"] = r.num_games;
            rv["complete"] = r.complete;
            Json::Value strategies(Json::arrayValue);
            for (const Strategy_stats& s : r.strategies) strategies.append(stats_json(s));
            rv["strategies"] = strategies;
            played.append(rv);
        }
        root["rounds"] = played;

        Json::Value leaderboard(Json::arrayValue);
        for (const Leaderboard_entry& e : report.leaderboard) {
            Json::Value ev;
            ev["rank"] = e.rank;
            ev["strategy"] = e.strategy;
            ev["total_points"] = e.total_points;
            Json::Value points(Json::objectValue);
            for (const auto& p : e.round_points) points[p.first] = p.second;
            ev["round_points"] = points;
            ev["overall_solve_rate"] = e.overall_solve_rate;
            ev["overall_mean_guesses"] = e.overall_mean_guesses;
            leaderboard.append(ev);
        }
        root["leaderboard"] = leaderboard;

        Json::Value errors(Json::arrayValue);
        for (const string& e : report.errors) errors.append(e);
        root["errors"] = errors;
        return root;
    }

    void write_json(const Report& report, const string& path) {
        std::ofstream out(path);
        if (!out) throw std::runtime_error("Could not open " + path + " for writing");
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(to_json(report), &out);
        out << endl;
        if (!out) throw std::runtime_error("Error writing " + path);
    }

    void write_csv(const Report& report, const string& path) {
        std::ofstream out(path);
        if (!out) throw std::runtime_error("Could not open " + path + " for writing");
        out << "strategy,secret,num_guesses,solved,outcome" << endl;
        for (const Round_result& r : report.rounds) {
            for (const GameResult& g : r.games) {
                out << g.strategy << "," << g.secret << "," << g.num_guesses << "," << (g.solved() ? 1 : 0) << ","
                    << g.outcome << endl;
            }
        }
        if (!out) throw std::runtime_error("Error writing " + path);
    }

    //////////////////
    // tests

    namespace {
        // plays [words] in order, then repeats the last one, crashes or hangs.
        // slow_end repeats, but takes a second over end_game.
        class Scripted_strategy : public Strategy::Strategy_intf {
        public:
            enum Then { repeat, crash, hang, slow_end };
            Scripted_strategy(const string& name_, const vector<string>& words_, Then then_ = repeat) :
                name_str(name_), words(words_), then(then_) {}
            virtual const string& name() const { return name_str; }
            virtual void begin_game(const Strategy::GameConfig& config) {}
            virtual string guess(const Strategy::History& history) {
                if (history.size() < words.size()) return words[history.size()];
                if (then == crash) raise(SIGSEGV);
                if (then == hang) {
                    while (true) usleep(1000);
                }
                return words.back();
            }
            virtual void end_game(const Word& secret, bool solved, int num_guesses) {
                if (then == slow_end) usleep(1000000);
            }
        private:
            string name_str;
            vector<string> words;
            Then then;
        };

        Strategy::Entry scripted(const string& name, const vector<string>& words,
                                 Scripted_strategy::Then then = Scripted_strategy::repeat) {
            return Strategy::Entry{ name, false, [name, words, then] (uint64_t seed) {
                    return std::unique_ptr<Strategy::Strategy_intf>(new Scripted_strategy(name, words, then));
                } };
        }

        vector<GameResult> games(const string& strategy, const vector<int>& guesses) {
            vector<GameResult> rv;
            for (int g : guesses) {
                GameResult r;
                r.strategy = strategy;
                r.secret = Word("casa");
                r.num_guesses = g;
                r.outcome = g <= 6 ? Outcome::solved : Outcome::exhausted;
                rv.push_back(r);
            }
            return rv;
        }

        Round_result round_of(const string& id, const vector<std::pair<string, vector<int>>>& per_strategy) {
            Round_result r;
            r.round_id = id;
            for (const auto& p : per_strategy) {
                vector<GameResult> g = games(p.first, p.second);
                r.games.insert(r.games.end(), g.begin(), g.end());
            }
            r.strategies = compute_round_summary(r.games);
            return r;
        }

        string points_of(const vector<Leaderboard_entry>& board) {
            vector<Leaderboard_entry> by_name(board);
            std::sort(by_name.begin(), by_name.end(), [] (const Leaderboard_entry& a, const Leaderboard_entry& b) {
                    return a.strategy < b.strategy;
                });
            std::stringstream ss;
            for (const Leaderboard_entry& e : by_name) ss << e.strategy << "=" << e.total_points << " ";
            return ss.str();
        }
    }

    static void test_scoring() {
        std::stringstream output;
        std::stringstream expected;

        vector<Strategy_stats> stats = compute_round_summary(games("A", {3, 4, 7, 2}));
        const Strategy_stats& a = stats[0];
        output << a.games_played << " " << a.games_solved << " " << a.solve_rate << " " << a.mean_guesses << " "
               << a.median_guesses << " " << a.max_guesses << " " << a.guess_distribution.at("failed") << " "
               << a.guess_distribution.at("3") << std::endl;
        expected << "4 3 0.75 4 3.5 7 1 1" << std::endl;

        // no ties: exactly 1..N
        vector<Round_result> rounds = { round_of("4_uniform", {{"A", {3}}, {"B", {4}}, {"C", {5}}, {"D", {6}}}) };
        output << points_of(compute_leaderboard(rounds)) << std::endl;
        expected << "A=4 B=3 C=2 D=1 " << std::endl;

        // everyone tied: (N+1)/2
        rounds = { round_of("4_uniform", {{"A", {4, 5}}, {"B", {5, 4}}, {"C", {3, 6}}, {"D", {7, 2}}}) };
        output << points_of(compute_leaderboard(rounds)) << std::endl;
        expected << "A=2.5 B=2.5 C=2.5 D=2.5 " << std::endl;

        // tied for 1st/2nd of 4
        rounds = { round_of("4_uniform", {{"A", {3}}, {"B", {3}}, {"C", {4}}, {"D", {7}}}) };
        output << points_of(compute_leaderboard(rounds)) << std::endl;
        expected << "A=3.5 B=3.5 C=2 D=1 " << std::endl;

        // an incomplete round doesn't count
        Round_result cut = round_of("5_uniform", {{"A", {7}}, {"B", {1}}, {"C", {1}}, {"D", {1}}});
        cut.complete = false;
        rounds.push_back(cut);
        vector<Leaderboard_entry> board = compute_leaderboard(rounds);
        output << points_of(board) << board[0].round_points.size() << std::endl;
        expected << "A=3.5 B=3.5 C=2 D=1 1" << std::endl;

        // equal totals share a rank, the next one skips
        output << board[0].rank << board[0].strategy << " " << board[1].rank << board[1].strategy << " "
               << board[2].rank << board[2].strategy << std::endl;
        expected << "1A 1B 3C" << std::endl;

        // points add up over rounds, overall numbers average the rounds
        rounds = { round_of("4_uniform", {{"A", {2}}, {"B", {3}}}), round_of("5_uniform", {{"A", {7}}, {"B", {3}}}) };
        board = compute_leaderboard(rounds);
        output << points_of(board) << board[0].rank << board[0].strategy << " " << board[1].overall_solve_rate << " "
               << board[1].overall_mean_guesses << std::endl;
        expected << "A=3 B=3 1A 1 3" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Tournament::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        vector<Word> vocab = { Word("casa"), Word("cosa"), Word("masa"), Word("mesa"), Word("pasa"), Word("peso") };
        vector<Word> s1 = sample_secrets(vocab, 3, 99);
        vector<Word> s2 = sample_secrets(vocab, 3, 99);
        vector<Word> sorted_s1(s1);
        std::sort(sorted_s1.begin(), sorted_s1.end());
        if (s1 != s2 || std::unique(sorted_s1.begin(), sorted_s1.end()) != sorted_s1.end()
            || sample_secrets(vocab, 0, 99).size() != vocab.size() || sample_secrets(vocab, 10, 99).size() != vocab.size()) {
            throw std::runtime_error("Tournament::test() 2 failed, bad secret sample");
        }
    }

    // one real round through forked units: an oracle, Random, and three agents that each
    // fail differently
    static void test_round() {
        vector<std::pair<string, int64_t>> counts =
            { {"casa", 1}, {"cosa", 1}, {"masa", 1}, {"mesa", 1}, {"pasa", 1}, {"peso", 1},
              {"rosa", 1}, {"sopa", 1}, {"taza", 1}, {"vaso", 1}, {"gato", 1}, {"pato", 1} };
        Lexicon_source source = [counts] (int word_length, Mode mode) {
            if (word_length != 4) throw Lexicon::Configuration_error("no words of length " + boost::lexical_cast<string>(word_length));
            return Lexicon::from_counts(counts, word_length, mode);
        };

        Config config;
        config.master_seed = 7;
        config.num_games = 1;
        config.rounds = { {4, Mode::uniform}, {7, Mode::uniform} };
        config.workers = 3;
        config.game_timeout = milliseconds(300);
        config.memory_mb = 512;
        config.allow_non_words = false;

        // the round seed and secret run() is going to use
        Lexicon lex = source(4, Mode::uniform);
        uint64_t round_seed = std::mt19937_64(config.master_seed)();
        Word secret = sample_secrets(lex.words(), 1, round_seed)[0];
        string other = secret == Word("casa") ? "cosa" : "casa";

        Strategy::register_builtin_strategies();
        vector<Strategy::Entry> entries = {
            scripted("Oracle", {secret.to_string()}),
            Strategy::Registry::find("Random"),
            scripted("Invalid", {"xyz"}),
            scripted("Crasher", {}, Scripted_strategy::crash),
            scripted("Sleeper", {other}, Scripted_strategy::hang) };

        bool old_silence = silence;
        silence = true;
        Report report = run(config, entries, source);
        silence = old_silence;

        if (report.rounds.size() != 1 || report.errors.size() != 1 || !report.rounds[0].complete
            || report.rounds[0].games.size() != 5) {
            throw std::runtime_error("Tournament::test() 3 failed, " + boost::lexical_cast<string>(report.rounds.size())
                                     + " rounds and " + boost::lexical_cast<string>(report.errors.size()) + " errors");
        }

        std::stringstream output;
        std::stringstream expected;
        for (const GameResult& g : report.rounds[0].games) {
            if (g.strategy == "Random") {
                output << g.strategy << " " << (g.secret == secret) << (g.num_guesses <= 7) << std::endl;
            } else {
                output << g.strategy << " " << g.outcome << " " << g.num_guesses << " " << g.guesses.size() << std::endl;
            }
        }
        expected << "Oracle solved 1 1" << std::endl
                 << "Random 11" << std::endl
                 << "Invalid faulted 7 0" << std::endl
                 << "Crasher faulted 7 0" << std::endl
                 << "Sleeper timed_out 7 1" << std::endl;

        double total = 0;
        std::map<string, double> points;
        for (const Leaderboard_entry& e : report.leaderboard) {
            total += e.total_points;
            points[e.strategy] = e.total_points;
        }
        output << report.leaderboard[0].strategy << " " << points["Oracle"] << " " << total << " "
               << (points["Invalid"] == points["Crasher"] && points["Crasher"] == points["Sleeper"]) << std::endl;
        expected << "Oracle 5 15 1" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Tournament::test() 4 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        Json::Value j = to_json(report);
        if (j["leaderboard"].size() != 5 || j["rounds"][0]["strategies"].size() != 5 || j["errors"].size() != 1
            || j["config"]["master_seed"].asUInt64() != 7) {
            throw std::runtime_error("Tournament::test() 5 failed, bad json report");
        }
    }

    static Lexicon_source four_letter_source() {
        return [] (int word_length, Mode mode) {
            return Lexicon::from_counts({{"casa", 1}, {"cosa", 1}, {"masa", 1}, {"mesa", 1}, {"pasa", 1}, {"peso", 1}},
                                        word_length, mode);
        };
    }

    // a slow end_game runs past the deadline, but the game was already over
    static void test_slow_end_game() {
        Lexicon_source source = four_letter_source();
        Config config;
        config.master_seed = 11;
        config.num_games = 1;
        config.rounds = { {4, Mode::uniform} };
        config.workers = 2;
        config.game_timeout = milliseconds(300);
        config.max_guesses = 2;

        uint64_t round_seed = std::mt19937_64(config.master_seed)();
        Word secret = sample_secrets(source(4, Mode::uniform).words(), 1, round_seed)[0];
        string other = secret == Word("casa") ? "cosa" : "casa";

        vector<Strategy::Entry> entries = {
            scripted("SlowSolver", {secret.to_string()}, Scripted_strategy::slow_end),
            scripted("SlowLoser", {other}, Scripted_strategy::slow_end) };

        bool old_silence = silence;
        silence = true;
        Report report = run(config, entries, source);
        silence = old_silence;

        std::stringstream output;
        std::stringstream expected;
        for (const GameResult& g : report.rounds.at(0).games) {
            output << g.strategy << " " << g.outcome << " " << g.num_guesses << " " << g.guesses.size() << std::endl;
        }
        expected << "SlowSolver solved 1 1" << std::endl
                 << "SlowLoser exhausted 3 2" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Tournament::test() 6 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    // a stop in the middle of the first round kills its units and starts nothing else
    static void test_stop() {
        Config config;
        config.num_games = 2;
        config.rounds = { {4, Mode::uniform}, {4, Mode::frequency} };
        config.workers = 2;
        config.game_timeout = boost::posix_time::seconds(5);

        vector<Strategy::Entry> entries = { scripted("Sleeper", {}, Scripted_strategy::hang) };

        Isolation::Stop_flag::reset();
        std::thread timer([] {
                usleep(500000);
                Isolation::Stop_flag::request();
            });
        bool old_silence = silence;
        silence = true;
        ptime start = now();
        Report report = run(config, entries, four_letter_source());
        time_duration took = now() - start;
        silence = old_silence;
        timer.join();
        Isolation::Stop_flag::reset();

        std::stringstream output;
        std::stringstream expected;
        output << report.rounds.size() << " " << report.rounds.at(0).complete << " " << report.rounds[0].games.size()
               << " " << report.leaderboard.size() << " " << (took < boost::posix_time::seconds(3)) << std::endl;
        expected << "1 0 0 0 1" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Tournament::test() 7 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    void test() {
        test_scoring();
        test_round();
        test_slow_end_game();
        test_stop();
    }
}
