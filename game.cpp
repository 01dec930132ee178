#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "game.hpp"

using std::string;
using std::vector;
using std::stringstream;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::posix_time::microsec_clock;
using Strategy::GameConfig;
using Strategy::History;
using Strategy::Turn;

static const char* outcome_names[] = { "solved", "exhausted", "faulted", "timed_out" };

Outcome outcome_of_string(const string& str) {
    for (int i = 0; i < 4; i++) {
        if (str == outcome_names[i]) return static_cast<Outcome>(i);
    }
    throw std::runtime_error("outcome_of_string: " + str);
}

std::ostream& operator<<(std::ostream& os, Outcome o) {
    return os << outcome_names[static_cast<int>(o)];
}

namespace Game {
    GameResult::GameResult() : num_guesses(0), outcome(Outcome::faulted), elapsed_microseconds(0) {}

    std::ostream& operator<<(std::ostream& os, const GameResult& g) {
        os << g.strategy << "," << g.secret << "," << g.outcome << "," << g.num_guesses << ","
           << g.elapsed_microseconds << ",";
        for (size_t i = 0; i < g.guesses.size(); i++) {
            if (i) os << " ";
            os << g.guesses[i];
        }
        os << ",";
        for (char c : g.reason) {
            os << ((c == '\n' || c == '\r') ? ' ' : c);
        }
        return os;
    }

    string GameResult::to_string() const {
        stringstream ss;
        ss << *this;
        return ss.str();
    }

    GameResult GameResult::of_string(const string& r) {
        GameResult t;
        stringstream ss(r);
        string g;
        std::getline(ss, t.strategy, ',');
        std::getline(ss, g, ',');
        t.secret = Word(g);
        std::getline(ss, g, ',');
        t.outcome = outcome_of_string(g);
        std::getline(ss, g, ',');
        t.num_guesses = boost::lexical_cast<int>(g);
        std::getline(ss, g, ',');
        t.elapsed_microseconds = boost::lexical_cast<int64_t>(g);
        std::getline(ss, g, ',');
        stringstream guesses(g);
        string w;
        while (guesses >> w) t.guesses.push_back(Word(w));
        std::getline(ss, t.reason);
        return t;
    }

    void GameResult::test() {
        GameResult s;
        s.strategy = "Entropy";
        s.secret = Word("canto");
        s.guesses = { Word("arcos"), Word("santo"), Word("canto") };
        s.num_guesses = 3;
        s.outcome = Outcome::solved;
        s.elapsed_microseconds = 1234;

        std::stringstream output1;
        std::stringstream expected;
        output1 << s << std::endl
                << of_string(s.to_string()) << std::endl;

        s.guesses.clear();
        s.num_guesses = 7;
        s.outcome = Outcome::faulted;
        s.reason = "invalid guess 'x', expected\n5 letters";
        output1 << s << std::endl
                << of_string(s.to_string()) << std::endl;

        expected << "Entropy,canto,solved,3,1234,arcos santo canto," << std::endl
                 << "Entropy,canto,solved,3,1234,arcos santo canto," << std::endl
                 << "Entropy,canto,faulted,7,1234,,invalid guess 'x', expected 5 letters" << std::endl
                 << "Entropy,canto,faulted,7,1234,,invalid guess 'x', expected 5 letters" << std::endl;

        string output1_str = output1.str();
        string expected_str = expected.str();
        if (output1_str != expected_str) {
            throw std::runtime_error("GameResult::test() failed, got " + output1_str + ", but expected " + expected_str);
        }
    }

    static ptime now() {
        return microsec_clock::universal_time();
    }

    string validate_guess(const string& guess, const GameConfig& config) {
        if (!Word::is_valid(guess, config.word_length)) {
            return "invalid guess '" + guess + "', expected " + boost::lexical_cast<string>(config.word_length)
                + " letters a-z";
        }
        if (!config.allow_non_words
            && !std::binary_search(config.vocabulary->begin(), config.vocabulary->end(), Word(guess))) {
            return "guess '" + guess + "' is not in the vocabulary";
        }
        return "";
    }

    GameResult run_episode(Strategy::Strategy_intf& strategy,
                           const GameConfig& config,
                           const Word& secret,
                           time_duration budget,
                           std::function<void(const Turn&)> on_turn,
                           std::function<void(const GameResult&)> on_finished) {
        if (!std::binary_search(config.vocabulary->begin(), config.vocabulary->end(), secret)) {
            throw std::runtime_error("secret " + secret.to_string() + " is not in the vocabulary");
        }

        GameResult rv;
        rv.strategy = strategy.name();
        rv.secret = secret;
        rv.num_guesses = config.max_guesses + 1;

        ptime start = now();
        ptime deadline = start + budget;
        History history;

        try {
            strategy.begin_game(config);
            if (now() > deadline) {
                rv.outcome = Outcome::timed_out;
                rv.reason = "time budget exceeded in begin_game";
            } else {
                while (true) {
                    string g = strategy.guess(history);
                    if (now() > deadline) {
                        rv.outcome = Outcome::timed_out;
                        rv.reason = "time budget exceeded on guess " + boost::lexical_cast<string>(history.size() + 1);
                        break;
                    }
                    string problem = validate_guess(g, config);
                    if (!problem.empty()) {
                        rv.outcome = Outcome::faulted;
                        rv.reason = problem;
                        break;
                    }

                    Word w(g);
                    Turn t = { w, Feedback::score(w, secret) };
                    history.push_back(t);
                    rv.guesses.push_back(w);
                    if (on_turn) on_turn(t);

                    if (t.feedback.is_solved()) {
                        rv.outcome = Outcome::solved;
                        rv.num_guesses = history.size();
                        break;
                    }
                    if ((int)history.size() >= config.max_guesses) {
                        rv.outcome = Outcome::exhausted;
                        break;
                    }
                }
            }
        } catch (const std::exception& e) {
            rv.outcome = Outcome::faulted;
            rv.num_guesses = config.max_guesses + 1;
            rv.reason = string("strategy raised: ") + e.what();
        } catch (...) {
            rv.outcome = Outcome::faulted;
            rv.num_guesses = config.max_guesses + 1;
            rv.reason = "strategy raised a non-standard exception";
        }

        rv.elapsed_microseconds = (now() - start).total_microseconds();
        if (on_finished) on_finished(rv);

        // the result is final by now, end_game can neither change it nor spend its budget
        if (rv.outcome == Outcome::solved || rv.outcome == Outcome::exhausted) {
            try {
                strategy.end_game(secret, rv.solved(), history.size());
            } catch (const std::exception& e) {
                std::cerr << "warning: " << rv.strategy << " end_game raised: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "warning: " << rv.strategy << " end_game raised a non-standard exception" << std::endl;
            }
        }
        return rv;
    }

    namespace {
        // plays a fixed list of guesses, repeating the last one, optionally spinning
        // for a while before answering
        class Script_strategy : public Strategy::Strategy_intf {
        public:
            Script_strategy(const vector<string>& guesses_, int busy_ms_ = 0, bool throw_in_begin_ = false) :
                ended(0), name_str("Script"), guesses(guesses_), busy_ms(busy_ms_), throw_in_begin(throw_in_begin_), next(0) {}
            virtual const string& name() const { return name_str; }
            virtual void begin_game(const GameConfig& config) {
                if (throw_in_begin) throw std::runtime_error("boom");
                next = 0;
            }
            virtual string guess(const History& history) {
                ptime until = now() + boost::posix_time::milliseconds(busy_ms);
                volatile uint64_t spin = 0;
                while (now() < until) spin++;
                string g = guesses[std::min(next, guesses.size() - 1)];
                next++;
                return g;
            }
            virtual void end_game(const Word& secret, bool solved, int num_guesses) { ended++; }

            int ended;
        private:
            string name_str;
            vector<string> guesses;
            int busy_ms;
            bool throw_in_begin;
            size_t next;
        };

        // guesses [answer] straight away, then fails in whichever hook [fail_in] names
        class Unruly_strategy : public Strategy::Strategy_intf {
        public:
            Unruly_strategy(const string& answer_, const string& fail_in_) :
                name_str("Unruly"), answer(answer_), fail_in(fail_in_) {}
            virtual const string& name() const { return name_str; }
            virtual void begin_game(const GameConfig& config) {}
            virtual string guess(const History& history) {
                if (fail_in == "guess") throw 42;
                return answer;
            }
            virtual void end_game(const Word& secret, bool solved, int num_guesses) {
                if (fail_in == "end_game") throw std::runtime_error("end_game boom");
                if (fail_in == "end_game_int") throw 42;
            }
        private:
            string name_str;
            string answer;
            string fail_in;
        };
    }

    void test() {
        Lexicon lex = Lexicon::from_counts({{"casa", 1}, {"cosa", 1}, {"masa", 1}, {"mesa", 1}, {"pasa", 1}, {"peso", 1}},
                                           4, Mode::uniform);
        GameConfig open = GameConfig::of_lexicon(lex, 6, true);
        GameConfig closed = GameConfig::of_lexicon(lex, 6, false);
        time_duration budget = boost::posix_time::seconds(5);
        Word secret("casa");

        std::stringstream output;
        std::stringstream expected;

        int turns_seen = 0;
        Script_strategy solver({"mesa", "casa"});
        GameResult r = run_episode(solver, open, secret, budget, [&] (const Turn& t) { turns_seen++; });
        output << r.outcome << " " << r.num_guesses << " " << r.guesses.size() << " " << turns_seen << " " << solver.ended << std::endl;
        expected << "solved 2 2 2 1" << std::endl;

        Script_strategy loser({"mesa", "masa", "pasa", "cosa", "peso"});
        r = run_episode(loser, open, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.guesses.size() << " " << loser.ended << std::endl;
        expected << "exhausted 7 6 1" << std::endl;

        Script_strategy short_word({"mesa", "cas"});
        r = run_episode(short_word, open, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.guesses.size() << " " << r.reason << std::endl;
        expected << "faulted 7 1 invalid guess 'cas', expected 4 letters a-z" << std::endl;

        Script_strategy non_word({"ZZZZ"});
        r = run_episode(non_word, closed, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.reason << std::endl;
        expected << "faulted 7 guess 'ZZZZ' is not in the vocabulary" << std::endl;
        r = run_episode(non_word, open, secret, budget);
        output << r.outcome << " " << r.guesses[0] << std::endl;
        expected << "exhausted zzzz" << std::endl;

        Script_strategy thrower({"casa"}, 0, true);
        r = run_episode(thrower, open, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.reason << " " << thrower.ended << std::endl;
        expected << "faulted 7 strategy raised: boom 0" << std::endl;

        // end_game comes after the result is final
        Unruly_strategy bad_end("casa", "end_game");
        int finished_seen = 0;
        r = run_episode(bad_end, open, secret, budget, nullptr, [&] (const GameResult& f) {
                finished_seen++;
                output << "finished " << f.outcome << " " << f.num_guesses << std::endl;
            });
        output << r.outcome << " " << r.num_guesses << " " << r.reason.empty() << " " << finished_seen << std::endl;
        expected << "finished solved 1" << std::endl << "solved 1 1 1" << std::endl;

        Unruly_strategy bad_end_int("mesa", "end_game_int");
        r = run_episode(bad_end_int, open, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.guesses.size() << std::endl;
        expected << "exhausted 7 6" << std::endl;

        Unruly_strategy int_thrower("casa", "guess");
        r = run_episode(int_thrower, open, secret, budget);
        output << r.outcome << " " << r.num_guesses << " " << r.reason << std::endl;
        expected << "faulted 7 strategy raised a non-standard exception" << std::endl;

        // right answer, but too late
        Script_strategy slow({"casa"}, 150);
        r = run_episode(slow, open, secret, boost::posix_time::milliseconds(50));
        output << r.outcome << " " << r.num_guesses << " " << r.guesses.size() << " " << (r.elapsed_microseconds >= 150000) << std::endl;
        expected << "timed_out 7 0 1" << std::endl;

        bool threw = false;
        try {
            run_episode(solver, open, Word("gato"), budget);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        output << threw << std::endl;
        expected << 1 << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Game::test() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }
}
