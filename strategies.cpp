#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include "strategies.hpp"
#include "filter.hpp"

using std::string;
using std::vector;
using std::unique_ptr;

namespace Strategy {
    static const string random_name = "Random";
    static const string max_prob_name = "MaxProb";
    static const string entropy_name = "Entropy";

    //////////////////
    // Random

    Random_strategy::Random_strategy(uint64_t seed) : rng(seed) {}

    const string& Random_strategy::name() const { return random_name; }

    void Random_strategy::begin_game(const GameConfig& config) {
        vocabulary = config.vocabulary;
    }

    string Random_strategy::guess(const History& history) {
        vector<Word> candidates = Filter::apply_history(*vocabulary, history);
        if (candidates.empty()) return (*vocabulary)[0].to_string();
        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        return candidates[pick(rng)].to_string();
    }

    //////////////////
    // MaxProb

    const string& Max_prob_strategy::name() const { return max_prob_name; }

    void Max_prob_strategy::begin_game(const GameConfig& config) {
        const vector<Word>& words = *config.vocabulary;
        const vector<double>& probs = *config.probabilities;
        vector<size_t> order(words.size());
        for (size_t i = 0; i < order.size(); i++) order[i] = i;
        std::sort(order.begin(), order.end(), [&] (size_t a, size_t b) {
                if (probs[a] != probs[b]) return probs[a] > probs[b];
                return words[a] < words[b];
            });
        by_probability.clear();
        by_probability.reserve(order.size());
        for (size_t i : order) by_probability.push_back(words[i]);
    }

    // filtering keeps the order, so the first survivor is the most probable one
    string Max_prob_strategy::guess(const History& history) {
        vector<Word> candidates = Filter::apply_history(by_probability, history);
        if (candidates.empty()) return by_probability[0].to_string();
        return candidates[0].to_string();
    }

    //////////////////
    // Entropy

    const size_t Entropy_strategy::max_guess_pool = 200;
    const size_t Entropy_strategy::max_eval_candidates = 500;

    Entropy_strategy::Entropy_strategy(uint64_t seed_) : seed(seed_), rng(seed_) {}

    const string& Entropy_strategy::name() const { return entropy_name; }

    void Entropy_strategy::begin_game(const GameConfig& config) {
        vocabulary = config.vocabulary;
        rng.seed(seed);
    }

    vector<Word> Entropy_strategy::sample(const vector<Word>& words, size_t n) {
        vector<Word> pool(words);
        for (size_t i = 0; i < n; i++) {
            std::uniform_int_distribution<size_t> pick(i, pool.size() - 1);
            std::swap(pool[i], pool[pick(rng)]);
        }
        pool.resize(n);
        return pool;
    }

    double Entropy_strategy::partition_entropy(const Word& guess, const vector<Word>& candidates) {
        // 3^6 possible feedbacks at most
        vector<int> partition(729, 0);
        for (const Word& c : candidates) {
            partition[Feedback::score(guess, c).code()]++;
        }
        double n = candidates.size();
        double ent = 0;
        for (int count : partition) {
            if (count == 0) continue;
            double p = count / n;
            ent -= p * std::log2(p);
        }
        return ent;
    }

    string Entropy_strategy::guess(const History& history) {
        vector<Word> candidates = Filter::apply_history(*vocabulary, history);
        if (candidates.empty()) return (*vocabulary)[0].to_string();
        if (candidates.size() <= 2) return candidates[0].to_string();

        vector<Word> guess_pool = candidates.size() <= max_guess_pool ? candidates : sample(candidates, max_guess_pool);
        vector<Word> eval = candidates.size() <= max_eval_candidates ? candidates : sample(candidates, max_eval_candidates);

        Word best = guess_pool[0];
        double best_entropy = -1;
        for (const Word& g : guess_pool) {
            double ent = partition_entropy(g, eval);
            if (ent > best_entropy) {
                best_entropy = ent;
                best = g;
            }
        }
        return best.to_string();
    }

    void register_builtin_strategies() {
        static bool done = false;
        if (done) return;
        done = true;
        Registry::add(random_name, true, [] (uint64_t seed) {
                return unique_ptr<Strategy_intf>(new Random_strategy(seed));
            });
        Registry::add(max_prob_name, true, [] (uint64_t seed) {
                return unique_ptr<Strategy_intf>(new Max_prob_strategy());
            });
        Registry::add(entropy_name, true, [] (uint64_t seed) {
                return unique_ptr<Strategy_intf>(new Entropy_strategy(seed));
            });
    }

    // plays [secret] in-process, no validation or time limit, returns the guesses
    static vector<string> play(Strategy_intf& s, const GameConfig& config, const Word& secret) {
        vector<string> guesses;
        History h;
        s.begin_game(config);
        while ((int)h.size() < config.max_guesses) {
            string g = s.guess(h);
            guesses.push_back(g);
            Word w(g);
            h.push_back(Turn{w, Feedback::score(w, secret)});
            if (w == secret) break;
        }
        return guesses;
    }

    void test_builtin_strategies() {
        Lexicon freq = Lexicon::from_counts({{"gato", 5}, {"pato", 50}, {"rato", 20}, {"sapo", 1},
                                             {"mapa", 3}, {"capa", 8}, {"copa", 2}, {"ropa", 30}},
                                            4, Mode::frequency);
        Lexicon uni = Lexicon::from_counts({{"gato", 5}, {"pato", 50}, {"rato", 20}, {"sapo", 1},
                                            {"mapa", 3}, {"capa", 8}, {"copa", 2}, {"ropa", 30}},
                                           4, Mode::uniform);
        GameConfig fc = GameConfig::of_lexicon(freq, 8, true);
        GameConfig uc = GameConfig::of_lexicon(uni, 8, true);

        std::stringstream output1;
        std::stringstream expected1;

        Max_prob_strategy mp;
        mp.begin_game(fc);
        output1 << mp.guess(History()) << " ";
        mp.begin_game(uc);
        output1 << mp.guess(History()) << " ";

        Random_strategy r1(11);
        Random_strategy r2(11);
        vector<string> g1 = play(r1, uc, Word("copa"));
        vector<string> g2 = play(r2, uc, Word("copa"));
        output1 << (g1 == g2) << " ";

        Entropy_strategy e1(3);
        Entropy_strategy e2(3);
        e1.begin_game(uc);
        e2.begin_game(uc);
        string first = e1.guess(History());
        output1 << (first == e2.guess(History())) << uni.contains(Word(first)) << std::endl;
        expected1 << "pato capa 1 11" << std::endl;

        string output1_str = output1.str();
        string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("test_builtin_strategies() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        // guessing only consistent candidates always gets there on a small vocabulary
        for (const Word& secret : uni.words()) {
            Random_strategy r(secret.length());
            Max_prob_strategy m;
            Entropy_strategy e(1);
            for (Strategy_intf* s : { (Strategy_intf*)&r, (Strategy_intf*)&m, (Strategy_intf*)&e }) {
                vector<string> g = play(*s, fc, secret);
                if (g.back() != secret.to_string()) {
                    throw std::runtime_error("test_builtin_strategies() 2 failed, " + s->name() + " did not find "
                                             + secret.to_string());
                }
            }
        }

        double best = Entropy_strategy::partition_entropy(Word("pato"), uni.words());
        double worst = Entropy_strategy::partition_entropy(Word("gato"), vector<Word>{Word("gato")});
        if (!(best > 0 && worst == 0)) {
            throw std::runtime_error("test_builtin_strategies() 3 failed, unexpected partition entropy");
        }
    }
}
