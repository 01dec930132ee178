/* The builtin reference strategies, registered as "Random", "MaxProb" and "Entropy" by
   register_builtin_strategies(). */

#pragma once
#include <random>
#include <string>
#include <vector>
#include "strategy.hpp"

namespace Strategy {
    // uniformly random among the words still consistent with the history
    class Random_strategy : public Strategy_intf {
    public:
        Random_strategy(uint64_t seed);
        virtual const std::string& name() const;
        virtual void begin_game(const GameConfig& config);
        virtual std::string guess(const History& history);
    private:
        std::mt19937_64 rng;
        std::shared_ptr<const std::vector<Word>> vocabulary;
    };

    // most probable remaining candidate, alphabetical among equals (so under uniform it
    // is simply the first remaining word)
    class Max_prob_strategy : public Strategy_intf {
    public:
        virtual const std::string& name() const;
        virtual void begin_game(const GameConfig& config);
        virtual std::string guess(const History& history);
    private:
        std::vector<Word> by_probability;
    };

    // Maximises the Shannon entropy of the feedback partition over the remaining
    // candidates. Guesses are drawn from the candidates themselves; both the guess pool
    // and the evaluation set are randomly capped to keep a move well under a second.
    class Entropy_strategy : public Strategy_intf {
    public:
        static const size_t max_guess_pool;
        static const size_t max_eval_candidates;

        Entropy_strategy(uint64_t seed);
        virtual const std::string& name() const;
        virtual void begin_game(const GameConfig& config);
        virtual std::string guess(const History& history);

        // entropy in bits of the partition [guess] induces on [candidates]
        static double partition_entropy(const Word& guess, const std::vector<Word>& candidates);
    private:
        std::vector<Word> sample(const std::vector<Word>& words, size_t n);

        uint64_t seed;
        std::mt19937_64 rng;
        std::shared_ptr<const std::vector<Word>> vocabulary;
    };

    // safe to call more than once
    void register_builtin_strategies();

    void test_builtin_strategies();
}
