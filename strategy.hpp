/* The contract between the arena and a guessing strategy.

   A strategy sees exactly three things: its own name, a GameConfig at the start of each
   game, and the History of its guesses so far. It never sees the secret. Everything a
   strategy returns is validated by the game runner, not here.

   Strategies are created through the Registry, one fresh instance per game (inside the
   isolated unit that plays the game), with an explicit seed for any randomness they need.
   User strategies register themselves from their own .cpp file:

       static Strategy::Registration reg("MyStrategy_team", false,
           [] (uint64_t seed) { return std::unique_ptr<Strategy::Strategy_intf>(new My_strategy(seed)); });
*/

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include "word.hpp"
#include "feedback.hpp"
#include "lexicon.hpp"

namespace Strategy {
    struct Turn {
        Word guess;
        Feedback feedback;
    };

    typedef std::vector<Turn> History;

    // Read-only snapshot of a game variant. The vocabulary and probabilities are shared
    // between every game of a round, probabilities[i] is the weight of vocabulary[i].
    struct GameConfig {
        int word_length;
        std::shared_ptr<const std::vector<Word>> vocabulary;
        Mode mode;
        std::shared_ptr<const std::vector<double>> probabilities;
        int max_guesses;
        bool allow_non_words; // if false, guesses must come from the vocabulary

        static GameConfig of_lexicon(const Lexicon& lex, int max_guesses, bool allow_non_words);
    };

    class Strategy_intf {
    public:
        virtual ~Strategy_intf() {};

        // unique, used as the leaderboard key
        virtual const std::string& name() const = 0;

        // called once per game, counts against the game's time budget
        virtual void begin_game(const GameConfig& config) = 0;

        // must return config.word_length letters (and a vocabulary word unless allow_non_words)
        virtual std::string guess(const History& history) = 0;

        // called after a game that ended normally (solved or out of guesses)
        virtual void end_game(const Word& secret, bool solved, int num_guesses) {};
    };

    typedef std::function<std::unique_ptr<Strategy_intf>(uint64_t seed)> Factory;

    struct Entry {
        std::string name;
        bool builtin;
        Factory factory;
    };

    /* All static members here, one registry per process, filled during static initialisation. */
    class Registry {
    public:
        // throws if [name] is already registered
        static void add(const std::string& name, bool builtin, Factory factory);

        static const std::vector<Entry>& all();
        static const Entry& find(const std::string& name); // case-insensitive, throws if missing

        // every builtin, plus either all user strategies (team empty) or the one named [team]
        static std::vector<Entry> select(const std::string& team);
    private:
        static std::vector<Entry>& entries();
    };

    class Registration {
    public:
        Registration(const std::string& name, bool builtin, Factory factory) {
            Registry::add(name, builtin, factory);
        }
    };

    void test();
}
