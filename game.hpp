#pragma once
#include <string>
#include <vector>
#include <functional>
#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "word.hpp"
#include "strategy.hpp"

// Don't change the ints, they end up in reports.
enum class Outcome : int32_t
    { solved = 0,
      exhausted = 1,   // ran out of guesses
      faulted = 2,     // invalid guess, exception, crash
      timed_out = 3 }; // the game's time budget ran out

Outcome outcome_of_string(const std::string& str);
std::ostream& operator<<(std::ostream& os, Outcome o);

namespace Game {
    /* The terminal record of one game. Everything but a solved game counts as
       max_guesses + 1 guesses. */

    class GameResult {
    public:
        GameResult();
        std::string strategy;
        Word secret;
        std::vector<Word> guesses;
        int num_guesses;
        Outcome outcome;
        int64_t elapsed_microseconds;
        std::string reason; // empty unless faulted or timed out

        bool solved() const { return outcome == Outcome::solved; }

        // one line, no newlines. [reason] goes last so it may contain commas.
        std::string to_string() const;
        static GameResult of_string(const std::string& r);

        static void test();
    };

    std::ostream& operator<<(std::ostream& os, const GameResult& g);

    // Plays one game from start to finish. [budget] covers begin_game plus every guess call,
    // checked after each call returns. Anything the strategy does wrong (bad guess, exception)
    // ends in Outcome::faulted, it never escapes from here. [on_turn] sees every accepted turn,
    // [on_finished] the final result before end_game runs. end_game is outside the budget and
    // what it throws is only logged.
    //
    // Throws only if [secret] is not in the vocabulary.
    GameResult run_episode
    (Strategy::Strategy_intf& strategy,
     const Strategy::GameConfig& config,
     const Word& secret,
     boost::posix_time::time_duration budget,
     std::function<void(const Strategy::Turn&)> on_turn = nullptr,
     std::function<void(const GameResult&)> on_finished = nullptr);

    // the message for a guess the runner refuses, empty if the guess is fine
    std::string validate_guess(const std::string& guess, const Strategy::GameConfig& config);

    void test();
}
