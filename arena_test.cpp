#include <iostream>
#include <stdexcept>
#include "word.hpp"
#include "feedback.hpp"
#include "filter.hpp"
#include "lexicon.hpp"
#include "strategy.hpp"
#include "strategies.hpp"
#include "game.hpp"
#include "isolation.hpp"
#include "tournament.hpp"
#include "experiment.hpp"

int main(int argc, char* argv[]) {
    try {
        Word::test();
        Feedback::test();
        Filter::test();
        Lexicon::test();
        Strategy::test();
        Strategy::test_builtin_strategies();
        Game::GameResult::test();
        Game::test();
        Isolation::test();
        Tournament::test();
        Experiment::test();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "all tests passed" << std::endl;
    return 0;
}
