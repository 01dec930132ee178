#pragma once
#include <vector>
#include "word.hpp"
#include "feedback.hpp"
#include "strategy.hpp"

namespace Filter {
    // Keeps, in order, exactly the candidates W for which Feedback::score(guess, W) == feedback.
    // An empty result is fine, it just means the observations are inconsistent with every candidate.
    std::vector<Word> filter_candidates(const std::vector<Word>& candidates, const Word& guess, const Feedback& feedback);

    // same as filter_candidates(...).size() without building the vector
    int count_candidates(const std::vector<Word>& candidates, const Word& guess, const Feedback& feedback);

    // filter_candidates for every turn of [history] in order
    std::vector<Word> apply_history(const std::vector<Word>& candidates, const Strategy::History& history);

    void test();
}
