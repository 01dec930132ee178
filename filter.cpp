#include <sstream>
#include <stdexcept>
#include "filter.hpp"

using std::vector;
using std::string;

namespace Filter {
    vector<Word> filter_candidates(const vector<Word>& candidates, const Word& guess, const Feedback& feedback) {
        vector<Word> r;
        r.reserve(candidates.size());
        for (const Word& w : candidates) {
            if (w.length() == guess.length() && Feedback::score(guess, w) == feedback) r.push_back(w);
        }
        return r;
    }

    int count_candidates(const vector<Word>& candidates, const Word& guess, const Feedback& feedback) {
        int c = 0;
        for (const Word& w : candidates) {
            if (w.length() == guess.length() && Feedback::score(guess, w) == feedback) c++;
        }
        return c;
    }

    vector<Word> apply_history(const vector<Word>& candidates, const Strategy::History& history) {
        vector<Word> r(candidates);
        for (const Strategy::Turn& t : history) {
            r = filter_candidates(r, t.guess, t.feedback);
        }
        return r;
    }

    static string join(const vector<Word>& words) {
        std::stringstream ss;
        for (const Word& w : words) ss << w << " ";
        return ss.str();
    }

    void test() {
        vector<Word> all;
        const char* raw[] = { "arcos", "canto", "santo", "manto", "cantos", "tanto", "campo", "corto", "nacer" };
        for (const char* w : raw) {
            if (Word::is_valid(w, 5)) all.push_back(Word(w));
        }

        Word guess("canto");
        Feedback f = Feedback::score(guess, Word("santo"));
        vector<Word> kept = filter_candidates(all, guess, f);

        std::stringstream output1;
        std::stringstream expected1;
        output1 << f << " " << join(kept) << "| "
                << count_candidates(all, guess, f) << " "
                << join(filter_candidates(kept, guess, f)) << "| "
                << filter_candidates(all, guess, Feedback("22222")).size() << " "
                << filter_candidates(all, Word("zzzzz"), Feedback("11111")).size()
                << std::endl;
        expected1 << "02222 santo manto tanto | 3 santo manto tanto | 1 0" << std::endl;

        string output1_str = output1.str();
        string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Filter::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
        }

        // soundness and completeness against the matcher, for every guess/feedback we can observe
        for (const Word& g : all) {
            for (const Word& secret : all) {
                Feedback fb = Feedback::score(g, secret);
                vector<Word> k = filter_candidates(all, g, fb);
                size_t j = 0;
                for (const Word& w : all) {
                    bool consistent = Feedback::score(g, w) == fb;
                    bool retained = j < k.size() && k[j] == w;
                    if (retained) j++;
                    if (consistent != retained) {
                        throw std::runtime_error("Filter::test() 2 failed for guess " + g.to_string() + " word " + w.to_string());
                    }
                }
                if (filter_candidates(k, g, fb) != k) {
                    throw std::runtime_error("Filter::test() 3 failed, not idempotent for guess " + g.to_string());
                }
            }
        }

        Strategy::History h;
        h.push_back(Strategy::Turn{Word("arcos"), Feedback::score(Word("arcos"), Word("manto"))});
        h.push_back(Strategy::Turn{Word("campo"), Feedback::score(Word("campo"), Word("manto"))});
        vector<Word> left = apply_history(all, h);
        if (left.size() != 1 || left[0] != Word("manto")) {
            throw std::runtime_error("Filter::test() 4 failed, got " + join(left));
        }
    }
}
