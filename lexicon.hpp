/* The words a round is played with, and how likely each one is to be the secret.

   A Lexicon is a sorted, duplicate-free vocabulary of one word length plus a probability
   for every word, stored in a vector aligned with the vocabulary (probabilities()[i] is
   the weight of words()[i]). Both are held through shared_ptr<const ...> so every
   episode of a round can share them read-only.

   Corpus files are either
     - plain text, one word per line (every word gets count 1), or
     - .csv with a "word,count" header (e.g. OpenSLR frequency lists).
*/

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <iostream>
#include <cstdint>
#include "word.hpp"

enum class Mode
    { uniform = 0,     // every word equally likely
      frequency = 1 }; // sigmoid of log corpus count, normalised

Mode mode_of_string(const std::string& str);
std::ostream& operator<<(std::ostream& os, Mode m);
std::string to_string(Mode m);

class Lexicon {
public:
    // Setup problems: unknown mode, missing corpus, no words of the requested length.
    // These abort a round, never a single game.
    class Configuration_error : public std::runtime_error {
    public:
        Configuration_error(const std::string& what) : std::runtime_error(what) {}
    };

    static Lexicon load(const std::string& path, int word_length, Mode mode);

    // Looks for <data_dir>/spanish_<L>letter.csv first, then <data_dir>/mini_spanish_<L>.txt
    static Lexicon load_default(const std::string& data_dir, int word_length, Mode mode);

    // raw (possibly accented, mixed case, duplicated) words with counts
    static Lexicon from_counts(const std::vector<std::pair<std::string, int64_t>>& counts, int word_length, Mode mode,
                               const std::string& source = "<memory>");

    // Multiplies each weight by (1 + u), u ~ Uniform(-epsilon, epsilon), floors at 1e-12
    // and renormalises. Deterministic for a given seed.
    static std::vector<double> perturb(const std::vector<double>& probabilities, double epsilon, uint64_t seed);

    // sigmoid(steepness * (log(c + 1) - mean log)), normalised to sum to 1
    static std::vector<double> sigmoid_weights(const std::vector<int64_t>& counts, double steepness = 1.5);

    // lower-cases and strips latin accents from a utf-8 string ("Niño" -> "nino")
    static std::string normalize(const std::string& raw);

    const std::vector<Word>& words() const { return *words_ptr; }
    const std::vector<double>& probabilities() const { return *probs_ptr; }
    std::shared_ptr<const std::vector<Word>> shared_words() const { return words_ptr; }
    std::shared_ptr<const std::vector<double>> shared_probabilities() const { return probs_ptr; }
    Mode mode() const { return mode_; }
    int word_length() const { return word_length_; }

    // same words, different weights (used to apply a shock)
    Lexicon with_probabilities(const std::vector<double>& probabilities) const;

    // -1 if not found
    int index_of(const Word& w) const;
    bool contains(const Word& w) const { return index_of(w) >= 0; }

    static void test();
private:
    Lexicon(std::vector<Word>&& words, std::vector<double>&& probs, Mode mode, int word_length);

    static std::vector<std::pair<std::string, int64_t>> read_txt(std::istream& in);
    static std::vector<std::pair<std::string, int64_t>> read_csv(std::istream& in, const std::string& name);

    std::shared_ptr<const std::vector<Word>> words_ptr;
    std::shared_ptr<const std::vector<double>> probs_ptr;
    Mode mode_;
    int word_length_;
};
