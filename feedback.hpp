/* Represents the marks the game gives back for one guess: per position one of
   correct (right letter, right place), present (right letter, wrong place) or
   absent. This is the 2/1/0 encoding used everywhere, including the text form
   "10110" and the reports.

   The only way to get a Feedback from a real game is the matcher below
   (Feedback::score, or equivalently the (secret, guess) constructor). The string
   constructor exists for tests and for people typing in results by hand.
*/

#pragma once
#include <string>
#include <cstdint>
#include "word.hpp"

class Feedback {
public:
    static const char absent;
    static const char present;
    static const char correct;

    // format is either digits "21001" or the symbols "._~__"
    // ('.' correct, '~' present, '_' absent).
    Feedback(const std::string& marks);

    // an impossible result, zero length
    Feedback();

    // the matcher. Throws if the lengths differ.
    Feedback(const Word& secret, const Word& guess);
    static Feedback score(const Word& guess, const Word& secret);

    char get(int i) const { return marks[i]; }
    int length() const { return len; }
    int count(char mark) const;
    bool is_solved() const;

    // base-3 number with position 0 as the least significant digit. Unique per
    // length, so it is a good partition key.
    int32_t code() const;

    bool operator<(const Feedback& r) const;
    bool operator==(const Feedback& r) const;
    bool operator!=(const Feedback& r) const;

    std::string to_string() const;
    // the guess letters on coloured backgrounds, for terminals
    std::string to_ansi(const Word& guess) const;

    static void test();
private:
    int8_t len;
    char marks[6];
};

std::ostream& operator<<(std::ostream& os, const Feedback& x);
