/* Represents a 4, 5 or 6 letter word. Letters are always stored lower-case 'a'..'z'.

   Words are cheap to copy (a length plus a small inline buffer) so vocabularies are
   plain std::vector<Word>, shared read-only between episodes.
*/

#pragma once
#include <string>
#include <iostream>
#include <cstdint>

class Word {
public:
    static const int min_length;
    static const int max_length;

    // accepts upper or lower case, throws on anything else or a bad length
    Word(const std::string& r);

    // an empty word, only useful as a placeholder
    Word();

    bool operator==(const Word& r) const;
    bool operator!=(const Word& r) const;
    bool operator<(const Word& r) const;
    char operator[](int pos) const { return letters[pos]; }
    int length() const { return len; }
    std::string to_string() const;

    // true if [r] would make a valid Word of [length] letters, without throwing.
    static bool is_valid(const std::string& r, int length);

    friend std::ostream& operator<<(std::ostream& os, const Word& x);
    friend class Feedback;

    static void test();
private:
    int8_t len;
    char letters[6];
};

std::ostream& operator<<(std::ostream& os, const Word& x);
