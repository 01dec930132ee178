#include <sstream>
#include <stdexcept>
#include <cstring>
#include "word.hpp"

const int Word::min_length = 4;
const int Word::max_length = 6;

static bool is_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? c + 'a' - 'A' : c;
}

Word::Word(const std::string& r) : len(0) {
    std::memset(letters, 0, sizeof(letters));
    if (r.length() < (size_t)min_length || r.length() > (size_t)max_length) {
        throw std::runtime_error("Expected a word of 4 to 6 letters, not: " + r);
    }
    for (char c : r) {
        if (!is_letter(c)) {
            throw std::runtime_error("Expected only letters a-z, not: " + r);
        }
        letters[len++] = to_lower(c);
    }
}

Word::Word() : len(0) {
    std::memset(letters, 0, sizeof(letters));
}

bool Word::is_valid(const std::string& r, int length) {
    if (length < min_length || length > max_length) return false;
    if (r.length() != (size_t)length) return false;
    for (char c : r) {
        if (!is_letter(c)) return false;
    }
    return true;
}

bool Word::operator==(const Word& r) const {
    return len == r.len && std::memcmp(letters, r.letters, len) == 0;
}

bool Word::operator!=(const Word& r) const {
    return !(*this == r);
}

// shorter words first, then alphabetical
bool Word::operator<(const Word& r) const {
    if (len != r.len) return len < r.len;
    return std::memcmp(letters, r.letters, len) < 0;
}

std::string Word::to_string() const {
    return std::string(letters, len);
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os.write(x.letters, x.len);
}

void Word::test() {
    std::stringstream output1;
    std::stringstream expected1;

    Word x("CaSa");
    Word y("perros");
    Word z("casa");
    output1 << x << " " << x.length() << " "
            << y << " " << y.length() << " "
            << (x == z) << " " << (x < y) << " " << (y < x) << " "
            << is_valid("canto", 5) << is_valid("cant", 5) << is_valid("can7o", 5) << is_valid("abc", 3)
            << std::endl;
    expected1 << "casa 4 perros 6 1 1 0 1000" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Word::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    int failures = 0;
    const char* bad[] = { "abc", "abcdefg", "ab-cd", "ab cd", "" };
    for (const char* b : bad) {
        try {
            Word w(b);
        } catch (const std::runtime_error&) {
            failures++;
        }
    }
    if (failures != 5) {
        throw std::runtime_error("Word::test() 2 failed, expected every malformed word to throw");
    }
}
