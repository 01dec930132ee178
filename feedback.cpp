#include <sstream>
#include <array>
#include <stdexcept>
#include <cstring>
#include "feedback.hpp"

const char Feedback::absent = 0;
const char Feedback::present = 1;
const char Feedback::correct = 2;

Feedback::Feedback(const std::string& r) : len(0) {
    std::memset(marks, 0, sizeof(marks));
    for (char c : r) {
        if (len >= Word::max_length) {
            throw std::runtime_error("Too many marks in feedback: " + r);
        }
        if (c == '0' || c == '_') {
            marks[len++] = absent;
        } else if (c == '1' || c == '~') {
            marks[len++] = present;
        } else if (c == '2' || c == '.') {
            marks[len++] = correct;
        } else {
            throw std::runtime_error("Unexpected character in feedback: " + r);
        }
    }
    if (len < Word::min_length) {
        throw std::runtime_error("Expected 4 to 6 marks in feedback, not: " + r);
    }
}

Feedback::Feedback() : len(0) {
    std::memset(marks, 0, sizeof(marks));
}

Feedback::Feedback(const Word& secret, const Word& guess) : len(guess.len) {
    if (guess.len != secret.len) {
        throw std::runtime_error("Guess " + guess.to_string() + " and secret " + secret.to_string()
                                 + " have different lengths");
    }
    std::memset(marks, absent, sizeof(marks));

    std::array<int, 26> remaining;
    remaining.fill(0);
    for (int i = 0; i < secret.len; i++) {
        remaining[secret.letters[i] - 'a']++;
    }

    // greens first, so that a later exact match is never stolen by an earlier yellow
    for (int i = 0; i < len; i++) {
        if (guess.letters[i] == secret.letters[i]) {
            marks[i] = correct;
            remaining[guess.letters[i] - 'a']--;
        }
    }

    for (int i = 0; i < len; i++) {
        if (marks[i] == correct) continue;
        int& r = remaining[guess.letters[i] - 'a'];
        if (r > 0) {
            marks[i] = present;
            r--;
        }
    }
}

Feedback Feedback::score(const Word& guess, const Word& secret) {
    return Feedback(secret, guess);
}

int Feedback::count(char mark) const {
    int i = 0;
    for (int j = 0; j < len; j++) {
        if (marks[j] == mark) i++;
    }
    return i;
}

bool Feedback::is_solved() const {
    return len > 0 && count(correct) == len;
}

int32_t Feedback::code() const {
    int32_t c = 0;
    for (int i = len - 1; i >= 0; i--) {
        c = c * 3 + marks[i];
    }
    return c;
}

bool Feedback::operator<(const Feedback& r) const {
    if (len != r.len) return len < r.len;
    return std::memcmp(marks, r.marks, len) < 0;
}

bool Feedback::operator==(const Feedback& r) const {
    return len == r.len && std::memcmp(marks, r.marks, len) == 0;
}

bool Feedback::operator!=(const Feedback& r) const {
    return !(*this == r);
}

std::string Feedback::to_string() const {
    std::string s;
    for (int i = 0; i < len; i++) {
        s.push_back('0' + marks[i]);
    }
    return s;
}

std::string Feedback::to_ansi(const Word& guess) const {
    std::stringstream os;
    for (int i = 0; i < len && i < guess.length(); i++) {
        if (marks[i] == absent) {
            os << "\033[37;40m" << guess[i];
        } else if (marks[i] == present) {
            os << "\033[30;43m" << guess[i];
        } else {
            os << "\033[30;42m" << guess[i];
        }
    }
    os << "\033[0m";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Feedback& x) {
    return os << x.to_string();
}

void Feedback::test() {
    std::stringstream output1;
    std::stringstream expected1;

    output1 << Feedback(Word("canto"), Word("arcos")) << " "
            << Feedback::score(Word("arcos"), Word("canto")) << " "
            << Feedback("_~.~_") << " "
            << Feedback("0120").code() << " "
            << Feedback("2222").is_solved() << Feedback("22122").is_solved()
            << std::endl;
    expected1 << "10110 10110 01210 21 10" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Feedback::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    // secret first, then guess
    std::stringstream output2;
    std::stringstream expected2;
    output2 << Feedback(Word("jaunt"), Word("taunt")) << std::endl;
    output2 << Feedback(Word("brine"), Word("sweet")) << std::endl;
    output2 << Feedback(Word("aabbb"), Word("bbaaa")) << std::endl;
    output2 << Feedback(Word("mummy"), Word("mmyym")) << std::endl;
    output2 << Feedback(Word("photo"), Word("flood")) << std::endl;
    output2 << Feedback(Word("wrote"), Word("flood")) << std::endl;
    output2 << Feedback(Word("bongo"), Word("flood")) << std::endl;
    output2 << Feedback(Word("youth"), Word("flood")) << std::endl;
    output2 << Feedback(Word("world"), Word("flood")) << std::endl;
    output2 << Feedback(Word("sala"), Word("aaaa")) << std::endl;
    output2 << Feedback(Word("pollos"), Word("lolita")) << std::endl;

    expected2 << Feedback("_....") << std::endl;
    expected2 << Feedback("__~__") << std::endl;
    expected2 << Feedback("~~~~_") << std::endl;
    expected2 << Feedback(".~~_~") << std::endl;
    expected2 << Feedback("__.~_") << std::endl;
    expected2 << Feedback("__.__") << std::endl;
    expected2 << Feedback("__~~_") << std::endl;
    expected2 << Feedback("__~__") << std::endl;
    expected2 << Feedback("_~~_.") << std::endl;
    expected2 << Feedback("_._.") << std::endl;
    expected2 << Feedback("~..___") << std::endl;

    std::string output2_str = output2.str();
    std::string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Feedback::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
    }

    // never more yellow+green marks for a letter than the secret has copies of it
    const char* words[] = { "sala", "alas", "aaaa", "lala", "casa", "saca", "asas", "llls" };
    for (const char* s : words) {
        for (const char* g : words) {
            Word secret(s);
            Word guess(g);
            Feedback f(secret, guess);
            if (f != Feedback(secret, guess)) {
                throw std::runtime_error("Feedback::test() 3 failed, not deterministic for " + guess.to_string());
            }
            for (char letter = 'a'; letter <= 'z'; letter++) {
                int in_secret = 0;
                int marked = 0;
                for (int i = 0; i < 4; i++) {
                    if (secret[i] == letter) in_secret++;
                    if (guess[i] == letter && f.get(i) != absent) marked++;
                }
                if (marked > in_secret) {
                    throw std::runtime_error("Feedback::test() 3 failed, " + guess.to_string() + " against "
                                             + secret.to_string() + " gives " + f.to_string());
                }
            }
        }
    }

    bool threw = false;
    try {
        Feedback::score(Word("casa"), Word("canto"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Feedback::test() 4 failed, length mismatch did not throw");
    }
}
