#include <sstream>
#include <stdexcept>
#include <algorithm>
#include "strategy.hpp"

using std::string;
using std::vector;

namespace Strategy {
    GameConfig GameConfig::of_lexicon(const Lexicon& lex, int max_guesses, bool allow_non_words) {
        GameConfig c;
        c.word_length = lex.word_length();
        c.vocabulary = lex.shared_words();
        c.mode = lex.mode();
        c.probabilities = lex.shared_probabilities();
        c.max_guesses = max_guesses;
        c.allow_non_words = allow_non_words;
        return c;
    }

    static string lower(const string& s) {
        string r(s);
        std::transform(r.begin(), r.end(), r.begin(), [] (char c) { return (c >= 'A' && c <= 'Z') ? c + 'a' - 'A' : c; });
        return r;
    }

    // a function-local static so registrations from other translation units work
    // regardless of static initialisation order
    vector<Entry>& Registry::entries() {
        static vector<Entry> e;
        return e;
    }

    void Registry::add(const string& name, bool builtin, Factory factory) {
        // names end up in one-line results and csv rows
        if (name.empty() || name.find_first_of(", \t\r\n\"") != string::npos) {
            throw std::runtime_error("Invalid strategy name: '" + name + "'");
        }
        for (const Entry& e : entries()) {
            if (lower(e.name) == lower(name)) {
                throw std::runtime_error("Strategy registered twice: " + name);
            }
        }
        entries().push_back(Entry{name, builtin, factory});
    }

    const vector<Entry>& Registry::all() {
        return entries();
    }

    const Entry& Registry::find(const string& name) {
        for (const Entry& e : entries()) {
            if (lower(e.name) == lower(name)) return e;
        }
        std::stringstream available;
        for (const Entry& e : entries()) available << " " << e.name;
        throw std::runtime_error("Strategy '" + name + "' not found. Available:" + available.str());
    }

    // user strategies are named "StrategyName_team", so --team matches either the full
    // name or the suffix after the last underscore
    static bool matches_team(const string& name, const string& team) {
        string n = lower(name);
        string t = lower(team);
        if (n == t) return true;
        size_t us = n.rfind('_');
        return us != string::npos && n.substr(us + 1) == t;
    }

    vector<Entry> Registry::select(const string& team) {
        vector<Entry> rv;
        bool found_team = false;
        for (const Entry& e : entries()) {
            if (e.builtin) {
                rv.push_back(e);
            } else if (team.empty() || matches_team(e.name, team)) {
                rv.push_back(e);
                found_team = true;
            }
        }
        if (!team.empty() && !found_team) {
            throw std::runtime_error("No strategy found for team: " + team);
        }
        return rv;
    }

    namespace {
        class Constant_strategy : public Strategy_intf {
        public:
            Constant_strategy(const string& name_, const string& word_) : name_str(name_), word(word_) {}
            virtual const string& name() const { return name_str; }
            virtual void begin_game(const GameConfig& config) {}
            virtual string guess(const History& history) { return word; }
        private:
            string name_str;
            string word;
        };
    }

    void test() {
        size_t before = Registry::all().size();
        Registry::add("Constant_registrytest", false, [] (uint64_t seed) {
                return std::unique_ptr<Strategy_intf>(new Constant_strategy("Constant_registrytest", "casa"));
            });

        std::stringstream output;
        std::stringstream expected;

        bool threw = false;
        try {
            Registry::add("CONSTANT_REGISTRYTEST", false, Factory());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        try {
            Registry::add("Comma,name", false, Factory());
            threw = false;
        } catch (const std::runtime_error&) {
        }

        const Entry& e = Registry::find("constant_registrytest");
        std::unique_ptr<Strategy_intf> s = e.factory(7);
        vector<Entry> team = Registry::select("registrytest");
        int team_count = 0;
        for (const Entry& t : team) {
            if (!t.builtin) team_count++;
        }
        bool has_team = team_count == 1;

        output << threw << " " << (Registry::all().size() - before) << " " << s->name() << " "
               << s->guess(History()) << " " << has_team << std::endl;
        expected << "1 1 Constant_registrytest casa 1" << std::endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Strategy::test() failed, got " + output_str + ", but expected " + expected_str);
        }
    }
}
