#include <fstream>
#include <sstream>
#include <map>
#include <cmath>
#include <random>
#include <algorithm>
#include <cstdio>
#include <boost/lexical_cast.hpp>
#include "lexicon.hpp"

using std::string;
using std::vector;
using std::pair;
using std::map;
using std::endl;

Mode mode_of_string(const string& str) {
    if (str == "uniform") return Mode::uniform;
    if (str == "frequency") return Mode::frequency;
    throw Lexicon::Configuration_error("mode must be 'uniform' or 'frequency', not: " + str);
}

std::ostream& operator<<(std::ostream& os, Mode m) {
    return os << to_string(m);
}

string to_string(Mode m) {
    return m == Mode::uniform ? "uniform" : "frequency";
}

static string trim(const string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// U+00C0 .. U+00FF, '?' for anything that has no plain a-z equivalent
static const char latin1_base[] =
    "aaaaaa?ceeeeiiii?nooooo?ouuuuy??"
    "aaaaaa?ceeeeiiii?nooooo?ouuuuy?y";

string Lexicon::normalize(const string& raw) {
    string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        unsigned char c = raw[i];
        if (c == 0xC3 && i + 1 < raw.size()) {
            unsigned char next = raw[i + 1];
            out.push_back(latin1_base[next & 0x3F]);
            i++;
        } else if (c >= 'A' && c <= 'Z') {
            out.push_back(c + 'a' - 'A');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

Lexicon::Lexicon(vector<Word>&& words, vector<double>&& probs, Mode mode, int word_length) :
    words_ptr(std::make_shared<const vector<Word>>(std::move(words))),
    probs_ptr(std::make_shared<const vector<double>>(std::move(probs))),
    mode_(mode),
    word_length_(word_length)
{}

Lexicon Lexicon::with_probabilities(const vector<double>& probabilities) const {
    if (probabilities.size() != words_ptr->size()) {
        throw std::runtime_error("with_probabilities: expected one weight per word");
    }
    Lexicon rv(*this);
    rv.probs_ptr = std::make_shared<const vector<double>>(probabilities);
    return rv;
}

int Lexicon::index_of(const Word& w) const {
    const vector<Word>& words = *words_ptr;
    vector<Word>::const_iterator it = std::lower_bound(words.begin(), words.end(), w);
    if (it == words.end() || *it != w) return -1;
    return it - words.begin();
}

vector<pair<string, int64_t>> Lexicon::read_txt(std::istream& in) {
    vector<pair<string, int64_t>> rv;
    string line;
    while (std::getline(in, line)) {
        rv.push_back({line, 1});
    }
    return rv;
}

// one csv record, fields may be "quoted" with "" for a literal quote
static vector<string> split_csv_line(const string& line) {
    vector<string> rv(1);
    bool quoted = false;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                rv.back() += '"';
                i++;
            } else if (c == '"') {
                quoted = false;
            } else {
                rv.back() += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            rv.push_back("");
        } else {
            rv.back() += c;
        }
    }
    return rv;
}

vector<pair<string, int64_t>> Lexicon::read_csv(std::istream& in, const string& name) {
    vector<pair<string, int64_t>> rv;
    string line;
    if (!std::getline(in, line)) {
        throw Configuration_error("Empty csv: " + name);
    }

    int word_col = -1;
    int count_col = -1;
    vector<string> header = split_csv_line(line);
    for (int col = 0; col < (int)header.size(); col++) {
        string field = normalize(trim(header[col]));
        if (field == "word") word_col = col;
        if (field == "count") count_col = col;
    }
    if (word_col < 0 || count_col < 0) {
        throw Configuration_error("Expected a word,count header in " + name + ", got: " + line);
    }

    int line_number = 1;
    while (std::getline(in, line)) {
        line_number++;
        if (trim(line).empty()) continue;
        vector<string> fields = split_csv_line(line);
        string word = word_col < (int)fields.size() ? fields[word_col] : "";
        string count = count_col < (int)fields.size() ? trim(fields[count_col]) : "";
        try {
            rv.push_back({word, boost::lexical_cast<int64_t>(count)});
        } catch (const boost::bad_lexical_cast&) {
            throw Configuration_error(name + ":" + boost::lexical_cast<string>(line_number)
                                      + ": bad count '" + count + "'");
        }
    }
    return rv;
}

Lexicon Lexicon::from_counts(const vector<pair<string, int64_t>>& counts, int word_length, Mode mode, const string& source) {
    if (word_length < Word::min_length || word_length > Word::max_length) {
        throw Configuration_error("Word length must be 4, 5 or 6, not " + boost::lexical_cast<string>(word_length));
    }

    // first occurrence wins, and the map keeps them sorted
    map<Word, int64_t> unique;
    for (const pair<string, int64_t>& wc : counts) {
        string w = normalize(trim(wc.first));
        if (wc.second <= 0) continue;
        if (!Word::is_valid(w, word_length)) continue;
        unique.insert({Word(w), wc.second});
    }
    if (unique.empty()) {
        throw Configuration_error("No " + boost::lexical_cast<string>(word_length) + "-letter words found in " + source);
    }

    vector<Word> words;
    vector<int64_t> raw_counts;
    words.reserve(unique.size());
    raw_counts.reserve(unique.size());
    for (const pair<const Word, int64_t>& wc : unique) {
        words.push_back(wc.first);
        raw_counts.push_back(wc.second);
    }

    vector<double> probs;
    if (mode == Mode::uniform) {
        probs.assign(words.size(), 1.0 / words.size());
    } else {
        probs = sigmoid_weights(raw_counts);
    }
    return Lexicon(std::move(words), std::move(probs), mode, word_length);
}

Lexicon Lexicon::load(const string& path, int word_length, Mode mode) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        throw Configuration_error("Word list not found: " + path);
    }
    bool is_csv = path.size() >= 4 && path.compare(path.size() - 4, 4, ".csv") == 0;
    vector<pair<string, int64_t>> counts = is_csv ? read_csv(f, path) : read_txt(f);
    return from_counts(counts, word_length, mode, path);
}

Lexicon Lexicon::load_default(const string& data_dir, int word_length, Mode mode) {
    string len = boost::lexical_cast<string>(word_length);
    string csv_path = data_dir + "/spanish_" + len + "letter.csv";
    string mini_path = data_dir + "/mini_spanish_" + len + ".txt";
    if (std::ifstream(csv_path.c_str()).good()) return load(csv_path, word_length, mode);
    if (std::ifstream(mini_path.c_str()).good()) return load(mini_path, word_length, mode);
    throw Configuration_error("No word list found for " + len + "-letter words. Looked for " + csv_path
                              + " and " + mini_path);
}

static double sigmoid(double x) {
    if (x >= 0) return 1.0 / (1.0 + std::exp(-x));
    double ex = std::exp(x);
    return ex / (1.0 + ex);
}

vector<double> Lexicon::sigmoid_weights(const vector<int64_t>& counts, double steepness) {
    vector<double> rv;
    if (counts.empty()) return rv;

    vector<double> log_counts;
    log_counts.reserve(counts.size());
    double mu = 0;
    for (int64_t c : counts) {
        log_counts.push_back(std::log(c + 1.0));
        mu += log_counts.back();
    }
    mu /= counts.size();

    double total = 0;
    rv.reserve(counts.size());
    for (double lc : log_counts) {
        rv.push_back(sigmoid(steepness * (lc - mu)));
        total += rv.back();
    }
    for (double& w : rv) w /= total;
    return rv;
}

vector<double> Lexicon::perturb(const vector<double>& probabilities, double epsilon, uint64_t seed) {
    if (!(epsilon >= 0 && epsilon < 1)) {
        throw Configuration_error("shock must be in [0, 1), not " + boost::lexical_cast<string>(epsilon));
    }
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> noise(-epsilon, epsilon);

    vector<double> rv;
    rv.reserve(probabilities.size());
    double total = 0;
    for (double p : probabilities) {
        double factor = epsilon > 0 ? 1.0 + noise(rng) : 1.0;
        rv.push_back(std::max(p * factor, 1e-12));
        total += rv.back();
    }
    for (double& p : rv) p /= total;
    return rv;
}

static double sum(const vector<double>& v) {
    double t = 0;
    for (double x : v) t += x;
    return t;
}

void Lexicon::test() {
    string txt_file = "/tmp/wordle_arena_lexicon_test.txt";
    string csv_file = "/tmp/wordle_arena_lexicon_test.csv";
    {
        std::ofstream txt(txt_file.c_str());
        txt << "Casa\nperro\n  Ni\xC3\xB1o \ncasa\nca\xC3\xB1\xC3\xB3n\n\xC3\xA1rbol\nx\nsalas\n\nmesa\r\nl\xC3\xA6ma\n";
        std::ofstream csv(csv_file.c_str());
        csv << "word,\"count\"\ncasa,10\nmesa,0\nNINO,100\nsol,5\npato,-3\ncasa,7\nlobo,1\n\"pelo\",\"4\"\n\"a,b\"\"c\",2\n";
    }

    std::stringstream output1;
    std::stringstream expected1;

    Lexicon l4 = load(txt_file, 4, Mode::uniform);
    Lexicon l5 = load(txt_file, 5, Mode::uniform);
    for (const Word& w : l4.words()) output1 << w << " ";
    output1 << l4.probabilities()[0] << endl;
    for (const Word& w : l5.words()) output1 << w << " ";
    output1 << l5.probabilities()[3] << " " << l5.index_of(Word("perro")) << " " << l5.index_of(Word("gatos")) << endl;

    expected1 << "casa mesa nino 0.333333" << endl;
    expected1 << "arbol canon perro salas 0.25 2 -1" << endl;

    Lexicon f4 = load(csv_file, 4, Mode::frequency);
    const vector<double>& p = f4.probabilities();
    for (const Word& w : f4.words()) output1 << w << " ";
    output1 << (p[2] > p[0]) << (p[0] > p[1]) << (std::fabs(sum(p) - 1) < 1e-9) << endl;
    expected1 << "casa lobo nino pelo 111" << endl;

    std::remove(txt_file.c_str());
    std::remove(csv_file.c_str());

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Lexicon::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    // shocks: deterministic per seed, renormalised, bounded
    vector<double> a = perturb(p, 0.05, 1234);
    vector<double> b = perturb(p, 0.05, 1234);
    vector<double> c = perturb(p, 0.05, 4321);
    vector<double> same = perturb(p, 0, 99);
    if (a != b || a == c) {
        throw std::runtime_error("Lexicon::test() 2 failed, perturb is not deterministic per seed");
    }
    if (std::fabs(sum(a) - 1) > 1e-9 || std::fabs(sum(c) - 1) > 1e-9) {
        throw std::runtime_error("Lexicon::test() 2 failed, perturbed distribution does not sum to 1");
    }
    for (size_t i = 0; i < p.size(); i++) {
        if (std::fabs(same[i] - p[i]) > 1e-12 || a[i] < p[i] * 0.95 / 1.05 || a[i] > p[i] * 1.05 / 0.95) {
            throw std::runtime_error("Lexicon::test() 2 failed, perturbation out of bounds");
        }
    }

    int errors = 0;
    try { perturb(p, 1.5, 1); } catch (const Configuration_error&) { errors++; }
    try { mode_of_string("zipf"); } catch (const Configuration_error&) { errors++; }
    try { load_default("/nonexistent/wordle_arena", 5, Mode::uniform); } catch (const Configuration_error&) { errors++; }
    try { from_counts({{"casa", 1}}, 6, Mode::uniform); } catch (const Configuration_error&) { errors++; }
    try { from_counts({{"casa", 1}}, 7, Mode::uniform); } catch (const Configuration_error&) { errors++; }
    if (errors != 5) {
        throw std::runtime_error("Lexicon::test() 3 failed, expected 5 configuration errors, got "
                                 + boost::lexical_cast<string>(errors));
    }
}
