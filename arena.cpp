#include <string>
#include <vector>
#include <random>
#include <memory>
#include <fstream>
#include <algorithm>
#include <boost/program_options.hpp>
#include "word.hpp"
#include "feedback.hpp"
#include "lexicon.hpp"
#include "strategy.hpp"
#include "strategies.hpp"
#include "isolation.hpp"
#include "tournament.hpp"
#include "experiment.hpp"

using std::vector;
using std::cout;
using std::cerr;
using std::string;
using std::endl;

namespace po = boost::program_options;

static int run_experiment(const string& name, int length, const string& mode_str,
                          const string& words, const string& data_dir, bool verbose, const string& json_path,
                          Experiment::Config config) {
    if (mode_str == "both") {
        cerr << "--experiment takes a single --mode" << endl;
        return 1;
    }
    Mode mode = mode_of_string(mode_str);
    Lexicon lex = words.empty() ? Lexicon::load_default(data_dir, length, mode) : Lexicon::load(words, length, mode);

    const Strategy::Entry& entry = Strategy::Registry::find(name);
    std::unique_ptr<Strategy::Strategy_intf> strategy = entry.factory(config.seed);
    cout << "Running " << entry.name << " on " << lex.words().size() << " words of length " << length
         << " (" << mode << ")" << endl;

    vector<Experiment::Game_log> logs = Experiment::run(*strategy, lex, config, verbose ? &cout : nullptr);
    Experiment::print_summary(cout, logs, entry.name);

    if (!json_path.empty()) {
        std::ofstream out(json_path);
        if (!out) throw std::runtime_error("Could not open " + json_path + " for writing");
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(Experiment::to_json(logs, entry.name, lex, config), &out);
        out << endl;
        cout << "JSON saved to " << json_path << endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    int repetitions = 1;
    int num_games = 0;
    double shock = 0;
    string words;
    string data_dir;
    int length = 5;
    string mode_str;
    int max_guesses = 6;
    uint64_t seed = 0;
    int workers = 0;
    double game_timeout = 5.0;
    int memory_mb = 2048;
    string team;
    string name;
    string json_path;
    string csv_path;
    string experiment;

    po::options_description desc("Run a wordle strategy tournament");
    desc.add_options()
        ("official",      "all 6 canonical rounds ({4,5,6} letters x {uniform,frequency})")
        ("repetitions",   po::value<int>(&repetitions)->default_value(1),        "repetitions of every round")
        ("num-games,n",   po::value<int>(&num_games),                            "secrets per round (default: all words, 10 for --experiment)")
        ("shock",         po::value<double>(&shock)->default_value(0),           "noise on frequency distributions, e.g. 0.05")
        ("words",         po::value<string>(&words),                             "word list (.txt, or .csv with word,count)")
        ("data-dir",      po::value<string>(&data_dir)->default_value("data"),   "where the default word lists live")
        ("length,l",      po::value<int>(&length)->default_value(5),             "word length for custom runs")
        ("mode,m",        po::value<string>(&mode_str)->default_value("uniform"), "uniform, frequency or both")
        ("max-guesses",   po::value<int>(&max_guesses)->default_value(6),        "guesses per game")
        ("seed,s",        po::value<uint64_t>(&seed),                            "master seed (default: random for --official, 42 otherwise)")
        ("vocab-only",    "guesses must be vocabulary words")
        ("workers,w",     po::value<int>(&workers),                              "games played at once (default: min(4, cores))")
        ("game-timeout",  po::value<double>(&game_timeout)->default_value(5.0),  "seconds per game")
        ("memory-mb",     po::value<int>(&memory_mb)->default_value(2048),       "memory cap per game")
        ("team,t",        po::value<string>(&team),                              "only this team's strategy plus the builtins")
        ("name",          po::value<string>(&name),                              "tournament name for the report")
        ("json",          po::value<string>(&json_path),                         "write the report as json")
        ("csv",           po::value<string>(&csv_path),                          "write every game as csv")
        ("list",          "list the registered strategies")
        ("experiment,e",  po::value<string>(&experiment),                        "run one strategy in-process with per-turn output")
        ("verbose,v",     "every turn of every game (with --experiment)")
        ("help,h",        "produce help message");
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        cerr << e.what() << endl << desc << endl;
        return 1;
    }
    if (vm.count("help")) {
        cerr << desc << endl;
        return 1;
    }

    Word::test();
    Feedback::test();

    Strategy::register_builtin_strategies();

    if (vm.count("list")) {
        for (const Strategy::Entry& e : Strategy::Registry::all()) {
            cout << e.name << (e.builtin ? " (builtin)" : "") << endl;
        }
        return 0;
    }

    if (length < Word::min_length || length > Word::max_length) {
        cerr << "--length must be between " << Word::min_length << " and " << Word::max_length << endl;
        return 1;
    }
    if (max_guesses < 1 || repetitions < 1 || game_timeout <= 0 || shock < 0 || shock >= 1) {
        cerr << "--max-guesses, --repetitions and --game-timeout must be positive, --shock in [0, 1)" << endl;
        return 1;
    }
    boost::posix_time::time_duration timeout = boost::posix_time::microseconds((int64_t)(game_timeout * 1e6));

    try {
        if (!experiment.empty()) {
            Experiment::Config config;
            if (vm.count("num-games")) config.num_games = num_games;
            if (vm.count("seed")) config.seed = seed;
            config.max_guesses = max_guesses;
            config.allow_non_words = !vm.count("vocab-only");
            config.game_timeout = timeout;
            return run_experiment(experiment, length, mode_str, words, data_dir, vm.count("verbose") > 0, json_path,
                                  config);
        }

        Tournament::Config config;
        config.name = name;
        config.num_games = num_games;
        config.repetitions = repetitions;
        config.shock = shock;
        config.words_path = words;
        config.data_dir = data_dir;
        config.max_guesses = max_guesses;
        config.allow_non_words = !vm.count("vocab-only");
        if (vm.count("workers")) config.workers = std::max(1, workers);
        config.game_timeout = timeout;
        config.memory_mb = memory_mb;
        config.team = team;

        if (vm.count("official")) {
            config.rounds = Tournament::canonical_rounds();
            config.master_seed = vm.count("seed") ? seed : (((uint64_t)std::random_device()() << 32) | std::random_device()());
        } else {
            config.rounds.clear();
            if (mode_str == "both") {
                config.rounds.push_back(Tournament::Round_spec{length, Mode::uniform});
                config.rounds.push_back(Tournament::Round_spec{length, Mode::frequency});
            } else {
                config.rounds.push_back(Tournament::Round_spec{length, mode_of_string(mode_str)});
            }
            config.master_seed = vm.count("seed") ? seed : 42;
        }

        vector<Strategy::Entry> entries = Strategy::Registry::select(team);
        cout << "Tournament: " << entries.size() << " strategies, " << config.rounds.size() << " round(s) x "
             << config.repetitions << " repetition(s), seed " << config.master_seed << ", " << config.workers
             << " workers, " << game_timeout << "s per game" << endl;

        Isolation::Stop_flag::install();
        Tournament::Report report = Tournament::run(config, entries, Tournament::default_source(config));

        for (const Tournament::Round_result& r : report.rounds) {
            Tournament::print_round_summary(cout, r);
        }
        for (const string& e : report.errors) {
            cout << "Round aborted: " << e << endl;
        }
        Tournament::print_leaderboard(cout, report.leaderboard);
        if (Isolation::Stop_flag::requested()) {
            cout << "Stopped early, incomplete rounds are not in the leaderboard" << endl;
        }

        if (!csv_path.empty()) {
            Tournament::write_csv(report, csv_path);
            cout << "CSV saved to " << csv_path << endl;
        }
        if (!json_path.empty()) {
            Tournament::write_json(report, json_path);
            cout << "JSON saved to " << json_path << endl;
        }
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
