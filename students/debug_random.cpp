/* A user strategy that only exists to check that user registration works: a random
   consistent candidate, like the builtin Random. */

#include <random>
#include <memory>
#include "strategy.hpp"
#include "filter.hpp"

namespace {
    class Random_debug : public Strategy::Strategy_intf {
    public:
        Random_debug(uint64_t seed) : rng(seed), name_str("Random_debug") {}

        virtual const std::string& name() const { return name_str; }

        virtual void begin_game(const Strategy::GameConfig& config) {
            vocabulary = config.vocabulary;
        }

        virtual std::string guess(const Strategy::History& history) {
            std::vector<Word> candidates = Filter::apply_history(*vocabulary, history);
            if (candidates.empty()) return (*vocabulary)[0].to_string();
            std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
            return candidates[pick(rng)].to_string();
        }
    private:
        std::mt19937_64 rng;
        std::string name_str;
        std::shared_ptr<const std::vector<Word>> vocabulary;
    };

    Strategy::Registration registration("Random_debug", false, [] (uint64_t seed) {
            return std::unique_ptr<Strategy::Strategy_intf>(new Random_debug(seed));
        });
}
