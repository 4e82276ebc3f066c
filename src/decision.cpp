/**
 * PvP Battle Simulator - Weighted Decision Selection Implementation
 */

#include "decision.hpp"
#include <algorithm>
#include <stdexcept>

namespace pvpsim {

size_t choose_option_index(const std::vector<DecisionOption>& options, Rng& rng) {
    if (options.empty()) {
        throw std::invalid_argument("choose_option called with no options");
    }

    double total = 0.0;
    for (const auto& option : options) {
        total += std::max(option.weight, 0.0);
    }

    if (total <= 0.0) {
        return 0;
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double draw = dist(rng);

    double cumulative = 0.0;
    size_t last_positive = 0;
    for (size_t i = 0; i < options.size(); i++) {
        double weight = std::max(options[i].weight, 0.0);
        if (weight <= 0.0) continue;
        cumulative += weight;
        last_positive = i;
        if (draw < cumulative) {
            return i;
        }
    }

    // Floating point rounding can leave draw == total
    return last_positive;
}

const DecisionOption& choose_option(const std::vector<DecisionOption>& options, Rng& rng) {
    return options[choose_option_index(options, rng)];
}

bool roll_chance(double chance, Rng& rng) {
    if (chance >= 1.0) return true;
    if (chance <= 0.0) return false;
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < chance;
}

} // namespace pvpsim
