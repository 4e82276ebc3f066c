/**
 * PvP Battle Simulator - Weighted Decision Selection
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace pvpsim {

/**
 * One candidate in a weighted choice.
 *
 * move_index refers to the deciding combatant's charged move list when the
 * option is a charged move.
 */
struct DecisionOption {
    std::string name;
    double weight = 0.0;
    std::optional<size_t> move_index;

    DecisionOption() = default;

    DecisionOption(std::string option_name, double option_weight,
                   std::optional<size_t> index = std::nullopt)
        : name(std::move(option_name))
        , weight(option_weight)
        , move_index(index)
    {}
};

/**
 * Weighted sampling: draw uniformly in [0, total) and walk the cumulative sum.
 *
 * Returns the index of the chosen option. A zero total always returns 0.
 * Negative weights count as zero.
 *
 * @throws std::invalid_argument if options is empty
 */
size_t choose_option_index(const std::vector<DecisionOption>& options, Rng& rng);

const DecisionOption& choose_option(const std::vector<DecisionOption>& options, Rng& rng);

/** Bernoulli draw used for buff triggers. 1.0 always fires, 0.0 never does. */
bool roll_chance(double chance, Rng& rng);

} // namespace pvpsim
