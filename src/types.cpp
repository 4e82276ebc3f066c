/**
 * PvP Battle Simulator - Type Helpers Implementation
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace pvpsim {

namespace {

const std::array<const char*, TYPE_COUNT> TYPE_NAMES = {
    "normal", "fire", "water", "electric", "grass", "ice",
    "fighting", "poison", "ground", "flying", "psychic", "bug",
    "rock", "ghost", "dragon", "dark", "steel", "fairy"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::string to_string(PokemonType type) {
    if (type == PokemonType::NONE) {
        return "none";
    }
    return TYPE_NAMES[type_index(type)];
}

std::string to_string(ActionType type) {
    switch (type) {
        case ActionType::FAST: return "fast";
        case ActionType::CHARGED: return "charged";
        case ActionType::WAIT: return "wait";
        default: return "unknown";
    }
}

std::string to_string(BattleWinner winner) {
    switch (winner) {
        case BattleWinner::PLAYER_0: return "player_0";
        case BattleWinner::PLAYER_1: return "player_1";
        case BattleWinner::DRAW: return "draw";
        default: return "unknown";
    }
}

std::string to_string(DecisionMode mode) {
    switch (mode) {
        case DecisionMode::STRATEGIC: return "strategic";
        case DecisionMode::RANDOM: return "random";
        default: return "unknown";
    }
}

std::optional<PokemonType> parse_pokemon_type(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower.empty() || lower == "none") {
        return PokemonType::NONE;
    }
    for (int i = 0; i < TYPE_COUNT; i++) {
        if (lower == TYPE_NAMES[i]) {
            return static_cast<PokemonType>(i);
        }
    }
    return std::nullopt;
}

std::optional<ShadowType> parse_shadow_type(const std::string& name) {
    static const std::unordered_map<std::string, ShadowType> lookup = {
        {"normal", ShadowType::NORMAL},
        {"shadow", ShadowType::SHADOW},
        {"purified", ShadowType::PURIFIED},
    };
    auto it = lookup.find(to_lower(name));
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<DecisionMode> parse_decision_mode(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "strategic") return DecisionMode::STRATEGIC;
    if (lower == "random") return DecisionMode::RANDOM;
    return std::nullopt;
}

} // namespace pvpsim
