/**
 * PvP Battle Simulator - Combatant Implementation
 */

#include "combatant.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace pvpsim {

// ============================================================================
// CP MULTIPLIER TABLE (levels 1.0 - 51.0 in 0.5 steps)
// ============================================================================

namespace {

const double CPM_VALUES[] = {
    0.0939999967813491, 0.135137430784308, 0.166397869586944, 0.192650914456886,
    0.215732470154762, 0.236572655026622, 0.255720049142837, 0.273530381100769,
    0.290249884128570, 0.306057381335773, 0.321087598800659, 0.335445032295077,
    0.349212676286697, 0.362457748778790, 0.375235587358474, 0.387592411085168,
    0.399567276239395, 0.411193549517250, 0.422500014305114, 0.432926413410414,
    0.443107545375824, 0.453059953871985, 0.462798386812210, 0.472336077786704,
    0.481684952974319, 0.490855810259008, 0.499858438968658, 0.508701756943992,
    0.517393946647644, 0.525942508771329, 0.534354329109191, 0.542635762230353,
    0.550792694091796, 0.558830599438087, 0.566754519939422, 0.574569148039264,
    0.582278907299041, 0.589887911977272, 0.597400009632110, 0.604823657502073,
    0.612157285213470, 0.619404110566050, 0.626567125320434, 0.633649181622743,
    0.640652954578399, 0.647580963301656, 0.654435634613037, 0.661219263506722,
    0.667934000492096, 0.674581899290818, 0.681164920330047, 0.687684905887771,
    0.694143652915954, 0.700542893277978, 0.706884205341339, 0.713169102333341,
    0.719399094581604, 0.725575616972598, 0.731700003147125, 0.734741011137376,
    0.737769484519958, 0.740785574597326, 0.743789434432983, 0.746781208702482,
    0.749761044979095, 0.752729105305821, 0.755685508251190, 0.758630366519684,
    0.761563837528228, 0.764486065255226, 0.767397165298461, 0.770297273971590,
    0.773186504840850, 0.776064945942412, 0.778932750225067, 0.781790064808426,
    0.784636974334716, 0.787473583646825, 0.790300011634826, 0.792803950958807,
    0.795300006866455, 0.797803921486970, 0.800300002098083, 0.802803892322847,
    0.805299997329711, 0.807803863460723, 0.810299992561340, 0.812803834895026,
    0.815299987792968, 0.817803806620319, 0.820299983024597, 0.822803778631297,
    0.825299978256225, 0.827803750922782, 0.830299973487854, 0.832803753381377,
    0.835300028324127, 0.837803755931569, 0.840300023555755, 0.842803729034748,
    0.845300018787384
};

constexpr size_t CPM_COUNT = sizeof(CPM_VALUES) / sizeof(CPM_VALUES[0]);

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

void validate_buff_multiplier(const ChargedMove& move, double multiplier) {
    require(multiplier > 0.0,
            "Charged move " + move.move_id + " has a non-positive buff multiplier");
}

} // anonymous namespace

double cp_multiplier(double level) {
    if (level < MIN_LEVEL || level > MAX_LEVEL) {
        return 0.0;
    }
    double position = (level - MIN_LEVEL) * 2.0;
    size_t lower = static_cast<size_t>(std::floor(position));
    if (lower + 1 >= CPM_COUNT) {
        return CPM_VALUES[CPM_COUNT - 1];
    }
    double frac = position - static_cast<double>(lower);
    return CPM_VALUES[lower] + (CPM_VALUES[lower + 1] - CPM_VALUES[lower]) * frac;
}

// ============================================================================
// CONSTRUCTION / VALIDATION
// ============================================================================

Combatant::Combatant(SpeciesID species, Stats base, std::array<PokemonType, 2> combatant_types,
                     FastMove fast, std::vector<ChargedMove> charged,
                     IVs combatant_ivs, double combatant_level, ShadowType shadow)
    : species_id(std::move(species))
    , base_stats(base)
    , types(combatant_types)
    , ivs(combatant_ivs)
    , level(combatant_level)
    , shadow_type(shadow)
    , fast_move(std::move(fast))
    , charged_moves(std::move(charged))
{
    name = species_id;
    validate_configuration();
    reset(DEFAULT_SHIELDS, 0);
}

void Combatant::validate_configuration() const {
    require(!species_id.empty(), "Combatant has no species id");
    require(base_stats.atk > 0.0 && base_stats.def > 0.0 && base_stats.hp > 0.0,
            "Combatant " + species_id + " has non-positive base stats");
    require(types[0] != PokemonType::NONE, "Combatant " + species_id + " has no primary type");

    for (int iv : {ivs.atk, ivs.def, ivs.hp}) {
        require(iv >= 0 && iv <= MAX_IV,
                "Combatant " + species_id + " has an IV outside 0-15");
    }
    require(level >= MIN_LEVEL && level <= MAX_LEVEL,
            "Combatant " + species_id + " has a level outside 1-51");

    require(!fast_move.move_id.empty(), "Combatant " + species_id + " has no fast move");
    require(fast_move.turns >= 1,
            "Fast move " + fast_move.move_id + " must last at least one turn");
    require(fast_move.power >= 0 && fast_move.energy_gain >= 0,
            "Fast move " + fast_move.move_id + " has negative power or energy");

    require(charged_moves.size() <= MAX_CHARGED_MOVES,
            "Combatant " + species_id + " has more than two charged moves");
    for (const auto& move : charged_moves) {
        require(!move.move_id.empty(), "Combatant " + species_id + " has an unnamed charged move");
        require(move.power >= 0, "Charged move " + move.move_id + " has negative power");
        require(move.energy_cost >= 0 && move.energy_cost <= MAX_ENERGY,
                "Charged move " + move.move_id + " has an energy cost outside 0-100");
        require(move.buff_chance >= 0.0 && move.buff_chance <= 1.0,
                "Charged move " + move.move_id + " has a buff chance outside 0-1");
        validate_buff_multiplier(move, move.buffs[0]);
        validate_buff_multiplier(move, move.buffs[1]);
    }
}

void Combatant::validate() const {
    validate_configuration();

    require(current_hp >= 0 && current_hp <= max_hp(),
            "Combatant " + species_id + " has health outside 0-max");
    require(energy >= 0 && energy <= MAX_ENERGY,
            "Combatant " + species_id + " has energy outside 0-100");
    require(shields >= 0, "Combatant " + species_id + " has negative shields");
    require(cooldown >= 0, "Combatant " + species_id + " has a negative cooldown");
    for (int stage : stat_buffs) {
        require(stage >= MIN_BUFF_STAGE && stage <= MAX_BUFF_STAGE,
                "Combatant " + species_id + " has a buff stage outside [-4, 4]");
    }
}

void Combatant::reset(int starting_shields, int starting_energy) {
    current_hp = max_hp();
    energy = starting_energy;
    shields = starting_shields;
    stat_buffs = {0, 0};
    cooldown = 0;
}

// ============================================================================
// DERIVED STATS
// ============================================================================

Stats Combatant::calculate_stats() const {
    double cpm = cp_multiplier(level);
    double atk_mult = shadow_type == ShadowType::SHADOW ? SHADOW_ATK_MULTIPLIER : 1.0;
    double def_mult = shadow_type == ShadowType::SHADOW ? SHADOW_DEF_MULTIPLIER : 1.0;

    Stats stats;
    stats.atk = (base_stats.atk + ivs.atk) * cpm * atk_mult;
    stats.def = (base_stats.def + ivs.def) * cpm * def_mult;
    stats.hp = std::max(10.0, std::floor((base_stats.hp + ivs.hp) * cpm));
    return stats;
}

int Combatant::max_hp() const {
    return static_cast<int>(calculate_stats().hp);
}

int Combatant::calculate_cp() const {
    double cpm = cp_multiplier(level);
    double atk_mult = shadow_type == ShadowType::SHADOW ? SHADOW_ATK_MULTIPLIER : 1.0;
    double def_mult = shadow_type == ShadowType::SHADOW ? SHADOW_DEF_MULTIPLIER : 1.0;

    double atk = (base_stats.atk + ivs.atk) * atk_mult;
    double def = (base_stats.def + ivs.def) * def_mult;
    double hp = base_stats.hp + ivs.hp;

    int cp = static_cast<int>(std::floor(atk * std::sqrt(def) * std::sqrt(hp) * cpm * cpm / 10.0));
    return std::max(10, cp);
}

double Combatant::hp_ratio() const {
    int max = max_hp();
    if (max <= 0) return 0.0;
    return static_cast<double>(current_hp) / max;
}

// ============================================================================
// MOVE QUERIES / STATE UPDATES
// ============================================================================

std::optional<size_t> Combatant::cheapest_move_index() const {
    std::optional<size_t> best;
    for (size_t i = 0; i < charged_moves.size(); i++) {
        if (!best || charged_moves[i].energy_cost < charged_moves[*best].energy_cost) {
            best = i;
        }
    }
    return best;
}

std::optional<size_t> Combatant::most_expensive_move_index() const {
    std::optional<size_t> best;
    for (size_t i = 0; i < charged_moves.size(); i++) {
        if (!best || charged_moves[i].energy_cost > charged_moves[*best].energy_cost) {
            best = i;
        }
    }
    return best;
}

void Combatant::gain_energy(int amount) {
    energy = std::min(MAX_ENERGY, energy + amount);
}

void Combatant::apply_stage_delta(int attack_delta, int defense_delta) {
    stat_buffs[0] = clamp_stage(stat_buffs[0] + attack_delta);
    stat_buffs[1] = clamp_stage(stat_buffs[1] + defense_delta);
}

void Combatant::take_damage(int damage) {
    current_hp = std::max(0, current_hp - damage);
}

} // namespace pvpsim
