/// @file rule_tables.cpp
/// @brief Static rule data.

#include "mf/game/rule_tables.hpp"

#include <array>

namespace mf::game {

namespace {

using Row = std::array<double, kElementCount>;

// Attacker rows, defender columns, in Element declaration order:
// fire, water, earth, lightning, shadow, light, metal, arcane, air, chaos
constexpr std::array<Row, kElementCount> kEffectiveness = {{
    {1.0, 0.5, 1.5, 1.0, 1.0, 1.0, 1.5, 1.0, 1.2, 1.0},  // fire
    {1.5, 1.0, 1.5, 0.5, 1.0, 1.0, 0.8, 1.0, 1.0, 1.0},  // water
    {0.5, 0.5, 1.0, 1.5, 1.0, 1.0, 0.8, 1.0, 1.5, 1.0},  // earth
    {1.0, 1.5, 0.5, 1.0, 1.5, 1.0, 1.5, 1.2, 0.8, 1.0},  // lightning
    {1.0, 1.0, 1.0, 0.5, 1.0, 0.5, 1.0, 1.5, 1.0, 1.2},  // shadow
    {1.0, 1.0, 1.0, 1.0, 1.5, 1.0, 1.0, 1.0, 1.0, 1.5},  // light
    {0.8, 1.2, 1.2, 0.8, 1.0, 1.0, 1.0, 0.8, 1.0, 1.0},  // metal
    {1.0, 1.0, 1.0, 1.2, 1.5, 1.0, 1.2, 1.0, 1.0, 0.8},  // arcane
    {0.8, 1.0, 0.5, 1.2, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0},  // air
    {1.0, 1.0, 1.0, 1.0, 1.2, 0.8, 1.0, 1.2, 1.0, 1.0},  // chaos
}};

constexpr std::array<double, kRarityCount> kRarityCurve = {
    1.00,  // basic
    1.05,  // rare
    1.10,  // super rare
    1.15,  // epic
    1.20,  // legendary
    1.30   // mythic
};

std::vector<ElementInteraction> buildInteractions() {
    using E = Element;
    return {
        {E::Fire, E::Water, "steam",
         {"pressure", "expansion", "heat_transfer", "condensation", "vapor"},
         {"Steam", "Vapor", "Mist", "Fog"},
         {"the Boiler", "the Evaporator", "the Condenser", "the Turbine"},
         "Fire and Water combine into Steam, a force of pressure and expansion.", 1.1},
        {E::Fire, E::Earth, "lava",
         {"molten", "eruption", "solidification", "pressure", "volcanic"},
         {"Magma", "Volcanic", "Molten", "Igneous"},
         {"the Eruptor", "the Forge", "the Caldera", "the Furnace"},
         "Fire and Earth merge into Lava, a destructive force of molten rock.", 1.2},
        {E::Water, E::Earth, "mud",
         {"absorption", "erosion", "solidification", "fertility", "quicksand"},
         {"Mud", "Clay", "Silt", "Mire"},
         {"the Swamp", "the Quagmire", "the Mire", "the Bog"},
         "Water and Earth settle into Mud that swallows and erodes.", 0.9},
        {E::Lightning, E::Water, "storm",
         {"electrocution", "conduction", "turbulence", "discharge", "thunder"},
         {"Storm", "Tempest", "Thunder", "Squall"},
         {"the Conductor", "the Stormbringer", "the Thunderhead", "the Squall"},
         "Lightning through Water becomes a conducting Storm.", 1.15},
        {E::Fire, E::Lightning, "plasma",
         {"ionization", "energy", "explosion", "discharge", "fusion"},
         {"Plasma", "Ion", "Arc", "Bolt"},
         {"the Reactor", "the Arc", "the Ionizer", "the Sunspark"},
         "Fire and Lightning ionize into Plasma.", 1.25},
        {E::Shadow, E::Light, "twilight",
         {"balance", "duality", "transition", "merging", "harmony"},
         {"Twilight", "Dusk", "Dawn", "Equinox"},
         {"the Balanced", "the Between", "the Eclipse", "the Horizon"},
         "Shadow and Light meet at Twilight, a state of balance.", 1.0},
        {E::Fire, E::Shadow, "ash",
         {"corruption", "decay", "smoke", "obscuration", "void"},
         {"Ash", "Ember", "Smoke", "Cinder"},
         {"the Smoldering", "the Veiled", "the Burnt", "the Pyre"},
         "Fire consumed by Shadow leaves only Ash.", 1.1},
        {E::Water, E::Light, "prism",
         {"refraction", "rainbow", "spectrum", "illumination", "clarity"},
         {"Prism", "Rainbow", "Spectrum", "Luminous"},
         {"the Refractor", "the Radiant", "the Spectral", "the Clear"},
         "Light through Water splits into a Prism of colour.", 1.0},
        {E::Earth, E::Lightning, "crystal",
         {"resonance", "amplification", "refraction", "energy", "focus"},
         {"Crystal", "Quartz", "Geode", "Gem"},
         {"the Resonator", "the Focus", "the Lattice", "the Shard"},
         "Lightning crystallizes Earth into resonant Crystal.", 1.0},
        {E::Earth, E::Air, "sandstorm",
         {"abrasion", "erosion", "blinding", "dunes", "scouring"},
         {"Dune", "Grit", "Sirocco", "Dust"},
         {"the Scourer", "the Blinder", "the Drifter", "the Wanderer"},
         "Air lifts Earth into a scouring Sandstorm.", 1.05},
        {E::Lightning, E::Air, "tempest",
         {"wild", "chaos", "growth", "energy", "vitality"},
         {"Wild", "Gale", "Vital", "Cyclone"},
         {"the Untamed", "the Gale", "the Howler", "the Cyclone"},
         "Lightning riding the Air becomes a wild Tempest.", 1.15},
        {E::Shadow, E::Earth, "void",
         {"absorption", "entropy", "decay", "nothingness", "abyss"},
         {"Void", "Abyss", "Null", "Hollow"},
         {"the Devourer", "the Empty", "the Pit", "the Hollow"},
         "Shadow sinks into Earth and opens a Void.", 1.1},
        {E::Light, E::Air, "radiance",
         {"growth", "healing", "purity", "life", "blessing"},
         {"Radiant", "Blessed", "Pure", "Halo"},
         {"the Blessed", "the Dawnwing", "the Pure", "the Halo"},
         "Light carried on the Air spreads as Radiance.", 0.9},
        {E::Metal, E::Fire, "molten",
         {"forging", "tempering", "slag", "heat", "alloy"},
         {"Forge", "Slag", "Tempered", "Crucible"},
         {"the Smelter", "the Anvil", "the Crucible", "the Tempered"},
         "Fire melts Metal into a Molten flow.", 1.15},
        {E::Metal, E::Lightning, "magnetic",
         {"attraction", "repulsion", "field", "polarity", "induction"},
         {"Magneto", "Flux", "Polar", "Coil"},
         {"the Lodestone", "the Coil", "the Dynamo", "the Pole"},
         "Lightning through Metal raises a Magnetic field.", 1.1},
        {E::Arcane, E::Light, "divine",
         {"blessing", "judgement", "sanctity", "revelation", "grace"},
         {"Divine", "Sacred", "Hallowed", "Seraph"},
         {"the Anointed", "the Oracle", "the Hallowed", "the Seraph"},
         "Arcane power lit from within becomes Divine.", 1.1},
        {E::Arcane, E::Chaos, "anomaly",
         {"distortion", "paradox", "glitch", "recursion", "rift"},
         {"Glitch", "Rift", "Paradox", "Null"},
         {"the Anomaly", "the Paradox", "the Error", "the Rift"},
         "Chaos corrupts Arcane order into an Anomaly.", 1.2},
        {E::Chaos, E::Shadow, "entropy",
         {"decay", "unraveling", "erosion", "oblivion", "ruin"},
         {"Entropic", "Ruin", "Decay", "Oblivion"},
         {"the Unraveler", "the Ender", "the Ruin", "the Fading"},
         "Chaos within Shadow drives everything toward Entropy.", 1.2},
    };
}

std::array<FamilyProfile, kFamilyCount> buildFamilyProfiles() {
    auto genome = [](std::string baseForm, std::string head, std::string torso,
                     std::string limbs, std::optional<std::string> wings,
                     std::optional<std::string> tail) {
        VisualGenome g;
        g.baseForm = std::move(baseForm);
        g.head = std::move(head);
        g.torso = std::move(torso);
        g.limbs = std::move(limbs);
        g.wings = std::move(wings);
        g.tail = std::move(tail);
        return g;
    };
    return {{
        {Family::PyroKin, {600, 62, 38, 72}, {"flame", "ember", "scales"},
         {"crimson", "amber"},
         genome("salamander", "horned", "scaled", "clawed", std::nullopt, "flame_tail")},
        {Family::AquaBorn, {680, 50, 46, 66}, {"fins", "bubbles", "wet"},
         {"azure", "teal"},
         genome("serpent", "finned", "sleek", "flippers", std::nullopt, "fin_tail")},
        {Family::TerraForged, {740, 48, 50, 60}, {"stone", "moss", "sturdy"},
         {"umber", "moss"},
         genome("golem", "boulder", "rocky", "pillars", std::nullopt, std::nullopt)},
        {Family::VoltStream, {560, 58, 38, 80}, {"sparks", "static", "quick"},
         {"yellow", "electric_blue"},
         genome("ferret", "antennae", "lean", "nimble", std::nullopt, "bolt_tail")},
        {Family::ShadowVeil, {580, 60, 40, 76}, {"shade", "mist", "eyes"},
         {"violet", "obsidian"},
         genome("wraith", "hooded", "wispy", "trailing", "tattered", std::nullopt)},
        {Family::Lumina, {640, 52, 44, 70}, {"halo", "glow", "feathers"},
         {"gold", "ivory"},
         genome("sprite", "haloed", "radiant", "slender", "feathered", std::nullopt)},
        {Family::SteelWorks, {720, 50, 50, 62}, {"plating", "gears", "rivets"},
         {"steel", "copper"},
         genome("automaton", "visored", "plated", "hydraulic", std::nullopt, std::nullopt)},
        {Family::ArcaneRift, {590, 64, 36, 68}, {"runes", "orbs", "sigils"},
         {"indigo", "magenta"},
         genome("wisp", "crowned", "runic", "floating", std::nullopt, "ribbon_tail")},
        {Family::AeroFlight, {560, 54, 38, 78}, {"wings", "feathers", "breeze"},
         {"sky", "white"},
         genome("falcon", "beaked", "aerodynamic", "talons", "broad", "plumed")},
        {Family::Weirdos, {620, 56, 42, 70}, {"odd", "pixelated", "wobbly"},
         {"neon", "static"},
         genome("blob", "googly", "amorphous", "tendrils", std::nullopt, "stub")},
    }};
}

std::array<DomainSpec, kStoneTypeCount> buildDomains() {
    return {{
        {StoneType::Ruby, "Inferno", DomainKind::ElementDamageBoost, 30.0, Element::Fire,
         "Fire damage dealt by the team increased by 30%."},
        {StoneType::Sapphire, "Tidal", DomainKind::RoundRegen, 5.0, std::nullopt,
         "The team regains 5% of max HP at the end of every round."},
        {StoneType::Emerald, "Growth", DomainKind::EnergyRegen, 20.0, std::nullopt,
         "The team gains 20 energy at the end of every round."},
        {StoneType::Topaz, "Storm", DomainKind::SpeedBoost, 15.0, std::nullopt,
         "Team speed increased by 15%."},
        {StoneType::Amethyst, "Eclipse", DomainKind::ElementVulnerability, 20.0, Element::Shadow,
         "Enemies take 20% more shadow damage."},
        {StoneType::Pearl, "Sanctuary", DomainKind::DamageReduction, 10.0, std::nullopt,
         "The team takes 10% less damage."},
        {StoneType::Onyx, "Bastion", DomainKind::Reflect, 15.0, std::nullopt,
         "15% of damage taken by the team is reflected to the attacker."},
        {StoneType::Opal, "Entropy", DomainKind::DamageBoost, 10.0, std::nullopt,
         "All damage dealt by the team increased by 10%."},
    }};
}

}  // namespace

double elementEffectiveness(Element attacker, Element defender) noexcept {
    auto a = static_cast<std::size_t>(attacker);
    auto d = static_cast<std::size_t>(defender);
    if (a >= kElementCount || d >= kElementCount) {
        return 1.0;
    }
    return kEffectiveness[a][d];
}

const ElementInteraction* findInteraction(Element a, Element b) {
    static const std::vector<ElementInteraction> table = buildInteractions();
    for (const auto& entry : table) {
        if ((entry.first == a && entry.second == b) ||
            (entry.first == b && entry.second == a)) {
            return &entry;
        }
    }
    return nullptr;
}

double rarityStatCurve(Rarity rarity) noexcept {
    auto idx = static_cast<std::size_t>(rarity);
    return idx < kRarityCount ? kRarityCurve[idx] : 1.0;
}

const FamilyProfile& familyProfile(Family family) {
    static const std::array<FamilyProfile, kFamilyCount> profiles = buildFamilyProfiles();
    auto idx = static_cast<std::size_t>(family);
    return profiles[idx < kFamilyCount ? idx : 0];
}

std::string_view toString(DomainKind kind) {
    switch (kind) {
        case DomainKind::ElementDamageBoost:   return "element_damage_boost";
        case DomainKind::RoundRegen:           return "round_regen";
        case DomainKind::EnergyRegen:          return "energy_regen";
        case DomainKind::SpeedBoost:           return "speed_boost";
        case DomainKind::ElementVulnerability: return "element_vulnerability";
        case DomainKind::DamageReduction:      return "damage_reduction";
        case DomainKind::Reflect:              return "reflect";
        case DomainKind::DamageBoost:          return "damage_boost";
    }
    return "unknown";
}

const DomainSpec& domainSpec(StoneType stone) {
    static const std::array<DomainSpec, kStoneTypeCount> domains = buildDomains();
    auto idx = static_cast<std::size_t>(stone);
    return domains[idx < kStoneTypeCount ? idx : 0];
}

}  // namespace mf::game
