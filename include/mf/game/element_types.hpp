#pragma once

/// @file element_types.hpp
/// @brief Elements, families, rarity tiers, catalyst types and stat axes.

#include <array>
#include <cstdint>
#include <string_view>

namespace mf::game {

/// Elemental affinity used by damage and interaction tables.
enum class Element : uint8_t {
    Fire,
    Water,
    Earth,
    Lightning,
    Shadow,
    Light,
    Metal,
    Arcane,
    Air,
    Chaos
};

inline constexpr std::size_t kElementCount = 10;

/// Thematic creature family. Each family has one primary element.
enum class Family : uint8_t {
    PyroKin,
    AquaBorn,
    TerraForged,
    VoltStream,
    ShadowVeil,
    Lumina,
    SteelWorks,
    ArcaneRift,
    AeroFlight,
    Weirdos
};

inline constexpr std::size_t kFamilyCount = 10;

/// Ordinal rarity tier.
enum class Rarity : uint8_t {
    Basic = 0,
    Rare = 1,
    SuperRare = 2,
    Epic = 3,
    Legendary = 4,
    Mythic = 5
};

inline constexpr std::size_t kRarityCount = 6;

/// Catalyst (stone) kinds.
enum class StoneType : uint8_t {
    Ruby,
    Sapphire,
    Emerald,
    Topaz,
    Amethyst,
    Pearl,
    Onyx,
    Opal
};

inline constexpr std::size_t kStoneTypeCount = 8;

/// Catalyst tier bounds (I..V).
inline constexpr int32_t kMinCatalystTier = 1;
inline constexpr int32_t kMaxCatalystTier = 5;

/// Stat block axes, also used by buffs, debuffs and effect scaling.
enum class StatAxis : uint8_t {
    Hp,
    Attack,
    Defense,
    Speed
};

inline constexpr std::size_t kStatAxisCount = 4;

constexpr std::string_view toString(Element e) {
    constexpr std::array<std::string_view, kElementCount> names = {
        "fire", "water", "earth", "lightning", "shadow",
        "light", "metal", "arcane", "air", "chaos"};
    auto idx = static_cast<std::size_t>(e);
    return idx < kElementCount ? names[idx] : "unknown";
}

constexpr std::string_view toString(Family f) {
    constexpr std::array<std::string_view, kFamilyCount> names = {
        "pyro_kin", "aqua_born", "terra_forged", "volt_stream", "shadow_veil",
        "lumina", "steel_works", "arcane_rift", "aero_flight", "weirdos"};
    auto idx = static_cast<std::size_t>(f);
    return idx < kFamilyCount ? names[idx] : "unknown";
}

constexpr std::string_view toString(Rarity r) {
    constexpr std::array<std::string_view, kRarityCount> names = {
        "basic", "rare", "super_rare", "epic", "legendary", "mythic"};
    auto idx = static_cast<std::size_t>(r);
    return idx < kRarityCount ? names[idx] : "unknown";
}

constexpr std::string_view toString(StoneType s) {
    constexpr std::array<std::string_view, kStoneTypeCount> names = {
        "ruby", "sapphire", "emerald", "topaz", "amethyst", "pearl", "onyx", "opal"};
    auto idx = static_cast<std::size_t>(s);
    return idx < kStoneTypeCount ? names[idx] : "unknown";
}

constexpr std::string_view toString(StatAxis a) {
    switch (a) {
        case StatAxis::Hp:      return "hp";
        case StatAxis::Attack:  return "attack";
        case StatAxis::Defense: return "defense";
        case StatAxis::Speed:   return "speed";
    }
    return "unknown";
}

/// Primary element of a family.
constexpr Element familyElement(Family f) {
    // Families and elements are declared in matching order.
    return static_cast<Element>(static_cast<uint8_t>(f));
}

constexpr Element stoneElement(StoneType s) {
    switch (s) {
        case StoneType::Ruby:     return Element::Fire;
        case StoneType::Sapphire: return Element::Water;
        case StoneType::Emerald:  return Element::Earth;
        case StoneType::Topaz:    return Element::Lightning;
        case StoneType::Amethyst: return Element::Shadow;
        case StoneType::Pearl:    return Element::Light;
        case StoneType::Onyx:     return Element::Metal;
        case StoneType::Opal:     return Element::Chaos;
    }
    return Element::Chaos;
}

/// Stat a stone of this type reinforces.
constexpr StatAxis stoneFavouredStat(StoneType s) {
    switch (s) {
        case StoneType::Ruby:
        case StoneType::Amethyst:
            return StatAxis::Attack;
        case StoneType::Sapphire:
        case StoneType::Pearl:
            return StatAxis::Hp;
        case StoneType::Emerald:
        case StoneType::Onyx:
            return StatAxis::Defense;
        case StoneType::Topaz:
        case StoneType::Opal:
            return StatAxis::Speed;
    }
    return StatAxis::Attack;
}

/// Raise a rarity by the given number of steps, clamped at Mythic.
constexpr Rarity promoteRarity(Rarity base, int32_t steps) {
    int32_t value = static_cast<int32_t>(base) + (steps > 0 ? steps : 0);
    constexpr auto top = static_cast<int32_t>(Rarity::Mythic);
    return static_cast<Rarity>(value > top ? top : value);
}

}  // namespace mf::game
