/// @file mutation_resolver.cpp
/// @brief MutationResolver implementation.

#include "mf/fusion/mutation_resolver.hpp"

#include <algorithm>
#include <cmath>

#include "mf/foundation/game_logger.hpp"

namespace mf::fusion {

namespace {

constexpr int32_t kHighTier = 4;
constexpr double kSeverityPerTier = 15.0;
constexpr double kSeverityJitter = 20.0;
constexpr int32_t kMaxSeverity = 100;
constexpr int32_t kSeverityPerGlitchLevel = 20;

}  // namespace

std::string_view toString(GlitchSeverity severity) {
    switch (severity) {
        case GlitchSeverity::None:    return "none";
        case GlitchSeverity::Low:     return "low";
        case GlitchSeverity::Medium:  return "medium";
        case GlitchSeverity::High:    return "high";
        case GlitchSeverity::Extreme: return "extreme";
    }
    return "unknown";
}

double MutationResolver::glitchProbability(int32_t tier1, int32_t tier2,
                                           int32_t playerFusionCount, double capPercent) {
    double chance = kBaseChancePercent;
    if (tier1 >= kHighTier) {
        chance += kHighTierBonusPercent;
    }
    if (tier2 >= kHighTier) {
        chance += kHighTierBonusPercent;
    }
    if (tier1 == game::kMaxCatalystTier && tier2 == game::kMaxCatalystTier) {
        chance += kDoubleMaxTierBonusPercent;
    }
    chance += std::min(kPerFusionPercent * std::max(playerFusionCount, 0),
                       kFusionCountCapPercent);
    return std::min(chance, capPercent);
}

MutationResult MutationResolver::resolve(const game::Catalyst& c1, const game::Catalyst& c2,
                                         int32_t playerFusionCount,
                                         const FusionConfig& config,
                                         foundation::SeededRandom& rng) {
    MutationResult out;
    out.probabilityPercent =
        glitchProbability(c1.tier, c2.tier, playerFusionCount, config.glitchCapPercent);
    out.roll = rng.nextDouble() * 100.0;
    out.guaranteed = (c1.glitched && c2.glitched) || isGlitchPair(c1.type, c2.type);
    out.glitched = out.guaranteed || out.roll < out.probabilityPercent;

    if (out.glitched) {
        double maxTier = std::max(c1.tier, c2.tier);
        double raw = kSeverityPerTier * maxTier + kSeverityJitter * rng.nextDouble();
        out.severity = std::min(kMaxSeverity, static_cast<int32_t>(std::floor(raw)));
        out.level = levelFor(out.severity);
        out.multiplier = multiplierFor(out.level);
        out.mutationCount = static_cast<int32_t>(out.level);
        out.traits = traitsFor(out.level);
        MF_LOG_INFO(foundation::LogCategory::Fusion,
                    "glitch triggered (severity " + std::to_string(out.severity) + ", " +
                        std::string(toString(out.level)) + ")");
    }

    out.effectiveElementalPower = static_cast<int32_t>(
        std::lround((c1.elementalPower + c2.elementalPower) * out.multiplier));
    return out;
}

bool MutationResolver::isGlitchPair(game::StoneType a, game::StoneType b) noexcept {
    using game::StoneType;
    auto is = [&](StoneType x, StoneType y) {
        return (a == x && b == y) || (a == y && b == x);
    };
    return is(StoneType::Opal, StoneType::Opal) || is(StoneType::Amethyst, StoneType::Opal) ||
           is(StoneType::Pearl, StoneType::Onyx);
}

game::GlitchProfile MutationResolver::classify(uint64_t seed, int32_t severity) noexcept {
    game::GlitchProfile profile;
    profile.glitchClass = static_cast<game::GlitchClass>((seed >> 56) % game::kGlitchClassCount);
    profile.level = std::clamp(game::kMinGlitchLevel + severity / kSeverityPerGlitchLevel,
                               game::kMinGlitchLevel, game::kMaxGlitchLevel);
    return profile;
}

GlitchSeverity MutationResolver::levelFor(int32_t severity) noexcept {
    if (severity < 30) {
        return GlitchSeverity::Low;
    }
    if (severity < 60) {
        return GlitchSeverity::Medium;
    }
    if (severity < 85) {
        return GlitchSeverity::High;
    }
    return GlitchSeverity::Extreme;
}

double MutationResolver::multiplierFor(GlitchSeverity level) noexcept {
    switch (level) {
        case GlitchSeverity::None:    return 1.0;
        case GlitchSeverity::Low:     return 1.2;
        case GlitchSeverity::Medium:  return 1.5;
        case GlitchSeverity::High:    return 2.0;
        case GlitchSeverity::Extreme: return 3.0;
    }
    return 1.0;
}

std::vector<std::string> MutationResolver::traitsFor(GlitchSeverity level) {
    switch (level) {
        case GlitchSeverity::None:    return {};
        case GlitchSeverity::Low:     return {"glitch"};
        case GlitchSeverity::Medium:  return {"glitch", "flicker"};
        case GlitchSeverity::High:    return {"glitch", "crystalline"};
        case GlitchSeverity::Extreme: return {"glitch", "crystalline", "fractured"};
    }
    return {};
}

game::Catalyst MutationResolver::applyGlitch(const game::Catalyst& catalyst,
                                             const MutationResult& mutation) {
    if (!mutation.glitched) {
        return catalyst;
    }
    game::Catalyst out = catalyst;
    out.glitched = true;
    for (auto& [axis, bonus] : out.statBonus) {
        bonus = static_cast<int32_t>(std::lround(bonus * mutation.multiplier));
    }
    out.elementalPower =
        static_cast<int32_t>(std::lround(catalyst.elementalPower * mutation.multiplier));
    return out;
}

}  // namespace mf::fusion
