/// @file catalyst.cpp
/// @brief Catalyst construction and validation.

#include "mf/game/catalyst.hpp"

namespace mf::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr int32_t kBonusPerTier = 5;
constexpr int32_t kPowerPerTier = 10;

}  // namespace

int32_t Catalyst::bonusFor(StatAxis axis) const {
    auto it = statBonus.find(axis);
    return it == statBonus.end() ? 0 : it->second;
}

GameResult<void> validateCatalyst(const Catalyst& catalyst) {
    auto fail = [&](const std::string& why) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidCatalyst,
            "catalyst '" + catalyst.id.value() + "': " + why, catalyst.id));
    };
    if (!catalyst.id.isValid()) {
        return fail("missing identifier");
    }
    if (!catalyst.ownerId.isValid()) {
        return fail("missing owner");
    }
    if (catalyst.tier < kMinCatalystTier || catalyst.tier > kMaxCatalystTier) {
        return fail("tier " + std::to_string(catalyst.tier) + " outside I-V");
    }
    if (catalyst.elementalPower < 0) {
        return fail("negative elemental power");
    }
    for (const auto& [axis, bonus] : catalyst.statBonus) {
        if (bonus < 0) {
            return fail(std::string("negative bonus on ") + std::string(toString(axis)));
        }
    }
    return GameResult<void>::ok();
}

GameResult<Catalyst> createCatalyst(foundation::CatalystId id, foundation::PlayerId ownerId,
                                    StoneType type, int32_t tier,
                                    foundation::Timestamp acquiredAt) {
    Catalyst catalyst;
    catalyst.id = std::move(id);
    catalyst.ownerId = std::move(ownerId);
    catalyst.type = type;
    catalyst.tier = tier;
    catalyst.statBonus[stoneFavouredStat(type)] = tier * kBonusPerTier;
    catalyst.elementalPower = tier * kPowerPerTier;
    catalyst.acquiredAt = acquiredAt;

    auto valid = validateCatalyst(catalyst);
    if (!valid) {
        return GameResult<Catalyst>::err(valid.error());
    }
    return GameResult<Catalyst>::ok(std::move(catalyst));
}

std::string tierNumeral(int32_t tier) {
    switch (tier) {
        case 1: return "I";
        case 2: return "II";
        case 3: return "III";
        case 4: return "IV";
        case 5: return "V";
        default: return "?";
    }
}

}  // namespace mf::game
