#pragma once

/// @file catalyst.hpp
/// @brief Catalyst (stone) value consumed in pairs by fusion.

#include <cstdint>
#include <map>
#include <string>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/game_serializer.hpp"
#include "mf/foundation/types.hpp"
#include "mf/game/element_types.hpp"

namespace mf::game {

struct Catalyst {
    foundation::CatalystId id;
    foundation::PlayerId ownerId;
    StoneType type = StoneType::Ruby;
    int32_t tier = kMinCatalystTier;
    std::map<StatAxis, int32_t> statBonus;  ///< Sparse.
    int32_t elementalPower = 0;
    bool glitched = false;
    foundation::Timestamp acquiredAt = 0;

    [[nodiscard]] Element element() const noexcept { return stoneElement(type); }

    /// Only tier-V catalysts can unlock domain effects.
    [[nodiscard]] bool isDomainTier() const noexcept { return tier == kMaxCatalystTier; }

    [[nodiscard]] int32_t bonusFor(StatAxis axis) const;
};

[[nodiscard]] foundation::GameResult<void> validateCatalyst(const Catalyst& catalyst);

/// Build a freshly acquired catalyst with the standard bonus for its tier:
/// +5 per tier on the type's favoured stat, elemental power 10 per tier.
[[nodiscard]] foundation::GameResult<Catalyst> createCatalyst(
    foundation::CatalystId id, foundation::PlayerId ownerId, StoneType type,
    int32_t tier, foundation::Timestamp acquiredAt);

/// Roman numeral for a tier in 1..5.
[[nodiscard]] std::string tierNumeral(int32_t tier);

}  // namespace mf::game
