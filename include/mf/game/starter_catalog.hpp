#pragma once

/// @file starter_catalog.hpp
/// @brief Starter templates: one generation-0 creature kit per family.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/types.hpp"
#include "mf/game/creature.hpp"

namespace mf::game {

/// Template id for a family's starter, e.g. "pyro_kin_starter".
[[nodiscard]] std::string starterTemplateId(Family family);

/// All starter template ids in family order.
[[nodiscard]] std::vector<std::string> starterTemplateIds();

/// Family for a starter template id, if it names one.
[[nodiscard]] std::optional<Family> starterFamily(std::string_view templateId);

/// The ability kit a family's starter ships with (passives first).
[[nodiscard]] std::vector<Ability> starterAbilities(Family family);

/// Build a Basic-rarity, unfused creature from a starter template.
/// @return The creature, or UnknownTemplate for an unrecognized id.
[[nodiscard]] foundation::GameResult<Creature> createStarter(
    std::string_view templateId, foundation::CreatureId id,
    foundation::PlayerId ownerId, foundation::Timestamp createdAt);

}  // namespace mf::game
