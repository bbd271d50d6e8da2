#pragma once

/// @file fusion_engine.hpp
/// @brief Entry point combining two creatures and two catalysts.

#include <optional>
#include <string>

#include "mf/foundation/game_result.hpp"
#include "mf/fusion/fusion_signature.hpp"

namespace mf::fusion {

/// Signature plus the creature materialized from it.
struct FusionOutcome {
    FusionSignature signature;
    game::Creature creature;
};

/// Deterministic fusion engine.
///
/// The engine is a pure function of its inputs: it never reads a clock,
/// never touches storage and draws all randomness from the fusion seed.
///
/// Example:
/// @code
///   FusionEngine engine(config.fusion);
///   auto sig = engine.buildSignature(p1, p2, ruby, topaz, request);
///   if (!sig) { return sig.error(); }
///   auto child = FusionEngine::materialize(sig.value(), CreatureId("c-42"));
/// @endcode
class FusionEngine {
public:
    explicit FusionEngine(FusionConfig config = {});

    [[nodiscard]] foundation::GameResult<FusionSignature> buildSignature(
        const game::Creature& parent1, const game::Creature& parent2,
        const game::Catalyst& catalyst1, const game::Catalyst& catalyst2,
        const FusionRequest& request) const;

    /// Build the fused creature described by a signature.
    ///
    /// The name and lore default to generated text when not supplied. The
    /// result is validated before it is returned.
    [[nodiscard]] static foundation::GameResult<game::Creature> materialize(
        const FusionSignature& signature, foundation::CreatureId newCreatureId,
        std::optional<std::string> name = std::nullopt, std::string lore = {});

    /// buildSignature followed by materialize.
    [[nodiscard]] foundation::GameResult<FusionOutcome> fuse(
        const game::Creature& parent1, const game::Creature& parent2,
        const game::Catalyst& catalyst1, const game::Catalyst& catalyst2,
        const FusionRequest& request, foundation::CreatureId newCreatureId) const;

    /// Interaction prefix followed by the base form, e.g. "Steam Salamander".
    [[nodiscard]] static std::string defaultName(const FusionSignature& signature);

    [[nodiscard]] const FusionConfig& config() const noexcept { return builder_.config(); }

private:
    FusionSignatureBuilder builder_;
};

}  // namespace mf::fusion
