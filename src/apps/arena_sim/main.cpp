/// @file main.cpp
/// @brief Arena simulator entry point.
///
/// Seeds two players with starters and catalysts, fuses a creature for the
/// first player, then plays an automated battle through the battle host and
/// settles both players' ratings.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "mf/foundation/config_manager.hpp"
#include "mf/foundation/seeded_random.hpp"
#include "mf/game/catalyst.hpp"
#include "mf/game/starter_catalog.hpp"
#include "mf/service/battle_host.hpp"
#include "mf/service/engine_config.hpp"
#include "mf/service/fusion_service.hpp"
#include "mf/version.hpp"

namespace {

using mf::foundation::BattleId;
using mf::foundation::CatalystId;
using mf::foundation::CreatureId;
using mf::foundation::PlayerId;
using mf::foundation::Timestamp;

constexpr Timestamp kSimulationStart = 1'700'000'000'000;

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

mf::foundation::GameResult<void> loadConfig(mf::foundation::ConfigManager& config,
                                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("MF_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }
    return config.load(configPath);
}

/// Store a starter for a player, returning its id.
mf::foundation::GameResult<CreatureId> seedStarter(mf::service::ICreatureRepository& repo,
                                                   mf::game::Family family,
                                                   const PlayerId& owner) {
    CreatureId id(owner.value() + "-" + std::string(mf::game::toString(family)));
    auto starter = mf::game::createStarter(mf::game::starterTemplateId(family), id, owner,
                                           kSimulationStart);
    if (!starter) {
        return mf::foundation::GameResult<CreatureId>::err(starter.error());
    }
    repo.save(std::move(starter).value());
    return mf::foundation::GameResult<CreatureId>::ok(id);
}

mf::foundation::GameResult<CatalystId> seedCatalyst(mf::service::ICatalystRepository& repo,
                                                    mf::game::StoneType type, int32_t tier,
                                                    const PlayerId& owner) {
    CatalystId id(owner.value() + "-" + std::string(mf::game::toString(type)));
    auto catalyst = mf::game::createCatalyst(id, owner, type, tier, kSimulationStart);
    if (!catalyst) {
        return mf::foundation::GameResult<CatalystId>::err(catalyst.error());
    }
    repo.save(std::move(catalyst).value());
    return mf::foundation::GameResult<CatalystId>::ok(id);
}

void printBattleSummary(const mf::combat::Battle& battle) {
    std::cout << "Battle " << battle.id.value() << " finished in round " << battle.round
              << " after " << (battle.turn - 1) << " actions\n";
    for (const auto& entry : battle.log) {
        if (entry.message.empty()) {
            continue;
        }
        std::cout << "  [r" << entry.round << " t" << entry.turn << "] " << entry.message << "\n";
    }
    if (battle.winner) {
        std::cout << "Winner: " << mf::combat::toString(*battle.winner) << "\n";
    }
}

void printRating(const mf::service::RatingRecord& record) {
    std::cout << "  " << record.playerId.value() << ": " << record.rating << " ("
              << mf::service::toString(mf::service::RatingUpdater::divisionFor(record.rating))
              << ", " << record.wins << "W/" << record.losses << "L/" << record.draws << "D)\n";
}

int fail(std::string_view what, const mf::foundation::GameError& error) {
    std::cerr << what << ": " << error.message() << "\n";
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace mf;

    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/engine.yaml";
    }

    foundation::ConfigManager config;
    auto loadResult = loadConfig(config, configPath);
    if (!loadResult) {
        return fail("Failed to load config", loadResult.error());
    }
    auto engineConfig = service::loadEngineConfig(config);
    if (!engineConfig) {
        return fail("Invalid engine config", engineConfig.error());
    }
    const auto& cfg = engineConfig.value();

    std::cout << "Monster Forge arena sim " << MF_VERSION_STRING << "\n";

    service::InMemoryCreatureRepository creatures;
    service::InMemoryCatalystRepository catalysts;
    service::InMemoryRatingRepository ratings;

    PlayerId alice("alice");
    PlayerId bob("bob");

    // ── Inventory ───────────────────────────────────────────────────────
    auto p1 = seedStarter(creatures, game::Family::PyroKin, alice);
    auto p2 = seedStarter(creatures, game::Family::AquaBorn, alice);
    auto c1 = seedCatalyst(catalysts, game::StoneType::Ruby, 5, alice);
    auto c2 = seedCatalyst(catalysts, game::StoneType::Sapphire, 5, alice);
    auto b1 = seedStarter(creatures, game::Family::TerraForged, bob);
    auto b2 = seedStarter(creatures, game::Family::VoltStream, bob);
    for (const auto* seeded : {&p1, &p2, &b1, &b2}) {
        if (!*seeded) {
            return fail("Failed to create starter", seeded->error());
        }
    }
    for (const auto* seeded : {&c1, &c2}) {
        if (!*seeded) {
            return fail("Failed to create catalyst", seeded->error());
        }
    }

    // ── Fusion ──────────────────────────────────────────────────────────
    service::FusionService fusionService(creatures, catalysts, cfg.fusion);
    service::FusionOrder order;
    order.playerId = alice;
    order.parent1 = p1.value();
    order.parent2 = p2.value();
    order.catalyst1 = c1.value();
    order.catalyst2 = c2.value();
    order.timestamp = kSimulationStart + 60'000;
    order.intent = "steam";

    auto fused = fusionService.fuse(order);
    if (!fused) {
        return fail("Fusion failed", fused.error());
    }
    const auto& outcome = fused.value();
    std::cout << "Fused " << outcome.creature.name << " (" << outcome.creature.id.value()
              << ")\n"
              << fusion::toJson(outcome.signature) << "\n";

    // ── Battle ──────────────────────────────────────────────────────────
    service::BattleHost host(ratings, cfg.combat, cfg.rating);
    BattleId battleId("arena-" + outcome.signature.fusionSeed);
    auto seed = foundation::stableHash64({battleId.value()});

    std::vector<game::Creature> team1 = creatures.listByOwner(alice);
    std::vector<game::Creature> team2 = creatures.listByOwner(bob);
    auto started = host.startBattle(battleId, team1, team2, seed);
    if (!started) {
        return fail("Failed to start battle", started.error());
    }

    auto finished = host.runToCompletion(battleId);
    if (!finished) {
        return fail("Battle aborted", finished.error());
    }
    printBattleSummary(finished.value());

    // ── Ratings ─────────────────────────────────────────────────────────
    auto settled = host.settle(battleId, alice, bob, order.timestamp + 600'000);
    if (!settled) {
        return fail("Failed to settle ratings", settled.error());
    }
    std::cout << "Ratings:\n";
    printRating(settled.value().team1);
    printRating(settled.value().team2);
    return EXIT_SUCCESS;
}
