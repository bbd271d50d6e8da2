/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.

#include "mf/combat/combat_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "effect_pipeline.hpp"
#include "mf/foundation/game_logger.hpp"

namespace mf::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using game::Ability;
using game::StatAxis;

namespace {

GameResult<void> reject(ErrorCode code, std::string message) {
    return GameResult<void>::err(GameError(code, std::move(message)));
}

Participant makeParticipant(const game::Creature& creature, BattleTeam team,
                            BoardPosition position, const CombatConfig& config) {
    Participant p;
    p.creature = creature;
    p.team = team;
    p.position = position;
    p.maxHp = creature.stats.hp;
    p.currentHp = creature.stats.hp;
    p.energy = std::min(config.startingEnergy, config.maxEnergy);
    p.lineage = fusion::LineageAnalyzer::modifiers(creature);
    return p;
}

std::vector<Participant> makeRoster(const std::vector<game::Creature>& creatures,
                                    BattleTeam team, const CombatConfig& config) {
    std::vector<Participant> out;
    out.reserve(creatures.size());
    std::size_t frontCount = (creatures.size() + 1) / 2;
    for (std::size_t i = 0; i < creatures.size(); ++i) {
        out.push_back(makeParticipant(creatures[i], team,
                                      i < frontCount ? BoardPosition::Front : BoardPosition::Back,
                                      config));
    }
    return out;
}

GameResult<void> checkRoster(const std::vector<game::Creature>& creatures,
                             std::string_view label, const CombatConfig& config,
                             std::set<std::string>& seenIds) {
    if (creatures.empty() || static_cast<int32_t>(creatures.size()) > config.maxTeamSize) {
        return reject(ErrorCode::InvalidRoster,
                      std::string(label) + " must have 1-" + std::to_string(config.maxTeamSize) +
                          " creatures, got " + std::to_string(creatures.size()));
    }
    for (const auto& creature : creatures) {
        auto valid = game::validateCreature(creature);
        if (!valid) {
            return reject(ErrorCode::InvalidRoster,
                          std::string(label) + ": " + std::string(valid.error().message()));
        }
        if (!seenIds.insert(creature.id.value()).second) {
            return reject(ErrorCode::InvalidRoster,
                          "creature appears twice in battle: " + creature.id.value());
        }
    }
    return GameResult<void>::ok();
}

bool hasSingleEnemyEffect(const Ability& ability) {
    return std::any_of(ability.effects.begin(), ability.effects.end(), [](const auto& e) {
        return e.target == game::TargetSelector::SingleEnemy;
    });
}

double hpShare(const Participant& p) {
    return p.maxHp > 0 ? static_cast<double>(p.currentHp) / p.maxHp : 0.0;
}

/// Remaining HP and max HP summed over a roster.
std::pair<int64_t, int64_t> hpTotals(const std::vector<Participant>& roster) {
    int64_t current = 0;
    int64_t max = 0;
    for (const auto& p : roster) {
        current += p.currentHp;
        max += p.maxHp;
    }
    return {current, max};
}

void finish(Battle& battle, BattleWinner winner, const std::string& reason) {
    battle.complete = true;
    battle.winner = winner;
    LogEntry entry;
    entry.round = battle.round;
    entry.turn = battle.turn;
    entry.message = "battle complete: " + std::string(toString(winner)) + " (" + reason + ")";
    battle.log.push_back(std::move(entry));

    foundation::LogContext ctx;
    ctx.battleId = battle.id;
    ctx.extra["winner"] = std::string(toString(winner));
    ctx.extra["round"] = std::to_string(battle.round);
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, foundation::LogCategory::Combat,
        "battle complete (" + reason + ")", ctx);
}

/// Completes the battle when a roster has been wiped out.
bool checkWipe(Battle& battle) {
    int32_t alive1 = battle.livingCount(BattleTeam::Team1);
    int32_t alive2 = battle.livingCount(BattleTeam::Team2);
    if (alive1 > 0 && alive2 > 0) {
        return false;
    }
    if (alive1 == 0 && alive2 == 0) {
        finish(battle, BattleWinner::Draw, "mutual defeat");
    } else {
        finish(battle, alive1 > 0 ? BattleWinner::Team1 : BattleWinner::Team2, "roster defeated");
    }
    return true;
}

/// Exact remaining-HP proportion comparison at the round ceiling.
void finishAtCeiling(Battle& battle) {
    auto [hp1, max1] = hpTotals(battle.team1);
    auto [hp2, max2] = hpTotals(battle.team2);
    int64_t lhs = hp1 * max2;
    int64_t rhs = hp2 * max1;
    BattleWinner winner = BattleWinner::Draw;
    if (lhs > rhs) {
        winner = BattleWinner::Team1;
    } else if (rhs > lhs) {
        winner = BattleWinner::Team2;
    }
    finish(battle, winner, "round limit");
}

std::size_t firstLivingFrom(const Battle& battle, std::size_t start) {
    for (std::size_t i = start; i < battle.turnOrder.size(); ++i) {
        const auto* p = battle.find(battle.turnOrder[i]);
        if (p != nullptr && p->isAlive()) {
            return i;
        }
    }
    return battle.turnOrder.size();
}

void closeRound(Battle& battle) {
    LogEntry entry;
    entry.round = battle.round;
    entry.turn = battle.turn;
    entry.results = detail::endOfRound(battle);
    entry.message = "round " + std::to_string(battle.round) + " ends";
    battle.log.push_back(std::move(entry));

    if (checkWipe(battle)) {
        return;
    }
    if (battle.round >= battle.config.maxRounds) {
        finishAtCeiling(battle);
        return;
    }
    ++battle.round;
    battle.turnOrder = CombatResolver::computeTurnOrder(battle);
    battle.currentIndex = firstLivingFrom(battle, 0);
}

void advance(Battle& battle) {
    std::size_t next = firstLivingFrom(battle, battle.currentIndex + 1);
    if (next < battle.turnOrder.size()) {
        battle.currentIndex = next;
        return;
    }
    closeRound(battle);
}

}  // namespace

GameResult<Battle> CombatResolver::createBattle(foundation::BattleId id,
                                                const std::vector<game::Creature>& team1,
                                                const std::vector<game::Creature>& team2,
                                                uint64_t seed, const CombatConfig& config) {
    if (!id.isValid()) {
        return GameResult<Battle>::err(GameError(ErrorCode::InvalidArgument, "battle id is empty"));
    }
    if (config.maxRounds < 1 || config.maxTeamSize < 1 || config.maxEnergy < 0) {
        return GameResult<Battle>::err(
            GameError(ErrorCode::InvalidArgument, "combat config out of range"));
    }

    std::set<std::string> seenIds;
    for (const auto& [roster, label] :
         {std::pair{&team1, std::string_view("team1")}, std::pair{&team2, std::string_view("team2")}}) {
        auto checked = checkRoster(*roster, label, config, seenIds);
        if (!checked) {
            MF_LOG_WARN(foundation::LogCategory::Combat,
                        "battle " + id.value() + " rejected: " + std::string(checked.error().message()));
            return GameResult<Battle>::err(checked.error());
        }
    }

    Battle battle;
    battle.id = std::move(id);
    battle.config = config;
    battle.rng = foundation::SeededRandom(seed);
    battle.team1 = makeRoster(team1, BattleTeam::Team1, config);
    battle.team2 = makeRoster(team2, BattleTeam::Team2, config);

    for (auto* roster : {&battle.team1, &battle.team2}) {
        for (const auto& p : *roster) {
            for (auto& spec : domainsFor(p.creature)) {
                bool duplicate = std::any_of(
                    battle.domains.begin(), battle.domains.end(), [&](const DomainEffect& d) {
                        return d.sourceTeam == p.team && d.spec.stone == spec.stone;
                    });
                if (!duplicate) {
                    battle.domains.push_back(DomainEffect{std::move(spec), p.team, p.id()});
                }
            }
        }
    }

    battle.turnOrder = computeTurnOrder(battle);
    battle.currentIndex = 0;

    LogEntry start;
    start.round = 1;
    start.turn = 0;
    start.message = "battle started: " + std::to_string(team1.size()) + "v" +
                    std::to_string(team2.size()) + ", " +
                    std::to_string(battle.domains.size()) + " domain effect(s)";
    battle.log.push_back(std::move(start));

    foundation::LogContext ctx;
    ctx.battleId = battle.id;
    ctx.extra["seed"] = foundation::seedToHex(seed);
    ctx.extra["domains"] = std::to_string(battle.domains.size());
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, foundation::LogCategory::Combat,
        "battle created " + std::to_string(team1.size()) + "v" + std::to_string(team2.size()), ctx);
    return GameResult<Battle>::ok(std::move(battle));
}

GameResult<void> CombatResolver::validateAction(const Battle& battle, const CombatAction& action) {
    if (battle.complete) {
        return reject(ErrorCode::BattleAlreadyComplete,
                      "battle " + battle.id.value() + " is already complete");
    }
    const auto* actor = battle.find(action.actorId);
    if (actor == nullptr) {
        return reject(ErrorCode::ParticipantNotFound,
                      "no participant " + action.actorId.value() + " in battle");
    }
    if (battle.currentActorId() != action.actorId) {
        return reject(ErrorCode::NotActorsTurn,
                      "it is " + battle.currentActorId().value() + "'s turn, not " +
                          action.actorId.value() + "'s");
    }
    if (action.isPass()) {
        return GameResult<void>::ok();
    }
    if (actor->isIncapacitated()) {
        return reject(ErrorCode::ActorIncapacitated, action.actorId.value() + " cannot act");
    }

    const auto& abilityId = *action.abilityId;
    const auto* ability = actor->creature.findUsableAbility(abilityId);
    if (ability == nullptr) {
        bool passive = std::any_of(actor->creature.passives.begin(), actor->creature.passives.end(),
                                   [&](const Ability& a) { return a.id == abilityId; });
        if (passive) {
            return reject(ErrorCode::AbilityNotUsable, abilityId.value() + " is passive");
        }
        return reject(ErrorCode::AbilityNotFound,
                      action.actorId.value() + " does not know " + abilityId.value());
    }
    bool unbound = actor->hasGlitch(game::GlitchClass::SystemOverride);
    if (int32_t remaining = actor->cooldownFor(abilityId); remaining > 0 && !unbound) {
        return reject(ErrorCode::AbilityOnCooldown,
                      abilityId.value() + " on cooldown for " + std::to_string(remaining) +
                          " more round(s)");
    }
    if (actor->energy < ability->energyCost.value_or(0) && !unbound) {
        return reject(ErrorCode::InsufficientEnergy,
                      abilityId.value() + " needs " + std::to_string(*ability->energyCost) +
                          " energy, have " + std::to_string(actor->energy));
    }

    for (const auto& targetId : action.targetIds) {
        const auto* target = battle.find(targetId);
        if (target == nullptr || !target->isAlive()) {
            return reject(ErrorCode::InvalidTarget, "target " + targetId.value() + " is not alive");
        }
    }
    if (hasSingleEnemyEffect(*ability)) {
        if (action.targetIds.empty()) {
            return reject(ErrorCode::InvalidTarget, abilityId.value() + " needs an enemy target");
        }
        const auto* target = battle.find(action.targetIds.front());
        if (target->team == actor->team) {
            return reject(ErrorCode::InvalidTarget,
                          action.targetIds.front().value() + " is not an enemy");
        }
    }
    return GameResult<void>::ok();
}

GameResult<Battle> CombatResolver::submitAction(const Battle& battle, const CombatAction& action) {
    auto valid = validateAction(battle, action);
    if (!valid) {
        foundation::LogContext ctx;
        ctx.battleId = battle.id;
        ctx.creatureId = action.actorId;
        foundation::GameLogger::instance().logWithContext(
            foundation::LogLevel::Warning, foundation::LogCategory::Combat,
            "action rejected: " + std::string(valid.error().message()), ctx);
        return GameResult<Battle>::err(valid.error());
    }

    Battle next = battle;
    auto* actor = next.find(action.actorId);

    LogEntry entry;
    entry.round = next.round;
    entry.turn = next.turn;
    entry.action = action;

    if (action.isPass()) {
        entry.message = actor->creature.name + " passes";
    } else {
        Ability ability = *actor->creature.findUsableAbility(*action.abilityId);
        if (!actor->hasGlitch(game::GlitchClass::SystemOverride)) {
            actor->energy -= ability.energyCost.value_or(0);
            actor->cooldowns[ability.id.value()] = ability.cooldown.value_or(0);
        }
        entry.results = detail::resolveAbility(next, *actor, ability, action);
        entry.message = actor->creature.name + " uses " + ability.name;
    }
    if (actor->isAlive()) {
        actor->energy = std::min(next.config.maxEnergy, actor->energy + next.config.energyRegen);
    }

    MF_LOG_DEBUG(foundation::LogCategory::Combat,
                 "battle " + next.id.value() + " turn " + std::to_string(next.turn) + ": " +
                     entry.message);
    next.log.push_back(std::move(entry));
    ++next.turn;

    if (!checkWipe(next)) {
        advance(next);
    }
    return GameResult<Battle>::ok(std::move(next));
}

CombatAction CombatResolver::suggestAction(const Battle& battle) {
    const auto& actorId = battle.currentActorId();
    const auto* actor = battle.find(actorId);
    if (battle.complete || actor == nullptr || actor->isIncapacitated()) {
        return CombatAction::pass(actorId);
    }

    std::vector<const Ability*> available;
    for (const auto& ability : actor->creature.actives) {
        if (isAvailable(*actor, ability)) {
            available.push_back(&ability);
        }
    }
    if (actor->creature.ultimate && isAvailable(*actor, *actor->creature.ultimate)) {
        available.push_back(&*actor->creature.ultimate);
    }
    if (available.empty()) {
        return CombatAction::pass(actorId);
    }

    auto magnitude = [](const Ability& ability, game::EffectKind kind) {
        double total = 0.0;
        for (const auto& effect : ability.effects) {
            if (effect.kind() == kind) {
                if (kind == game::EffectKind::Damage) {
                    total += std::get<game::DamageEffect>(effect.payload).power;
                } else if (kind == game::EffectKind::Heal) {
                    total += std::get<game::HealEffect>(effect.payload).power;
                }
            }
        }
        return total;
    };

    const auto& allies = battle.roster(actor->team);
    bool allyHurt = std::any_of(allies.begin(), allies.end(), [](const Participant& p) {
        return p.isAlive() && hpShare(p) < kHealThreshold;
    });

    const Ability* choice = nullptr;
    if (allyHurt) {
        double best = 0.0;
        for (const auto* ability : available) {
            double heal = magnitude(*ability, game::EffectKind::Heal);
            if (heal > best) {
                best = heal;
                choice = ability;
            }
        }
    }
    if (choice == nullptr) {
        double best = -1.0;
        for (const auto* ability : available) {
            double score = magnitude(*ability, game::EffectKind::Damage) *
                           std::max(1, ability->energyCost.value_or(0));
            if (score > best) {
                best = score;
                choice = ability;
            }
        }
    }

    CombatAction action;
    action.actorId = actorId;
    action.abilityId = choice->id;
    if (hasSingleEnemyEffect(*choice)) {
        const Participant* weakest = nullptr;
        for (const auto& enemy : battle.roster(opponentOf(actor->team))) {
            if (!enemy.isAlive()) {
                continue;
            }
            if (weakest == nullptr || enemy.currentHp < weakest->currentHp ||
                (enemy.currentHp == weakest->currentHp && enemy.id() < weakest->id())) {
                weakest = &enemy;
            }
        }
        if (weakest == nullptr) {
            return CombatAction::pass(actorId);
        }
        action.targetIds.push_back(weakest->id());
    }
    return action;
}

int32_t CombatResolver::effectiveStat(const Battle& battle, const Participant& p, StatAxis axis) {
    double base = p.creature.stats.get(axis);
    double percent = 0.0;
    for (const auto& buff : p.buffs) {
        if (buff.axis == axis) {
            percent += buff.percent;
        }
    }
    for (const auto& debuff : p.debuffs) {
        if (debuff.axis == axis) {
            percent -= debuff.percent;
        }
    }
    if (axis == StatAxis::Speed) {
        percent += detail::domainMagnitude(battle, game::DomainKind::SpeedBoost, p.team);
        percent += p.lineage.speedBoostPercent;
    }
    return std::max(0, static_cast<int32_t>(std::lround(base + base * percent / 100.0)));
}

std::vector<foundation::CreatureId> CombatResolver::computeTurnOrder(const Battle& battle) {
    std::vector<std::pair<int32_t, foundation::CreatureId>> keyed;
    for (const auto* roster : {&battle.team1, &battle.team2}) {
        for (const auto& p : *roster) {
            keyed.emplace_back(effectiveStat(battle, p, StatAxis::Speed), p.id());
        }
    }
    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });

    std::vector<foundation::CreatureId> order;
    order.reserve(keyed.size());
    for (auto& [speed, id] : keyed) {
        order.push_back(std::move(id));
    }
    return order;
}

std::vector<game::DomainSpec> CombatResolver::domainsFor(const game::Creature& creature) {
    std::vector<game::DomainSpec> out;
    if (creature.fusionHistory.empty()) {
        return out;
    }
    const auto& latest = creature.fusionHistory.back();
    if (latest.catalyst1Tier != game::kMaxCatalystTier ||
        latest.catalyst2Tier != game::kMaxCatalystTier) {
        return out;
    }
    out.push_back(game::domainSpec(latest.catalyst1Type));
    if (latest.catalyst2Type != latest.catalyst1Type) {
        out.push_back(game::domainSpec(latest.catalyst2Type));
    }
    return out;
}

bool CombatResolver::isAvailable(const Participant& p, const Ability& ability) {
    if (ability.isPassive()) {
        return false;
    }
    if (p.hasGlitch(game::GlitchClass::SystemOverride)) {
        return true;
    }
    return p.cooldownFor(ability.id) == 0 && p.energy >= ability.energyCost.value_or(0);
}

}  // namespace mf::combat
