/// @file combat_types.cpp
/// @brief Participant and Battle helpers.

#include "mf/combat/combat_types.hpp"

#include <algorithm>

namespace mf::combat {

std::string_view toString(BattleTeam team) {
    return team == BattleTeam::Team1 ? "team1" : "team2";
}

std::string_view toString(BattleWinner winner) {
    switch (winner) {
        case BattleWinner::Team1: return "team1";
        case BattleWinner::Team2: return "team2";
        case BattleWinner::Draw:  return "draw";
    }
    return "unknown";
}

std::string_view toString(BoardPosition position) {
    return position == BoardPosition::Front ? "front" : "back";
}

bool Participant::hasStatus(game::StatusType status) const noexcept {
    return std::any_of(statuses.begin(), statuses.end(),
                       [status](const ActiveStatus& s) { return s.status == status; });
}

bool Participant::isIncapacitated() const noexcept {
    return hasStatus(game::StatusType::Stun) || hasStatus(game::StatusType::Freeze);
}

int32_t Participant::cooldownFor(const foundation::AbilityId& abilityId) const {
    auto it = cooldowns.find(abilityId.value());
    return it == cooldowns.end() ? 0 : it->second;
}

Participant* Battle::find(const foundation::CreatureId& id) {
    for (auto* team : {&team1, &team2}) {
        for (auto& p : *team) {
            if (p.id() == id) {
                return &p;
            }
        }
    }
    return nullptr;
}

const Participant* Battle::find(const foundation::CreatureId& id) const {
    return const_cast<Battle*>(this)->find(id);
}

const foundation::CreatureId& Battle::currentActorId() const {
    static const foundation::CreatureId kNone;
    return currentIndex < turnOrder.size() ? turnOrder[currentIndex] : kNone;
}

int32_t Battle::livingCount(BattleTeam team) const noexcept {
    const auto& members = roster(team);
    return static_cast<int32_t>(std::count_if(members.begin(), members.end(),
                                              [](const Participant& p) { return p.isAlive(); }));
}

}  // namespace mf::combat
