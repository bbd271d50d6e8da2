/// @file repository.cpp
/// @brief In-memory repository implementations.

#include "mf/service/repository.hpp"

#include <algorithm>

namespace mf::service {

// ── InMemoryCreatureRepository ──────────────────────────────────────────

std::optional<game::Creature> InMemoryCreatureRepository::findById(
    const foundation::CreatureId& id) const {
    std::lock_guard lock(mutex_);
    auto it = creatures_.find(id);
    if (it == creatures_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<game::Creature> InMemoryCreatureRepository::listByOwner(
    const foundation::PlayerId& owner) const {
    std::vector<game::Creature> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, creature] : creatures_) {
            if (creature.ownerId == owner) {
                out.push_back(creature);
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const game::Creature& a, const game::Creature& b) { return a.id < b.id; });
    return out;
}

void InMemoryCreatureRepository::save(game::Creature creature) {
    std::lock_guard lock(mutex_);
    auto id = creature.id;
    creatures_.insert_or_assign(std::move(id), std::move(creature));
}

bool InMemoryCreatureRepository::remove(const foundation::CreatureId& id) {
    std::lock_guard lock(mutex_);
    return creatures_.erase(id) > 0;
}

std::size_t InMemoryCreatureRepository::size() const {
    std::lock_guard lock(mutex_);
    return creatures_.size();
}

// ── InMemoryCatalystRepository ──────────────────────────────────────────

std::optional<game::Catalyst> InMemoryCatalystRepository::findById(
    const foundation::CatalystId& id) const {
    std::lock_guard lock(mutex_);
    auto it = catalysts_.find(id);
    if (it == catalysts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryCatalystRepository::save(game::Catalyst catalyst) {
    std::lock_guard lock(mutex_);
    auto id = catalyst.id;
    catalysts_.insert_or_assign(std::move(id), std::move(catalyst));
}

bool InMemoryCatalystRepository::remove(const foundation::CatalystId& id) {
    std::lock_guard lock(mutex_);
    return catalysts_.erase(id) > 0;
}

// ── InMemoryRatingRepository ────────────────────────────────────────────

std::optional<RatingRecord> InMemoryRatingRepository::find(
    const foundation::PlayerId& playerId) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(playerId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRatingRepository::save(RatingRecord record) {
    std::lock_guard lock(mutex_);
    auto id = record.playerId;
    records_.insert_or_assign(std::move(id), std::move(record));
}

}  // namespace mf::service
