#pragma once

/// @file repository.hpp
/// @brief Creature, catalyst and rating persistence interfaces with
///        in-memory implementations.
///
/// Abstracts storage so the host services work with any backend. The
/// engine itself never touches a repository.

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "mf/foundation/types.hpp"
#include "mf/game/catalyst.hpp"
#include "mf/game/creature.hpp"
#include "mf/service/rating_updater.hpp"

namespace mf::service {

/// Abstract interface for creature persistence.
///
/// Implementations must be thread-safe when shared across threads.
class ICreatureRepository {
public:
    virtual ~ICreatureRepository() = default;

    [[nodiscard]] virtual std::optional<game::Creature> findById(
        const foundation::CreatureId& id) const = 0;

    /// Creatures owned by a player, ordered by id.
    [[nodiscard]] virtual std::vector<game::Creature> listByOwner(
        const foundation::PlayerId& owner) const = 0;

    /// Insert or replace by id.
    virtual void save(game::Creature creature) = 0;

    /// Returns false if the creature was not stored.
    virtual bool remove(const foundation::CreatureId& id) = 0;
};

/// Abstract interface for catalyst persistence.
class ICatalystRepository {
public:
    virtual ~ICatalystRepository() = default;

    [[nodiscard]] virtual std::optional<game::Catalyst> findById(
        const foundation::CatalystId& id) const = 0;

    virtual void save(game::Catalyst catalyst) = 0;

    virtual bool remove(const foundation::CatalystId& id) = 0;
};

/// Abstract interface for rating persistence.
class IRatingRepository {
public:
    virtual ~IRatingRepository() = default;

    [[nodiscard]] virtual std::optional<RatingRecord> find(
        const foundation::PlayerId& playerId) const = 0;

    virtual void save(RatingRecord record) = 0;
};

/// Thread-safe in-memory creature repository for tests and the simulator.
class InMemoryCreatureRepository : public ICreatureRepository {
public:
    [[nodiscard]] std::optional<game::Creature> findById(
        const foundation::CreatureId& id) const override;

    [[nodiscard]] std::vector<game::Creature> listByOwner(
        const foundation::PlayerId& owner) const override;

    void save(game::Creature creature) override;

    bool remove(const foundation::CreatureId& id) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<foundation::CreatureId, game::Creature> creatures_;
};

/// Thread-safe in-memory catalyst repository.
class InMemoryCatalystRepository : public ICatalystRepository {
public:
    [[nodiscard]] std::optional<game::Catalyst> findById(
        const foundation::CatalystId& id) const override;

    void save(game::Catalyst catalyst) override;

    bool remove(const foundation::CatalystId& id) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<foundation::CatalystId, game::Catalyst> catalysts_;
};

/// Thread-safe in-memory rating repository.
class InMemoryRatingRepository : public IRatingRepository {
public:
    [[nodiscard]] std::optional<RatingRecord> find(
        const foundation::PlayerId& playerId) const override;

    void save(RatingRecord record) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<foundation::PlayerId, RatingRecord> records_;
};

}  // namespace mf::service
