#pragma once

/// @file types.hpp
/// @brief Strong identifier types for creatures, catalysts, players and battles.

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace mf::foundation {

/// Tag-based strong typedef over an opaque string identifier.
///
/// Store keys are opaque strings; the tag prevents passing a CatalystId
/// where a CreatureId is expected.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
template <typename Tag>
class StrongId {
public:
    StrongId() = default;
    explicit StrongId(std::string value) : value_(std::move(value)) {}
    explicit StrongId(std::string_view value) : value_(value) {}
    explicit StrongId(const char* value) : value_(value) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool isValid() const noexcept { return !value_.empty(); }

    auto operator<=>(const StrongId&) const = default;

private:
    std::string value_;
};

// Tag types for strong IDs
struct CreatureIdTag {};
struct CatalystIdTag {};
struct PlayerIdTag {};
struct BattleIdTag {};
struct AbilityIdTag {};

using CreatureId = StrongId<CreatureIdTag>;
using CatalystId = StrongId<CatalystIdTag>;
using PlayerId = StrongId<PlayerIdTag>;
using BattleId = StrongId<BattleIdTag>;
using AbilityId = StrongId<AbilityIdTag>;

/// Milliseconds since the Unix epoch, always supplied by the caller.
using Timestamp = int64_t;

} // namespace mf::foundation

// Hash support for use in unordered containers.
template <typename Tag>
struct std::hash<mf::foundation::StrongId<Tag>> {
    std::size_t operator()(const mf::foundation::StrongId<Tag>& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};
