#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the fusion and battle engines.

#include <cstdint>
#include <string_view>

namespace mf::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    InvalidJsonData = 0x0005,

    // Creature model (0x0100 - 0x01FF)
    InvalidCreature = 0x0100,
    InvalidAbility = 0x0101,
    InvalidCatalyst = 0x0102,
    UnknownTemplate = 0x0103,

    // Fusion (0x0200 - 0x02FF)
    OwnershipViolation = 0x0200,
    DuplicateFusionInput = 0x0201,
    SignatureMismatch = 0x0202,

    // Combat (0x0300 - 0x03FF)
    InvalidRoster = 0x0300,
    BattleAlreadyComplete = 0x0301,
    NotActorsTurn = 0x0302,
    ParticipantNotFound = 0x0303,
    ActorIncapacitated = 0x0304,
    AbilityNotFound = 0x0305,
    AbilityNotUsable = 0x0306,
    AbilityOnCooldown = 0x0307,
    InsufficientEnergy = 0x0308,
    InvalidTarget = 0x0309,
    BattleNotFound = 0x030A,

    // Rating (0x0400 - 0x04FF)
    InvalidRatingRecord = 0x0400,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Creature";
        case 0x0200: return "Fusion";
        case 0x0300: return "Combat";
        case 0x0400: return "Rating";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace mf::foundation
