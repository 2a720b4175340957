#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the fast travel core.

#include <cstdint>
#include <string_view>

namespace ftr::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // World (0x0100 - 0x01FF)
    WorldQueryFailed = 0x0100,
    NodeNotFound = 0x0101,
    EntityNotFound = 0x0102,
    ComponentNotFound = 0x0103,

    // Physics (0x0200 - 0x02FF)
    PhysicsQueryFailed = 0x0200,

    // Currency (0x0300 - 0x03FF)
    InsufficientFunds = 0x0300,
    CurrencyDetectionFailed = 0x0301,
    CurrencyWriteFailed = 0x0302,
    CurrencyRollbackFailed = 0x0303,

    // Scene (0x0400 - 0x04FF)
    SceneNotFound = 0x0400,
    SceneLoadFailed = 0x0401,
    SceneLoadTimeout = 0x0402,
    InvalidLoadHandle = 0x0403,

    // Travel (0x0500 - 0x05FF)
    TravelInProgress = 0x0500,
    DestinationNotFound = 0x0501,
    MissingCoordinates = 0x0502,
    TravelCancelled = 0x0503,

    // Registry (0x0600 - 0x06FF)
    RegistryLoadFailed = 0x0600,
    RegistrySaveFailed = 0x0601,

    // Config (0x0700 - 0x07FF)
    ConfigLoadFailed = 0x0700,
    ConfigKeyNotFound = 0x0701,
    ConfigTypeMismatch = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "World";
        case 0x0200: return "Physics";
        case 0x0300: return "Currency";
        case 0x0400: return "Scene";
        case 0x0500: return "Travel";
        case 0x0600: return "Registry";
        case 0x0700: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace ftr::foundation
