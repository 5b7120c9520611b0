#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the simulation kernel.

#include <cstdint>
#include <string_view>

namespace tsim::foundation {

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

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,
    SystemError = 0x0302,
    CyclicDependency = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    InvalidConfig = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Content (0x0900 - 0x09FF)
    UnknownNeed = 0x0900,
    UnknownBuff = 0x0901,
    UnknownBuilding = 0x0902,
    UnknownTerrain = 0x0903,
    InvalidContentReference = 0x0904,
    DuplicateDefinition = 0x0905,

    // World (0x0A00 - 0x0AFF)
    OutOfBounds = 0x0A00,
    TileOccupied = 0x0A01,
    TileNotBuildable = 0x0A02,
    InvalidWorldBounds = 0x0A03,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Content";
        case 0x0A00: return "World";
        default: return "Unknown";
    }
}

} // namespace tsim::foundation
