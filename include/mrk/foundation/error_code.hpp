#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the ranking engine.

#include <cstdint>
#include <string_view>

namespace mrk::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Outcome store (0x0100 - 0x01FF)
    StoreError = 0x0100,
    OutcomeNotFound = 0x0101,
    OutcomeCorrupted = 0x0102,
    InvalidComparisonFilename = 0x0103,
    OutcomeWriteFailed = 0x0104,

    // Rating estimators and rating store (0x0200 - 0x02FF)
    RatingError = 0x0200,
    RatingStoreCorrupted = 0x0201,
    RatingStoreWriteFailed = 0x0202,
    ModelNotFitted = 0x0203,
    RankingsNotComputed = 0x0204,
    InvalidRatingKey = 0x0205,

    // Analysis (0x0300 - 0x03FF)
    AnalysisError = 0x0300,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

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
        case 0x0100: return "Store";
        case 0x0200: return "Rating";
        case 0x0300: return "Analysis";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace mrk::foundation
