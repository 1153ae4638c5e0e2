#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the admission gateway.

#include <cstdint>
#include <string_view>

namespace agw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the component
/// that produced an error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    InternalError = 0x0005,

    // Quota ledger (0x0100 - 0x01FF)
    QuotaExceeded = 0x0100,
    InvalidRule = 0x0101,
    InvalidCost = 0x0102,

    // Health monitor (0x0200 - 0x02FF)
    UpstreamNotFound = 0x0200,
    UpstreamAlreadyRegistered = 0x0201,
    ProbeFailed = 0x0202,
    MonitorAlreadyRunning = 0x0203,

    // Priority classification and overrides (0x0300 - 0x03FF)
    InvalidContext = 0x0300,
    InvalidOverride = 0x0301,
    OverrideNotFound = 0x0302,

    // Routing (0x0400 - 0x04FF)
    UpstreamUnavailable = 0x0400,
    UpstreamSaturated = 0x0401,
    NoRouteForResource = 0x0402,

    // Admission (0x0500 - 0x05FF)
    UnknownPrincipal = 0x0500,
    InvalidRequest = 0x0501,
    ServerNotStarted = 0x0502,
    ServerAlreadyStarted = 0x0503,
    ListenFailed = 0x0504,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalid = 0x0603,
    ConfigurationMissing = 0x0604,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,
    JobTimeout = 0x0704,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Counter / sample store (0x0900 - 0x09FF)
    StoreUnavailable = 0x0900,
    StoreTimeout = 0x0901,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Quota";
        case 0x0200: return "Health";
        case 0x0300: return "Priority";
        case 0x0400: return "Routing";
        case 0x0500: return "Admission";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Store";
        default: return "Unknown";
    }
}

/// Whether an error is worth one internal retry before being surfaced.
constexpr bool isTransient(ErrorCode code) {
    return code == ErrorCode::StoreUnavailable || code == ErrorCode::StoreTimeout;
}

} // namespace agw::foundation
