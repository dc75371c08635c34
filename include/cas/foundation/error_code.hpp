#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the auth service.

#include <cstdint>
#include <string_view>

namespace cas::foundation {

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

    // Storage / system of record (0x0100 - 0x01FF)
    StorageError = 0x0100,
    StorageTimeout = 0x0101,
    RecordNotFound = 0x0102,

    // Cache (0x0200 - 0x02FF)
    CacheUnavailable = 0x0200,
    CacheTimeout = 0x0201,
    CacheCorrupted = 0x0202,

    // Auth (0x0300 - 0x03FF)
    AuthenticationFailed = 0x0300,
    TokenRefreshFailed = 0x0301,
    InvalidToken = 0x0302,
    TokenExpired = 0x0303,
    PermissionDenied = 0x0304,
    RoleNotFound = 0x0305,
    PermissionNotFound = 0x0306,

    // Session (0x0400 - 0x04FF)
    SessionNotFound = 0x0400,
    SessionConflict = 0x0401,
    SecurityViolation = 0x0402,
    SessionInvalidationFailed = 0x0403,

    // Config (0x0500 - 0x05FF)
    ConfigLoadFailed = 0x0500,
    ConfigKeyNotFound = 0x0501,
    ConfigTypeMismatch = 0x0502,

    // Thread (0x0600 - 0x06FF)
    ThreadError = 0x0600,
    JobScheduleFailed = 0x0601,
    JobTimeout = 0x0602,

    // Logger (0x0700 - 0x07FF)
    LoggerError = 0x0700,
    LoggerFlushFailed = 0x0701,

    // External collaborators (0x0800 - 0x08FF)
    GeoLookupFailed = 0x0800,
    AuditPublishFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Storage";
        case 0x0200: return "Cache";
        case 0x0300: return "Auth";
        case 0x0400: return "Session";
        case 0x0500: return "Config";
        case 0x0600: return "Thread";
        case 0x0700: return "Logger";
        case 0x0800: return "External";
        default: return "Unknown";
    }
}

} // namespace cas::foundation
