#pragma once

// How a failed fetch attempt should be handled by the retry loop
enum class FailureType {
    TEMPORARY,    // Retry with exponential backoff
    RATE_LIMITED, // Retry with the longer rate-limit delay
    PERMANENT,    // Don't retry (404, 410, unsupported protocol, ...)
    UNKNOWN       // Retry with caution (half the attempts)
};
