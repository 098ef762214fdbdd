#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace Egress {

enum class ErrorKind {
    None,
    ProxyUnavailable,
    AttemptTimeout,
    AttemptConnectionError,
    AttemptNonSuccessStatus,
    AllAttemptsExhausted,
    Cancelled
};

const char* to_string(ErrorKind kind);

/**
 * @brief Terminal value of one dispatch call.
 *
 * On failure `error_kind` is AllAttemptsExhausted or Cancelled and `last_cause`
 * carries the kind of the last attempt that ran. `degraded` is set when the
 * pool had no selectable proxy at some point during the call.
 */
struct DispatchResult {
    bool        success     = false;
    long        status_code = 0;
    std::string body;
    ErrorKind   error_kind = ErrorKind::None;
    ErrorKind   last_cause = ErrorKind::None;
    std::string error;
    int         attempts = 0;
    std::string proxy;  // Empty when the result came from the direct attempt
    bool        direct   = false;
    bool        degraded = false;
};

struct PoolStats {
    std::size_t   total_candidates    = 0;
    std::size_t   working_count       = 0;
    std::size_t   failed_count        = 0;
    std::size_t   untested_count      = 0;
    std::uint64_t total_attempts      = 0;
    std::uint64_t successful_attempts = 0;
    std::uint64_t failed_attempts     = 0;
};

struct DispatchCounters {
    std::uint64_t requests        = 0;
    std::uint64_t attempts        = 0;
    std::uint64_t successful      = 0;
    std::uint64_t failed          = 0;
    std::uint64_t direct_attempts = 0;
};

struct GatewayStats {
    PoolStats        pool;
    DispatchCounters dispatch;
    std::uint64_t    uptime_seconds = 0;
    double           proxy_health   = 0.0;  // working / total * 100
    std::string      status;                // "healthy" or "degraded"
};

}  // namespace Egress
