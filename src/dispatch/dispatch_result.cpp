#include "egress/types.hpp"

namespace Egress {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ProxyUnavailable: return "proxy_unavailable";
        case ErrorKind::AttemptTimeout: return "attempt_timeout";
        case ErrorKind::AttemptConnectionError: return "attempt_connection_error";
        case ErrorKind::AttemptNonSuccessStatus: return "attempt_non_success_status";
        case ErrorKind::AllAttemptsExhausted: return "all_attempts_exhausted";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "none";
}

}  // namespace Egress
