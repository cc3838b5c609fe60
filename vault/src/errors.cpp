#include "errors.hpp"

std::string error_kind_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Invariant: return "invariant_violation";
        case ErrorKind::InsufficientState: return "insufficient_state";
        case ErrorKind::ExternalFailure: return "external_failure";
        case ErrorKind::AccessDenied: return "access_denied";
        case ErrorKind::Reentrancy: return "reentrancy";
        case ErrorKind::Paused: return "paused";
        default: return "unknown";
    }
}
