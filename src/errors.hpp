#pragma once
#include <stdexcept>
#include <string>

namespace memweave {

enum class ErrorKind {
    None,
    CollaboratorUnavailable, // store / embedder / LLM / NLI unreachable or timed out
    MalformedResponse,       // LLM output failed schema validation
    NotFound,                // referenced node id absent
    InvariantViolation,      // write or edge would break a graph invariant
    Cancelled
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "none";
        case ErrorKind::CollaboratorUnavailable: return "collaborator_unavailable";
        case ErrorKind::MalformedResponse:       return "malformed_response";
        case ErrorKind::NotFound:                return "not_found";
        case ErrorKind::InvariantViolation:      return "invariant_violation";
        case ErrorKind::Cancelled:               return "cancelled";
    }
    return "none";
}

// Thrown by collaborator adapters (HTTP embedder, providers, NLI client).
// The core catches it at operation boundaries and reports typed results.
class CollaboratorError : public std::runtime_error {
public:
    CollaboratorError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace memweave
