#include "git_backend.hpp"

std::string git_error_kind_name(GitErrorKind kind) {
    switch (kind) {
        case GitErrorKind::Network:  return "network";
        case GitErrorKind::Auth:     return "auth";
        case GitErrorKind::Rejected: return "rejected";
        case GitErrorKind::NotFound: return "not-found";
        case GitErrorKind::Conflict: return "conflict";
        case GitErrorKind::Other:    return "other";
    }
    return "other";
}
