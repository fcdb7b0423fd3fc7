#pragma once

#include <string>
#include <stdexcept>

enum class LfsErrorKind {
    Network,    // transport failure or retryable server status
    Auth,       // 401 / 403, never retried
    NotFound,   // server does not have the object
    Protocol,   // malformed batch response, unusable endpoint
    Integrity,  // downloaded bytes do not hash to the pointer oid
};

class LfsError : public std::runtime_error {
public:
    LfsError(LfsErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    LfsErrorKind kind() const { return kind_; }

    bool retryable() const {
        return kind_ == LfsErrorKind::Network || kind_ == LfsErrorKind::Integrity;
    }

private:
    LfsErrorKind kind_;
};
