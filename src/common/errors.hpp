#pragma once

#include <stdexcept>
#include <string>

namespace triage {

// Malformed or missing input. Reported to the caller, no state change.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidStatus : public ValidationError {
public:
    explicit InvalidStatus(const std::string &status)
        : ValidationError("invalid status: " + status)
    {
    }
};

// A mutating action attempted outside the mode that permits it.
class AuthorizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Upstream list/detail/delete failure.
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable store read or write failure.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The automation executor could not be started.
class LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace triage
