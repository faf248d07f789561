// errors.hpp
// Exceptions raised by the sieve library.

#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace eratos {

// Requested bound is zero or negative.
class InvalidBound : public std::invalid_argument {
public:
    explicit InvalidBound(int64_t bound)
        : std::invalid_argument("bound must be >= 1, got " + std::to_string(bound))
        , bound_(bound)
    {}

    int64_t bound() const { return bound_; }

private:
    int64_t bound_;
};

// A required array or accumulator pointer was null.
class MissingArgument : public std::invalid_argument {
public:
    explicit MissingArgument(const std::string& name)
        : std::invalid_argument("missing required argument: " + name)
    {}
};

// A bounded wait for worker threads expired.
class SieveTimeout : public std::runtime_error {
public:
    explicit SieveTimeout(std::chrono::milliseconds timeout)
        : std::runtime_error("workers did not finish within "
                             + std::to_string(timeout.count()) + " ms")
        , timeout_(timeout)
    {}

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

// Throws InvalidBound unless n >= 1.
inline void validate_bound(int64_t n) {
    if (n <= 0) throw InvalidBound(n);
}

} // namespace eratos
