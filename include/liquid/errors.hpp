#ifndef LIQUID_ERRORS_HPP
#define LIQUID_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace liquid {

// Base for every failure raised by the library. code() is one of errors::*.
class LiquidError : public std::runtime_error {
public:
    LiquidError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// Zero/undersized amounts, zero addresses, uninitialized token
class ValidationError : public LiquidError {
public:
    using LiquidError::LiquidError;
};

// Output below caller minimum, partial fill, price limit already crossed
class SlippageError : public LiquidError {
public:
    using LiquidError::LiquidError;
};

// A mandatory transfer could not be made
class TransferError : public LiquidError {
public:
    using LiquidError::LiquidError;
};

// Venue rejected the operation (pool missing, lock misuse, unsettled delta)
class VenueError : public LiquidError {
public:
    using LiquidError::LiquidError;
};

// Hostile or duplicate settlement callback
class GuardViolation : public LiquidError {
public:
    using LiquidError::LiquidError;
};

// Configuration write rejected
class ConfigError : public LiquidError {
public:
    explicit ConfigError(const std::string& msg)
        : LiquidError(errors::INVALID_CONFIG, msg) {}
};

// Owner-gated call from someone else
class Unauthorized : public LiquidError {
public:
    explicit Unauthorized(const std::string& msg)
        : LiquidError(errors::UNAUTHORIZED, msg) {}
};

} // namespace liquid

#endif // LIQUID_ERRORS_HPP
