#pragma once

/**
 * Canopy Errors
 *
 * Every rejected input is reported as canopy::Error carrying an ErrorKind,
 * so callers can tell recoverable input problems from internal failures.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace canopy {

enum class ErrorKind : uint8_t {
    ShapeMismatch = 0,        // Target length or column count differs
    EmptyInput = 1,           // No rows (or no columns) supplied
    Untrained = 2,            // Model used before a successful train
    ModeMismatch = 3,         // Class output requested from a regression model
    InvalidConfig = 4,        // Rejected configuration value
    InternalConsistency = 5,  // Corrupted node arena or exhausted traversal
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ShapeMismatch: return "shape mismatch";
        case ErrorKind::EmptyInput: return "empty input";
        case ErrorKind::Untrained: return "untrained model";
        case ErrorKind::ModeMismatch: return "mode mismatch";
        case ErrorKind::InvalidConfig: return "invalid configuration";
        case ErrorKind::InternalConsistency: return "internal consistency";
    }
    return "unknown";
}

// Only internal consistency failures are fatal
inline bool is_recoverable(ErrorKind kind) {
    return kind != ErrorKind::InternalConsistency;
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool recoverable() const noexcept { return is_recoverable(kind_); }

private:
    ErrorKind kind_;
};

// Common messages
namespace messages {
constexpr const char* kEmptyInput = "Input must not be empty";
constexpr const char* kLengthMismatch = "Inputs must be same length";
constexpr const char* kUntrained = "Model must be trained first";
constexpr const char* kColumnMismatch = "Same number of columns as trained on needed";
constexpr const char* kModeMismatch = "Method only valid in classification mode";
constexpr const char* kTraversalExceeded = "Maximum traversal steps exceeded";
} // namespace messages

} // namespace canopy
