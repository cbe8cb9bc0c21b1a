/*
 * errors.hpp
 *
 * the one exception type the engine throws. every failure is a
 * validation failure caught before output starts, so callers only
 * need the kind to pick an exit code.
 */

#ifndef LFICHEF_ERRORS_HPP
#define LFICHEF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lfichef {

enum class ErrorKind {
    InvalidDriveLetter,
    InvalidRangeOrder,
    InvalidTraversalDepth,
    InvalidTraversalFormat,
    UnknownEncodingToken,
    InvalidNullByteMode,
    InvalidConfig,
    EmptyInput,
    IoError
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDriveLetter:     return "InvalidDriveLetter";
        case ErrorKind::InvalidRangeOrder:      return "InvalidRangeOrder";
        case ErrorKind::InvalidTraversalDepth:  return "InvalidTraversalDepth";
        case ErrorKind::InvalidTraversalFormat: return "InvalidTraversalFormat";
        case ErrorKind::UnknownEncodingToken:   return "UnknownEncodingToken";
        case ErrorKind::InvalidNullByteMode:    return "InvalidNullByteMode";
        case ErrorKind::InvalidConfig:          return "InvalidConfig";
        case ErrorKind::EmptyInput:             return "EmptyInput";
        case ErrorKind::IoError:                return "IoError";
        default: return "Unknown";
    }
}

class LfiChefError : public std::runtime_error {
public:
    LfiChefError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // 3 for file trouble, 2 for everything the user typed wrong
    int exitCode() const {
        return kind_ == ErrorKind::IoError ? 3 : 2;
    }

private:
    ErrorKind kind_;
};

} // namespace lfichef

#endif // LFICHEF_ERRORS_HPP
