#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace lpal {

/**
 * @brief Failure kinds that propagate to the immediate caller.
 *
 * Configuration mismatches and empty captures are not errors and are
 * reported as values (see ConfigureReport and CaptureResult).
 */
enum class ErrorKind
{
    PermissionDenied, // input automation / accessibility not available
    HandleInvalid,    // null window or window destroyed out-of-band
    CircuitOpen,      // paste failure ceiling reached
    Backend           // the window server rejected or failed a request
};

constexpr std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::PermissionDenied:
            return "PermissionDenied";
        case ErrorKind::HandleInvalid:
            return "HandleInvalid";
        case ErrorKind::CircuitOpen:
            return "CircuitOpen";
        case ErrorKind::Backend:
            return "Backend";
    }
    return "Unknown";
}

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, std::string const& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace lpal
