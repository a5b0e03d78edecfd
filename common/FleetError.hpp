#pragma once

#include <stdexcept>
#include <string>

namespace axe_fleet::common
{
    enum class ErrorKind
    {
        Unreachable,
        MalformedResponse,
        DeviceRejected,
        ValidationError,
        NotFound,
        ConfirmationRequired,
        Cancelled
    };

    inline const char *ToString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Unreachable:
            return "unreachable";
        case ErrorKind::MalformedResponse:
            return "malformed-response";
        case ErrorKind::DeviceRejected:
            return "device-rejected";
        case ErrorKind::ValidationError:
            return "validation-error";
        case ErrorKind::NotFound:
            return "not-found";
        case ErrorKind::ConfirmationRequired:
            return "confirmation-required";
        case ErrorKind::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    class FleetError : public std::runtime_error
    {
    public:
        FleetError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message), m_kind(kind)
        {
        }

        ErrorKind Kind() const { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    // Per-device failure recorded next to successes in multi-device results.
    struct DeviceError
    {
        ErrorKind kind;
        std::string message;

        static DeviceError From(const FleetError &e) { return {e.Kind(), e.what()}; }
    };
}
