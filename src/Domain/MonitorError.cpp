#include "MonitorError.h"

namespace Domain
{

std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::ProcIo:
        return "proc I/O error";
    case ErrorKind::Parse:
        return "parse error";
    case ErrorKind::InvalidAddress:
        return "invalid address";
    case ErrorKind::InvalidPid:
        return "invalid pid";
    case ErrorKind::Resolution:
        return "resolution failed";
    case ErrorKind::CircuitOpen:
        return "circuit breaker open";
    }
    return "unknown error";
}

std::string MonitorError::describe() const
{
    std::string text(toString(kind));
    if (!message.empty())
    {
        text += ": ";
        text += message;
    }
    return text;
}

MonitorError toMonitorError(const Platform::ProcReadError& error)
{
    return MonitorError{.kind = ErrorKind::ProcIo, .message = error.message()};
}

MonitorError toMonitorError(const Platform::DecodeError& error)
{
    switch (error.kind)
    {
    case Platform::DecodeErrorKind::InvalidAddress:
        return MonitorError{.kind = ErrorKind::InvalidAddress, .message = error.message};
    case Platform::DecodeErrorKind::InvalidPid:
        return MonitorError{.kind = ErrorKind::InvalidPid, .message = error.message};
    case Platform::DecodeErrorKind::InvalidHex:
    case Platform::DecodeErrorKind::InvalidDecimal:
    case Platform::DecodeErrorKind::TooFewFields:
        break;
    }
    return MonitorError{.kind = ErrorKind::Parse, .message = error.message};
}

MonitorError toMonitorError(const Platform::LookupError& error)
{
    if (error.kind == Platform::LookupErrorKind::InvalidAddress)
    {
        return MonitorError{.kind = ErrorKind::InvalidAddress, .message = error.message};
    }
    return MonitorError{.kind = ErrorKind::Resolution, .message = error.message};
}

} // namespace Domain
