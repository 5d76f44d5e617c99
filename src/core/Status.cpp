#include "core/Status.h"

namespace gw2util::core {

const char* ToString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::None:         return "ok";
    case ErrorKind::NotFound:     return "not found";
    case ErrorKind::IOError:      return "I/O error";
    case ErrorKind::LaunchFailed: return "launch failed";
    case ErrorKind::InvalidState: return "invalid state";
    }
    return "unknown error";
}

std::string Describe(const Status& status)
{
    if (status.ok())
        return ToString(status.kind);

    std::string out = ToString(status.kind);
    if (!status.message.empty())
    {
        out += ": ";
        out += status.message;
    }
    if (status.code)
    {
        out += " (";
        out += status.code.message();
        out += ")";
    }
    return out;
}

} // namespace gw2util::core
