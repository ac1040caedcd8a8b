#pragma once

namespace colourdsp
{
// Result of a fallible engine call. Nothing is modified unless the call returns ok.
enum class Status
{
    ok = 0,
    invalidParameter,
    notConfigured,
    unsupportedChannelCount
};

inline bool succeeded(Status status)
{
    return status == Status::ok;
}

inline const char* toString(Status status)
{
    switch (status)
    {
        case Status::ok: return "ok";
        case Status::invalidParameter: return "invalid parameter";
        case Status::notConfigured: return "not configured";
        case Status::unsupportedChannelCount: return "unsupported channel count";
    }

    return "unknown";
}
} // namespace colourdsp
