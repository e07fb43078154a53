#pragma once

#include "ConnectionTypes.h"

#include <cstdint>

namespace Platform
{

/// Reads cumulative per-process I/O counters.
class IProcessIoProbe
{
  public:
    virtual ~IProcessIoProbe() = default;

    IProcessIoProbe() = default;
    IProcessIoProbe(const IProcessIoProbe&) = default;
    IProcessIoProbe& operator=(const IProcessIoProbe&) = default;
    IProcessIoProbe(IProcessIoProbe&&) = default;
    IProcessIoProbe& operator=(IProcessIoProbe&&) = default;

    /// Zero counters when the pid is gone or its accounting file is not readable.
    [[nodiscard]] virtual ProcessIoCounters readProcessIo(std::int32_t pid) = 0;
};

} // namespace Platform
