#pragma once

#include "ConnectionTypes.h"

#include <cstdint>

namespace Platform
{

/// Maps a socket inode to the process holding it open.
class IProcessCorrelator
{
  public:
    virtual ~IProcessCorrelator() = default;

    IProcessCorrelator() = default;
    IProcessCorrelator(const IProcessCorrelator&) = default;
    IProcessCorrelator& operator=(const IProcessCorrelator&) = default;
    IProcessCorrelator(IProcessCorrelator&&) = default;
    IProcessCorrelator& operator=(IProcessCorrelator&&) = default;

    /// Always returns a value; unknown owners yield ProcessIdentity::unavailable().
    [[nodiscard]] virtual ProcessIdentity processInfo(std::uint64_t inode) = 0;
};

} // namespace Platform
