#pragma once

#include "ConnectionTypes.h"
#include "ProcErrors.h"

#include <expected>
#include <vector>

namespace Platform
{

/// Interface for kernel socket table enumeration.
/// Implementations decode raw tables and attach process identity; rates are left at zero.
class ISocketTableReader
{
  public:
    virtual ~ISocketTableReader() = default;

    ISocketTableReader() = default;
    ISocketTableReader(const ISocketTableReader&) = default;
    ISocketTableReader& operator=(const ISocketTableReader&) = default;
    ISocketTableReader(ISocketTableReader&&) = default;
    ISocketTableReader& operator=(ISocketTableReader&&) = default;

    /// Read one table. Malformed lines are dropped; only an unreadable table is an error.
    [[nodiscard]] virtual std::expected<std::vector<Connection>, ProcReadError> readTable(SocketProtocol protocol) = 0;

    /// Read all four tables, skipping any that cannot be read.
    [[nodiscard]] virtual std::vector<Connection> readConnections() = 0;
};

} // namespace Platform
