#pragma once

#include "Platform/IProcessCorrelator.h"
#include "Platform/ISocketTableReader.h"
#include "ProcFs.h"

#include <filesystem>
#include <memory>
#include <string_view>

namespace Platform
{

/// Reads <proc>/net/{tcp,tcp6,udp,udp6} and attaches the owning process of every socket.
class LinuxSocketTableReader : public ISocketTableReader
{
  public:
    explicit LinuxSocketTableReader(std::shared_ptr<IProcessCorrelator> correlator,
                                    std::filesystem::path procRoot = ProcFs::DEFAULT_PROC_ROOT);
    ~LinuxSocketTableReader() override = default;

    LinuxSocketTableReader(const LinuxSocketTableReader&) = delete;
    LinuxSocketTableReader& operator=(const LinuxSocketTableReader&) = delete;
    LinuxSocketTableReader(LinuxSocketTableReader&&) = delete;
    LinuxSocketTableReader& operator=(LinuxSocketTableReader&&) = delete;

    [[nodiscard]] std::expected<std::vector<Connection>, ProcReadError> readTable(SocketProtocol protocol) override;
    [[nodiscard]] std::vector<Connection> readConnections() override;

    /// Decode table text (header line included) without touching the filesystem.
    [[nodiscard]] std::vector<Connection> parseTable(SocketProtocol protocol, std::string_view contents);

  private:
    std::shared_ptr<IProcessCorrelator> m_Correlator;
    std::filesystem::path m_ProcRoot;
};

} // namespace Platform
