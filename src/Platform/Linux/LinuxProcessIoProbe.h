#pragma once

#include "Platform/IProcessIoProbe.h"
#include "ProcFs.h"

#include <filesystem>

namespace Platform
{

/// Reads rchar/wchar from <proc>/<pid>/io.
/// These count all read()/write() traffic of the process, not only sockets.
class LinuxProcessIoProbe : public IProcessIoProbe
{
  public:
    explicit LinuxProcessIoProbe(std::filesystem::path procRoot = ProcFs::DEFAULT_PROC_ROOT);

    [[nodiscard]] ProcessIoCounters readProcessIo(std::int32_t pid) override;

  private:
    std::filesystem::path m_ProcRoot;
};

} // namespace Platform
