#include "Platform/Factory.h"

#include "HostCommandLookup.h"
#include "LinuxPathProvider.h"
#include "LinuxProcessCorrelator.h"
#include "LinuxProcessIoProbe.h"
#include "LinuxSocketTableReader.h"

#include <memory>
#include <utility>

namespace Platform
{

std::shared_ptr<IProcessCorrelator> makeProcessCorrelator(std::chrono::milliseconds updateInterval)
{
    return std::make_shared<LinuxProcessCorrelator>(ProcFs::DEFAULT_PROC_ROOT, updateInterval);
}

std::unique_ptr<ISocketTableReader> makeSocketTableReader(std::shared_ptr<IProcessCorrelator> correlator)
{
    return std::make_unique<LinuxSocketTableReader>(std::move(correlator));
}

std::unique_ptr<IProcessIoProbe> makeProcessIoProbe()
{
    return std::make_unique<LinuxProcessIoProbe>();
}

std::shared_ptr<IReverseLookup> makeReverseLookup(std::string command, std::chrono::milliseconds timeout)
{
    return std::make_shared<HostCommandLookup>(HostCommandConfig{.command = std::move(command), .timeout = timeout});
}

std::unique_ptr<IPathProvider> makePathProvider()
{
    return std::make_unique<LinuxPathProvider>();
}

} // namespace Platform
