#pragma once

#include "Platform/IPathProvider.h"
#include "Platform/IProcessCorrelator.h"
#include "Platform/IProcessIoProbe.h"
#include "Platform/IReverseLookup.h"
#include "Platform/ISocketTableReader.h"

#include <chrono>
#include <memory>
#include <string>

namespace Platform
{

/// Creates the platform-appropriate IProcessCorrelator with the given cache lifetime.
[[nodiscard]] std::shared_ptr<IProcessCorrelator> makeProcessCorrelator(std::chrono::milliseconds updateInterval);

/// Creates the platform-appropriate ISocketTableReader attributing sockets through @p correlator.
[[nodiscard]] std::unique_ptr<ISocketTableReader> makeSocketTableReader(std::shared_ptr<IProcessCorrelator> correlator);

/// Creates the platform-appropriate IProcessIoProbe implementation.
[[nodiscard]] std::unique_ptr<IProcessIoProbe> makeProcessIoProbe();

/// Creates a reverse lookup backend that runs @p command with the address as its only argument.
[[nodiscard]] std::shared_ptr<IReverseLookup> makeReverseLookup(std::string command, std::chrono::milliseconds timeout);

/// Creates the platform-appropriate IPathProvider implementation.
[[nodiscard]] std::unique_ptr<IPathProvider> makePathProvider();

} // namespace Platform
