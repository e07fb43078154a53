#pragma once

#include "Platform/ProcErrors.h"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Small readers for per-process pseudo-files under a proc root.
/// The root is a parameter so the same code runs against a fixture tree in tests.
namespace Platform::ProcFs
{

inline const std::filesystem::path DEFAULT_PROC_ROOT{"/proc"};

/// Numeric directory name to pid; nullopt for anything else.
[[nodiscard]] std::optional<std::int32_t> pidFromDirectoryName(std::string_view name);

/// Call @p visitor for every numeric entry of @p procRoot.
/// Fails only when the root itself cannot be enumerated.
[[nodiscard]] std::expected<void, ProcReadError> forEachPid(const std::filesystem::path& procRoot,
                                                           const std::function<void(std::int32_t, const std::filesystem::path&)>& visitor);

/// Value of the "Name:" line of <pid>/status.
[[nodiscard]] std::optional<std::string> readProcessName(const std::filesystem::path& pidDir);

/// <pid>/cmdline with NUL separators replaced by spaces; "[pid]" when the file is empty
/// (kernel threads). nullopt when unreadable.
[[nodiscard]] std::optional<std::string> readProcessCommand(const std::filesystem::path& pidDir, std::int32_t pid);

/// Inode from a "socket:[12345]" link target.
[[nodiscard]] std::optional<std::uint64_t> socketInodeFromLink(std::string_view target);

/// Socket inodes referenced by <pid>/fd/*. Unreadable descriptors are skipped.
[[nodiscard]] std::vector<std::uint64_t> collectSocketInodes(const std::filesystem::path& pidDir);

} // namespace Platform::ProcFs
