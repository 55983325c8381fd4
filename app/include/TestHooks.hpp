#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

namespace TestHooks {

using DiskSpaceProbe = std::function<std::optional<std::uint64_t>(const std::filesystem::path& path)>;
void set_disk_space_probe(DiskSpaceProbe probe);
void reset_disk_space_probe();

// Returns nullopt when no probe is installed.
std::optional<std::uint64_t> probe_disk_space(const std::filesystem::path& path);

} // namespace TestHooks
