#include "TestHooks.hpp"

#include <mutex>
#include <utility>

namespace {

std::mutex& hook_mutex()
{
    static std::mutex mutex;
    return mutex;
}

TestHooks::DiskSpaceProbe& disk_space_probe()
{
    static TestHooks::DiskSpaceProbe probe;
    return probe;
}

} // namespace

namespace TestHooks {

void set_disk_space_probe(DiskSpaceProbe probe)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    disk_space_probe() = std::move(probe);
}


void reset_disk_space_probe()
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    disk_space_probe() = nullptr;
}


std::optional<std::uint64_t> probe_disk_space(const std::filesystem::path& path)
{
    DiskSpaceProbe probe;
    {
        std::lock_guard<std::mutex> lock(hook_mutex());
        probe = disk_space_probe();
    }
    if (!probe) {
        return std::nullopt;
    }
    return probe(path);
}

} // namespace TestHooks
