#include "lock_file.hpp"
#include "log.hpp"
#include <system_error>
#include <fmt/format.h>

bool remove_stale_lock(const std::filesystem::path& path) {
    if (path.empty()) return false;

    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        probe_log(fmt::format("LOCK {} not removed: {}", path.string(), ec.message()));
        return false;
    }
    probe_log(fmt::format("LOCK {} {}", path.string(), removed ? "removed" : "absent"));
    return removed;
}
