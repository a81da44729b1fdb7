#pragma once

#include <filesystem>

// Best-effort removal of a stale mailbox lock left behind by an earlier run.
// Never throws. Returns true only if a file was actually removed; a missing
// file or any other failure returns false (failures go to the debug log).
bool remove_stale_lock(const std::filesystem::path& path);
