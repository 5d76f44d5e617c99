#pragma once
#include <filesystem>

namespace gw2util::logsys {
    // Console (stdout) + rotating file under `logDir` (gw2util.log, 1MB * 4).
    // Falls back to console only if the directory can't be created.
    void init(const std::filesystem::path& logDir, bool verbose);
    void shutdown();
}
