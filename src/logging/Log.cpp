#include "logging/Log.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void gw2util::logsys::init(const fs::path& logDir, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    sinks.push_back(console);

    std::string fileError;
    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (!ec) {
        try {
            auto file = (logDir / "gw2util.log").string();
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
            sink->set_level(spdlog::level::debug);
            sinks.push_back(sink);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    } else {
        fileError = ec.message();
    }

    g_logger = std::make_shared<spdlog::logger>("gw2util", sinks.begin(), sinks.end());
    g_logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    if (!fileError.empty())
        spdlog::warn("file logging disabled ({}): {}", logDir.string(), fileError);
    else
        spdlog::debug("logging to {}", (logDir / "gw2util.log").string());
}

void gw2util::logsys::shutdown() {
    if (g_logger)
        g_logger->flush();
}
