#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace skirmish::logsys {
    struct LogOptions {
        std::string logger_name = "skirmish";
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        std::filesystem::path file;           // empty: no file sink
        std::size_t max_file_size = 1 << 20;  // 1MB
        std::size_t max_files = 4;
    };

    // Builds the logger, installs it as spdlog's default and returns it.
    // Safe to call again (e.g. from tests); the previous logger is replaced.
    std::shared_ptr<spdlog::logger> init(const LogOptions& opts = {});
    std::shared_ptr<spdlog::logger> get();  // "skirmish"

    // "trace" / "debug" / "info" / "warn" / "error" / "off"; anything else -> info.
    spdlog::level::level_enum level_from_string(const std::string& s);
}
