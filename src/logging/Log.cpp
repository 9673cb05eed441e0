#include "skirmish/logging/Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> skirmish::logsys::init(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;
    if (opts.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!opts.file.empty()) {
        std::error_code ec;
        if (opts.file.has_parent_path()) fs::create_directories(opts.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.file.string(), opts.max_file_size, opts.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    if (g_logger) spdlog::drop(g_logger->name());
    g_logger = std::make_shared<spdlog::logger>(opts.logger_name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(opts.level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    if (!file_error.empty()) spdlog::warn("File sink disabled ({}); logging to console only", file_error);
    spdlog::debug("Logging started");
    return g_logger;
}

std::shared_ptr<spdlog::logger> skirmish::logsys::get() { return g_logger; }

spdlog::level::level_enum skirmish::logsys::level_from_string(const std::string& s) {
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info")  return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    if (s == "off")   return spdlog::level::off;
    return spdlog::level::info;
}
