#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace np::config { struct LoggingConfig; }

namespace np::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Console only, everything at debug; for unit tests.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> newsprobe() { return get("newsprobe"); }
    static std::shared_ptr<spdlog::logger> nzb()       { return get("nzb"); }
    static std::shared_ptr<spdlog::logger> nntp()      { return get("nntp"); }
    static std::shared_ptr<spdlog::logger> health()    { return get("health"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void makeLogger(const std::string& name, spdlog::level::level_enum lvl);
};

}
