#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <stdexcept>
#include <vector>

namespace np::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    spdlog::info("[LogRegistry] Initializing... LogDir: {}", cnf.log_dir.string());

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // An unwritable log_dir (CLI run as an ordinary user) leaves console logging only
    try {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        const auto log_file = cnf.log_dir / "newsprobe.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    } catch (const std::exception& e) {
        spdlog::warn("[LogRegistry] File logging disabled: {}", e.what());
        main_file_sink_.reset();
    }

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("newsprobe", sub_levels.newsprobe);
    makeLogger("nzb", sub_levels.nzb);
    makeLogger("nntp", sub_levels.nntp);
    makeLogger("health", sub_levels.health);
    makeLogger("http", sub_levels.http);

    initialized_ = true;
    spdlog::info("[LogRegistry] Initialized");
}

void Registry::initForTesting() {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(spdlog::level::debug);
    console_sink_->set_pattern(LOG_FORMAT);

    for (const auto* name : {"newsprobe", "nzb", "nntp", "health", "http"})
        makeLogger(name, spdlog::level::debug);

    initialized_ = true;
}

void Registry::makeLogger(const std::string& name, const spdlog::level::level_enum lvl) {
    std::vector<spdlog::sink_ptr> sinks{console_sink_};
    if (main_file_sink_) sinks.push_back(main_file_sink_);

    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
