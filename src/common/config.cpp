#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/logger.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace livebar {
namespace common {

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& level) {
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_file = "";
    config.log_level = LogLevel::WARN;
    
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.progress.bar_character = BAR_CHARACTER;
    config.progress.last_character = LAST_CHARACTER;
    config.progress.bar_filler = BAR_FILLER;
    config.progress.max_width = MAX_WIDTH;
    config.progress.show_title = SHOW_TITLE;
    config.progress.show_count = SHOW_COUNT;
    config.progress.show_percentage = SHOW_PERCENTAGE;
    config.progress.show_elapsed_time = SHOW_ELAPSED_TIME;
    config.progress.remove_when_done = REMOVE_WHEN_DONE;
    config.progress.elapsed_rounding_ms = ELAPSED_ROUNDING_MS;
    config.progress.rerender_interval_ms = RERENDER_INTERVAL_MS;
    
    return config;
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* explicit_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*explicit_path) {
            paths.emplace_back(explicit_path);
        }
    }
    
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back(std::string(xdg) + "/livebar/" + constants::system::CONFIG_FILE_NAME);
        }
    }
    
    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back(std::string(home) + "/.config/livebar/" + constants::system::CONFIG_FILE_NAME);
        }
    }
    
    paths.emplace_back(constants::system::SYSTEM_CONFIG_FILE);
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }
    
    current_config_path_ = effective_config_file;
    
    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().debug("[Config] Config not found | path={}", effective_config_file);
        return true;
    }
    
    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Config not readable | path={}", path);
        return false;
    }
    
    GlobalConfig loaded = createDefaultConfig();
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            auto global_section = data.at("global");
            
            if (global_section.contains("log_file")) {
                loaded.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                if (auto parsed = parseLogLevel(level)) {
                    loaded.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level | value={}", level);
                }
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("rotation_size_mb")) {
                loaded.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                loaded.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                loaded.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }
        
        if (data.contains("progress")) {
            auto progress_section = data.at("progress");
            auto& progress = loaded.progress;
            
            if (progress_section.contains("bar_character")) {
                progress.bar_character = toml::find<std::string>(progress_section, "bar_character");
            }
            if (progress_section.contains("last_character")) {
                progress.last_character = toml::find<std::string>(progress_section, "last_character");
            }
            if (progress_section.contains("bar_filler")) {
                progress.bar_filler = toml::find<std::string>(progress_section, "bar_filler");
            }
            if (progress_section.contains("max_width")) {
                progress.max_width = toml::find<int>(progress_section, "max_width");
            }
            if (progress_section.contains("show_title")) {
                progress.show_title = toml::find<bool>(progress_section, "show_title");
            }
            if (progress_section.contains("show_count")) {
                progress.show_count = toml::find<bool>(progress_section, "show_count");
            }
            if (progress_section.contains("show_percentage")) {
                progress.show_percentage = toml::find<bool>(progress_section, "show_percentage");
            }
            if (progress_section.contains("show_elapsed_time")) {
                progress.show_elapsed_time = toml::find<bool>(progress_section, "show_elapsed_time");
            }
            if (progress_section.contains("remove_when_done")) {
                progress.remove_when_done = toml::find<bool>(progress_section, "remove_when_done");
            }
            if (progress_section.contains("elapsed_rounding_ms")) {
                progress.elapsed_rounding_ms = toml::find<int64_t>(progress_section, "elapsed_rounding_ms");
            }
            if (progress_section.contains("rerender_interval_ms")) {
                progress.rerender_interval_ms = toml::find<int64_t>(progress_section, "rerender_interval_ms");
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}",
                                 path, e.what());
        return false;
    }
    
    if (loaded.progress.rerender_interval_ms <= 0) {
        Logger::instance().warn("[Config] Invalid rerender interval, using default | value={}",
                                loaded.progress.rerender_interval_ms);
        loaded.progress.rerender_interval_ms = constants::config_defaults::RERENDER_INTERVAL_MS;
    }
    
    global_ = loaded;
    Logger::instance().info("[Config] Loaded | path={}", path);
    return true;
}

}}
