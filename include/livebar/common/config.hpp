#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace livebar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ProgressConfig {
    std::string bar_character;
    std::string last_character;
    std::string bar_filler;
    int max_width;
    bool show_title;
    bool show_count;
    bool show_percentage;
    bool show_elapsed_time;
    bool remove_when_done;
    int64_t elapsed_rounding_ms;
    int64_t rerender_interval_ms;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    ProgressConfig progress;
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& level);

class Config {
public:
    static Config& instance();
    
    static GlobalConfig createDefaultConfig();
    
    bool load(const std::string& config_file = "");
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::vector<std::string> getConfigSearchPaths() const;
    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const { return current_config_path_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
