#pragma once

#include <string>
#include <cstdint>

namespace livebar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("livebar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "livebar";
    constexpr const char* LOGGER_NAME = "livebar";
    constexpr const char* CONFIG_ENV = "LIVEBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "livebar.toml";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/livebar/livebar.toml";
}

namespace terminal {
    constexpr int FALLBACK_WIDTH = 80;
}

namespace limits {
    constexpr int DEFAULT_TOTAL = 100;
    constexpr int DEFAULT_MAX_WIDTH = 80;
    constexpr int64_t DEFAULT_ELAPSED_ROUNDING_MS = 1000;
    constexpr int64_t DEFAULT_RERENDER_INTERVAL_MS = 1000;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr const char* BAR_CHARACTER = "█";
    constexpr const char* LAST_CHARACTER = "█";
    constexpr const char* BAR_FILLER = "█";
    constexpr int MAX_WIDTH = limits::DEFAULT_MAX_WIDTH;
    constexpr bool SHOW_TITLE = true;
    constexpr bool SHOW_COUNT = true;
    constexpr bool SHOW_PERCENTAGE = true;
    constexpr bool SHOW_ELAPSED_TIME = true;
    constexpr bool REMOVE_WHEN_DONE = false;
    constexpr int64_t ELAPSED_ROUNDING_MS = limits::DEFAULT_ELAPSED_ROUNDING_MS;
    constexpr int64_t RERENDER_INTERVAL_MS = limits::DEFAULT_RERENDER_INTERVAL_MS;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
