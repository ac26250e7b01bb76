#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/logger.hpp"
#include "livebar/progress/bar_registry.hpp"
#include "livebar/progress/progress_bar.hpp"
#include "cli/config_command.hpp"
#include "cli/run_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Live terminal progress bars", livebar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", livebar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Override log level (DEBUG, INFO, WARN, ERROR)");
        
        auto run_cmd = std::make_unique<livebar::cli::RunCommand>();
        auto config_cmd = std::make_unique<livebar::cli::ConfigCommand>();
        
        run_cmd->setup(app.add_subcommand("run", "Simulate work behind a live progress bar"));
        config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = livebar::common::Config::instance();
        bool config_ok = config.load(config_file);
        
        auto& global = config.global();
        if (!log_level.empty()) {
            if (auto parsed = livebar::common::parseLogLevel(log_level)) {
                global.log_level = *parsed;
            } else {
                std::cerr << "Error: unknown log level: " << log_level << std::endl;
                return 1;
            }
        }
        
        livebar::common::Logger::instance().initialize(
            global.log_file.empty() ? livebar::common::LogMode::CONSOLE_ONLY
                                    : livebar::common::LogMode::FILE_ONLY,
            global.log_file,
            global.log_level,
            global.logging
        );
        
        if (!config_ok) {
            livebar::common::Logger::instance().warn("[Main] Configuration rejected, using defaults | path={}",
                                                     config.getConfigPath());
        }
        
        int rc = 0;
        if (run_cmd->wasCalled()) {
            rc = run_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            rc = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        for (const auto& bar : livebar::progress::BarRegistry::processDefault()->activeBars()) {
            bar->stop();
        }
        
        livebar::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
