#include "config_command.hpp"
#include "livebar/common/config.hpp"
#include <filesystem>
#include <iostream>

namespace livebar {
namespace cli {

namespace {

const char* yesNo(bool value) {
    return value ? "true" : "false";
}

}

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    paths_cmd_ = subcommand->add_subcommand("paths", "List configuration search paths");
    paths_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (show_cmd_->parsed()) {
        return executeShow();
    } else if (paths_cmd_->parsed()) {
        return executePaths();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    const auto& global = config.global();
    const auto& progress = global.progress;
    
    std::string path = config.getConfigPath();
    std::cout << "# source: " << (path.empty() ? "(defaults)" : path) << "\n\n";
    
    std::cout << "[global]\n";
    std::cout << "log_level = \"" << common::to_string(global.log_level) << "\"\n";
    std::cout << "log_file = \"" << global.log_file << "\"\n\n";
    
    std::cout << "[logging]\n";
    std::cout << "rotation_size_mb = " << global.logging.rotation_size_mb << "\n";
    std::cout << "max_files = " << global.logging.max_files << "\n";
    std::cout << "format = \"" << (global.logging.format == common::LogFormat::JSON ? "json" : "text") << "\"\n\n";
    
    std::cout << "[progress]\n";
    std::cout << "bar_character = \"" << progress.bar_character << "\"\n";
    std::cout << "last_character = \"" << progress.last_character << "\"\n";
    std::cout << "bar_filler = \"" << progress.bar_filler << "\"\n";
    std::cout << "max_width = " << progress.max_width << "\n";
    std::cout << "show_title = " << yesNo(progress.show_title) << "\n";
    std::cout << "show_count = " << yesNo(progress.show_count) << "\n";
    std::cout << "show_percentage = " << yesNo(progress.show_percentage) << "\n";
    std::cout << "show_elapsed_time = " << yesNo(progress.show_elapsed_time) << "\n";
    std::cout << "remove_when_done = " << yesNo(progress.remove_when_done) << "\n";
    std::cout << "elapsed_rounding_ms = " << progress.elapsed_rounding_ms << "\n";
    std::cout << "rerender_interval_ms = " << progress.rerender_interval_ms << "\n";
    
    return 0;
}

int ConfigCommand::executePaths() {
    auto& config = common::Config::instance();
    auto best = config.findBestConfig();
    
    for (const auto& path : config.getConfigSearchPaths()) {
        bool exists = std::filesystem::exists(path);
        bool selected = best && *best == path;
        std::cout << (selected ? "* " : "  ") << path << (exists ? "" : " (missing)") << "\n";
    }
    
    return 0;
}

}}
