#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace livebar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    
    CLI::App* show_cmd_ = nullptr;
    CLI::App* paths_cmd_ = nullptr;
    
    int executeShow();
    int executePaths();
};

}}
