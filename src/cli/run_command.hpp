#pragma once

#include "main_command.hpp"
#include "livebar/progress/progress_options.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace livebar {
namespace cli {

class RunCommand : public MainCommand {
public:
    RunCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    int total_ = 100;
    std::string title_ = "Working";
    int delay_ms_ = 50;
    int max_width_ = 0;
    int threads_ = 1;
    bool max_width_set_ = false;
    bool remove_ = false;
    bool no_elapsed_ = false;
    bool no_count_ = false;
    bool no_percentage_ = false;
    bool no_color_ = false;
    bool raw_ = false;
    
    progress::ProgressBarOptions buildOptions() const;
    int executeSequential(progress::ProgressBar& bar);
    int executeParallel(progress::ProgressBar& bar);
};

}}
