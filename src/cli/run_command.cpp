#include "run_command.hpp"
#include "livebar/common/config.hpp"
#include "livebar/common/logger.hpp"
#include "livebar/progress/progress_bar.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace livebar {
namespace cli {

RunCommand::RunCommand() : was_called_(false) {}

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--total", total_, "Number of work items")
        ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-t,--title", title_, "Bar title");
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Simulated time per work item in milliseconds")
        ->check(CLI::NonNegativeNumber);
    auto* width_option = subcommand->add_option("-w,--max-width", max_width_,
                                                "Maximum bar width (0 or less uses the terminal width)");
    subcommand->add_option("-j,--threads", threads_, "Worker threads incrementing the bar")
        ->check(CLI::PositiveNumber);
    subcommand->add_flag("-r,--remove", remove_, "Clear the bar line when done");
    subcommand->add_flag("--no-elapsed", no_elapsed_, "Hide the elapsed time");
    subcommand->add_flag("--no-count", no_count_, "Hide the item count");
    subcommand->add_flag("--no-percentage", no_percentage_, "Hide the percentage");
    subcommand->add_flag("--no-color", no_color_, "Disable colors");
    subcommand->add_flag("--raw", raw_, "Print the title once instead of redrawing the bar");
    
    subcommand->callback([this, width_option]() {
        was_called_ = true;
        max_width_set_ = width_option->count() > 0;
    });
}

bool RunCommand::wasCalled() const {
    return was_called_;
}

bool RunCommand::validateArguments() const {
    if (total_ < 0 || threads_ < 1 || delay_ms_ < 0) {
        return false;
    }
    return true;
}

progress::ProgressBarOptions RunCommand::buildOptions() const {
    auto options = progress::ProgressBarOptions::fromConfig(common::Config::instance().global().progress)
        .withTitle(title_)
        .withTotal(total_)
        .withColors(!no_color_ && isatty(STDOUT_FILENO))
        .withRawOutput(raw_);
    
    if (max_width_set_) {
        options = options.withMaxWidth(max_width_);
    }
    if (remove_) {
        options = options.withRemoveWhenDone();
    }
    if (no_elapsed_) {
        options = options.withShowElapsedTime(false);
    }
    if (no_count_) {
        options = options.withShowCount(false);
    }
    if (no_percentage_) {
        options = options.withShowPercentage(false);
    }
    
    return options;
}

int RunCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: invalid arguments\n";
        return 1;
    }
    
    auto result = buildOptions().start();
    if (!result.ok()) {
        std::cerr << "Error: "
                  << progress::BarErrorCodeHelper::getMessage(result.error.value_or(progress::BarErrorCode::BAR_NOT_CONFIGURED))
                  << "\n";
        return 1;
    }
    
    auto& bar = *result.bar;
    
    if (total_ == 0) {
        common::Logger::instance().info("[Run] Nothing to do | total=0");
        bar.stop();
        return 0;
    }
    
    int rc = threads_ > 1 ? executeParallel(bar) : executeSequential(bar);
    
    bar.stop();
    return rc;
}

int RunCommand::executeSequential(progress::ProgressBar& bar) {
    for (int i = 0; i < total_ && bar.isActive(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        bar.increment();
    }
    return 0;
}

int RunCommand::executeParallel(progress::ProgressBar& bar) {
    common::Logger::instance().debug("[Run] Parallel | threads={} | total={}", threads_, total_);
    
    tbb::task_arena arena(threads_);
    arena.execute([&] {
        tbb::parallel_for(0, total_, [&](int) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            bar.increment();
        });
    });
    
    return bar.current() == bar.total() ? 0 : 1;
}

}}
