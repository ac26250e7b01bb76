#pragma once

#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/terminal/output.hpp"
#include "livebar/terminal/style.hpp"
#include "livebar/terminal/terminal.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace livebar {
namespace progress {

class BarRegistry;
struct BarResult;

// Configuration template of a progress bar. Setters return a modified copy and never
// touch the receiver; start() turns the template into a live ProgressBar.
struct ProgressBarOptions {
    std::string title;
    int total = constants::limits::DEFAULT_TOTAL;
    int current = 0;
    
    std::string bar_character = constants::config_defaults::BAR_CHARACTER;
    std::string last_character = constants::config_defaults::LAST_CHARACTER;
    std::string bar_filler = constants::config_defaults::BAR_FILLER;
    int max_width = constants::config_defaults::MAX_WIDTH;
    
    bool show_title = true;
    bool show_count = true;
    bool show_percentage = true;
    bool show_elapsed_time = true;
    bool remove_when_done = false;
    bool use_colors = true;
    bool raw_output = false;
    
    std::chrono::nanoseconds elapsed_rounding =
        std::chrono::milliseconds(constants::config_defaults::ELAPSED_ROUNDING_MS);
    std::chrono::milliseconds rerender_interval =
        std::chrono::milliseconds(constants::config_defaults::RERENDER_INTERVAL_MS);
    std::optional<std::chrono::steady_clock::time_point> started_at;
    
    std::optional<terminal::Style> title_style;
    std::optional<terminal::Style> bar_style;
    std::optional<terminal::Style> filler_style;
    
    // Unset collaborators resolve to stdout, the controlling terminal and the
    // process-wide registry when the bar starts.
    std::shared_ptr<terminal::OutputSink> output;
    std::shared_ptr<terminal::Terminal> terminal;
    std::shared_ptr<BarRegistry> registry;
    
    static ProgressBarOptions defaults();
    static ProgressBarOptions fromConfig(const common::ProgressConfig& config);
    
    ProgressBarOptions withTitle(const std::string& value) const;
    ProgressBarOptions withTotal(int value) const;
    ProgressBarOptions withCurrent(int value) const;
    ProgressBarOptions withBarCharacter(const std::string& value) const;
    ProgressBarOptions withLastCharacter(const std::string& value) const;
    ProgressBarOptions withBarFiller(const std::string& value) const;
    ProgressBarOptions withMaxWidth(int value) const;
    ProgressBarOptions withShowTitle(bool value = true) const;
    ProgressBarOptions withShowCount(bool value = true) const;
    ProgressBarOptions withShowPercentage(bool value = true) const;
    ProgressBarOptions withShowElapsedTime(bool value = true) const;
    ProgressBarOptions withRemoveWhenDone(bool value = true) const;
    ProgressBarOptions withColors(bool value = true) const;
    ProgressBarOptions withRawOutput(bool value = true) const;
    ProgressBarOptions withElapsedTimeRoundingFactor(std::chrono::nanoseconds value) const;
    ProgressBarOptions withRerenderInterval(std::chrono::milliseconds value) const;
    ProgressBarOptions withStartedAt(std::chrono::steady_clock::time_point value) const;
    ProgressBarOptions withTitleStyle(const terminal::Style& value) const;
    ProgressBarOptions withBarStyle(const terminal::Style& value) const;
    ProgressBarOptions withFillerStyle(const terminal::Style& value) const;
    ProgressBarOptions withOutput(std::shared_ptr<terminal::OutputSink> value) const;
    ProgressBarOptions withTerminal(std::shared_ptr<terminal::Terminal> value) const;
    ProgressBarOptions withRegistry(std::shared_ptr<BarRegistry> value) const;
    
    BarResult start(const std::optional<std::string>& title_override = std::nullopt) const;
};

}}
