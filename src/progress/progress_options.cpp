#include "livebar/progress/progress_options.hpp"
#include "livebar/progress/progress_bar.hpp"
#include <utility>

namespace livebar {
namespace progress {

ProgressBarOptions ProgressBarOptions::defaults() {
    ProgressBarOptions options;
    options.title_style = terminal::Style{terminal::Color::LightCyan};
    options.bar_style = terminal::Style{terminal::Color::LightCyan};
    options.filler_style = terminal::Style{terminal::Color::Gray};
    return options;
}

ProgressBarOptions ProgressBarOptions::fromConfig(const common::ProgressConfig& config) {
    ProgressBarOptions options = defaults();
    options.bar_character = config.bar_character;
    options.last_character = config.last_character;
    options.bar_filler = config.bar_filler;
    options.max_width = config.max_width;
    options.show_title = config.show_title;
    options.show_count = config.show_count;
    options.show_percentage = config.show_percentage;
    options.show_elapsed_time = config.show_elapsed_time;
    options.remove_when_done = config.remove_when_done;
    options.elapsed_rounding = std::chrono::milliseconds(config.elapsed_rounding_ms);
    options.rerender_interval = std::chrono::milliseconds(config.rerender_interval_ms);
    return options;
}

ProgressBarOptions ProgressBarOptions::withTitle(const std::string& value) const {
    auto copy = *this;
    copy.title = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withTotal(int value) const {
    auto copy = *this;
    copy.total = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withCurrent(int value) const {
    auto copy = *this;
    copy.current = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withBarCharacter(const std::string& value) const {
    auto copy = *this;
    copy.bar_character = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withLastCharacter(const std::string& value) const {
    auto copy = *this;
    copy.last_character = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withBarFiller(const std::string& value) const {
    auto copy = *this;
    copy.bar_filler = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withMaxWidth(int value) const {
    auto copy = *this;
    copy.max_width = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withShowTitle(bool value) const {
    auto copy = *this;
    copy.show_title = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withShowCount(bool value) const {
    auto copy = *this;
    copy.show_count = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withShowPercentage(bool value) const {
    auto copy = *this;
    copy.show_percentage = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withShowElapsedTime(bool value) const {
    auto copy = *this;
    copy.show_elapsed_time = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withRemoveWhenDone(bool value) const {
    auto copy = *this;
    copy.remove_when_done = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withColors(bool value) const {
    auto copy = *this;
    copy.use_colors = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withRawOutput(bool value) const {
    auto copy = *this;
    copy.raw_output = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withElapsedTimeRoundingFactor(std::chrono::nanoseconds value) const {
    auto copy = *this;
    copy.elapsed_rounding = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withRerenderInterval(std::chrono::milliseconds value) const {
    auto copy = *this;
    copy.rerender_interval = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withStartedAt(std::chrono::steady_clock::time_point value) const {
    auto copy = *this;
    copy.started_at = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withTitleStyle(const terminal::Style& value) const {
    auto copy = *this;
    copy.title_style = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withBarStyle(const terminal::Style& value) const {
    auto copy = *this;
    copy.bar_style = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withFillerStyle(const terminal::Style& value) const {
    auto copy = *this;
    copy.filler_style = value;
    return copy;
}

ProgressBarOptions ProgressBarOptions::withOutput(std::shared_ptr<terminal::OutputSink> value) const {
    auto copy = *this;
    copy.output = std::move(value);
    return copy;
}

ProgressBarOptions ProgressBarOptions::withTerminal(std::shared_ptr<terminal::Terminal> value) const {
    auto copy = *this;
    copy.terminal = std::move(value);
    return copy;
}

ProgressBarOptions ProgressBarOptions::withRegistry(std::shared_ptr<BarRegistry> value) const {
    auto copy = *this;
    copy.registry = std::move(value);
    return copy;
}

BarResult ProgressBarOptions::start(const std::optional<std::string>& title_override) const {
    auto bar = std::make_shared<ProgressBar>(*this);
    bar->activate(title_override);
    return BarResult{bar, std::nullopt};
}

}}
