#pragma once

#include "bar_state.hpp"
#include "error_codes.hpp"
#include "live_printer.hpp"
#include "progress_options.hpp"
#include "rerender_task.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace livebar {
namespace progress {

class ProgressBar;

struct BarResult {
    std::shared_ptr<ProgressBar> bar;
    std::optional<BarErrorCode> error;
    
    bool ok() const { return bar != nullptr && !error.has_value(); }
};

// A started progress bar. Instances come from ProgressBarOptions::start() and are never
// restarted; starting the same options again creates a new instance.
class ProgressBar : public LivePrinter, public std::enable_shared_from_this<ProgressBar> {
public:
    using Clock = BarState::Clock;
    
    explicit ProgressBar(ProgressBarOptions options);
    ~ProgressBar() override;
    
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    // Returns nullptr when the bar has no total. Reaching the total stops the bar; a
    // stopped bar still counts but no longer renders.
    ProgressBar* add(int count);
    ProgressBar* increment();
    ProgressBar* updateTitle(const std::string& title);
    
    BarResult stop();
    
    void resetTimer();
    void setStartedAt(Clock::time_point when);
    std::chrono::nanoseconds getElapsedTime() const;
    
    std::string getString() const;
    
    bool isActive() const { return state_.isActive(); }
    int current() const { return state_.current(); }
    int total() const { return state_.total(); }
    std::string title() const { return state_.title(); }
    bool hasRerenderTask() const { return rerender_task_ != nullptr; }
    const ProgressBarOptions& options() const { return options_; }
    
    std::shared_ptr<LivePrinter> genericStart() override;
    std::shared_ptr<LivePrinter> genericStop() override;

private:
    friend struct ProgressBarOptions;
    
    ProgressBarOptions options_;
    BarState state_;
    std::unique_ptr<RerenderTask> rerender_task_;
    std::mutex output_mutex_;
    
    void activate(const std::optional<std::string>& title_override);
    // Deactivates once and performs the closing output; false if already inactive.
    bool finish();
    void updateProgress();
    void writeSafely(const char* action, const std::function<void()>& write);
};

}}
