#include "livebar/progress/progress_bar.hpp"
#include "livebar/progress/bar_registry.hpp"
#include "livebar/progress/layout.hpp"
#include "livebar/common/logger.hpp"
#include <utility>

namespace livebar {
namespace progress {

ProgressBar::ProgressBar(ProgressBarOptions options)
    : options_(std::move(options)),
      state_(options_.title, options_.current, options_.total) {
    if (!options_.output) {
        options_.output = terminal::StreamSink::standardOutput();
    }
    if (!options_.terminal) {
        options_.terminal = terminal::SystemTerminal::standardOutput();
    }
    if (!options_.registry) {
        options_.registry = BarRegistry::processDefault();
    }
}

ProgressBar::~ProgressBar() {
    if (rerender_task_) {
        rerender_task_->stop();
    }
    if (finish()) {
        common::Logger::instance().debug("[ProgressBar] Released while active | title={} | current={} | total={}",
                                         state_.title(), state_.current(), state_.total());
    }
}

void ProgressBar::activate(const std::optional<std::string>& title_override) {
    options_.terminal->hideCursor();
    
    state_.activate();
    if (title_override) {
        state_.setTitle(*title_override);
    }
    
    if (options_.raw_output && options_.show_title) {
        writeSafely("title", [this]() { options_.output->writeLine(state_.title()); });
    }
    
    state_.stampStart(options_.started_at ? *options_.started_at : Clock::now());
    
    common::Logger::instance().debug("[ProgressBar] Started | title={} | total={} | current={}",
                                     state_.title(), state_.total(), state_.current());
    
    updateProgress();
    
    if (options_.show_elapsed_time && !options_.raw_output) {
        rerender_task_ = RerenderTask::every(options_.rerender_interval, [this]() {
            updateProgress();
            return isActive();
        });
    }
    
    options_.registry->add(shared_from_this());
}

ProgressBar* ProgressBar::add(int count) {
    if (state_.total() == 0) {
        common::Logger::instance().debug("[ProgressBar] Add ignored | code={} | title={}",
                                         BarErrorCodeHelper::toString(BarErrorCode::BAR_NOT_CONFIGURED),
                                         state_.title());
        return nullptr;
    }
    
    int reached = state_.add(count);
    updateProgress();
    
    if (reached >= state_.total()) {
        state_.raiseTotalTo(reached);
        updateProgress();
        stop();
    }
    
    return this;
}

ProgressBar* ProgressBar::increment() {
    add(1);
    return this;
}

ProgressBar* ProgressBar::updateTitle(const std::string& title) {
    state_.setTitle(title);
    updateProgress();
    return this;
}

BarResult ProgressBar::stop() {
    if (rerender_task_) {
        rerender_task_->stop();
    }
    
    if (!finish()) {
        common::Logger::instance().debug("[ProgressBar] Stop ignored | code={} | title={}",
                                         BarErrorCodeHelper::toString(BarErrorCode::BAR_ALREADY_STOPPED),
                                         state_.title());
        return BarResult{weak_from_this().lock(), std::nullopt};
    }
    
    common::Logger::instance().debug("[ProgressBar] Stopped | title={} | current={} | total={} | elapsed={}",
                                     state_.title(), state_.current(), state_.total(),
                                     formatDuration(roundDuration(getElapsedTime(), std::chrono::milliseconds(1))));
    
    return BarResult{weak_from_this().lock(), std::nullopt};
}

bool ProgressBar::finish() {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (!state_.deactivate()) {
            return false;
        }
        
        if (!options_.raw_output) {
            if (options_.remove_when_done) {
                writeSafely("clear", [this]() { options_.output->clearLine(); });
            } else {
                writeSafely("finalize", [this]() { options_.output->writeLine(); });
            }
        }
    }
    
    options_.terminal->showCursor();
    options_.registry->remove(this);
    return true;
}

void ProgressBar::resetTimer() {
    state_.stampStart(Clock::now());
}

void ProgressBar::setStartedAt(Clock::time_point when) {
    state_.stampStart(when);
}

std::chrono::nanoseconds ProgressBar::getElapsedTime() const {
    return state_.elapsed(Clock::now());
}

std::string ProgressBar::getString() const {
    return renderBar(state_.snapshot(Clock::now()), options_, options_.terminal->width());
}

std::shared_ptr<LivePrinter> ProgressBar::genericStart() {
    return options_.withTitle(state_.title())
        .withTotal(state_.total())
        .withCurrent(state_.current())
        .start().bar;
}

std::shared_ptr<LivePrinter> ProgressBar::genericStop() {
    return stop().bar;
}

void ProgressBar::updateProgress() {
    if (options_.raw_output || state_.total() == 0) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!state_.isActive()) {
        return;
    }
    
    std::string line = getString();
    writeSafely("render", [this, &line]() { options_.output->overwrite(line); });
}

void ProgressBar::writeSafely(const char* action, const std::function<void()>& write) {
    try {
        write();
    } catch (const std::exception& e) {
        common::Logger::instance().warn("[ProgressBar] Output failed | code={} | action={} | error={}",
                                        BarErrorCodeHelper::toString(BarErrorCode::SINK_WRITE_FAILED),
                                        action, e.what());
    }
}

}}
