#include "livebar/progress/bar_state.hpp"
#include <utility>

namespace livebar {
namespace progress {

BarState::BarState(std::string title, int current, int total)
    : current_(current),
      total_(total),
      started_at_ticks_(Clock::now().time_since_epoch().count()),
      title_(std::move(title)) {}

int BarState::add(int count) {
    return current_.fetch_add(count) + count;
}

void BarState::raiseTotalTo(int value) {
    int observed = total_.load();
    while (observed < value && !total_.compare_exchange_weak(observed, value)) {
    }
}

bool BarState::deactivate() {
    return active_.exchange(false);
}

std::string BarState::title() const {
    std::lock_guard<std::mutex> lock(title_mutex_);
    return title_;
}

void BarState::setTitle(std::string title) {
    std::lock_guard<std::mutex> lock(title_mutex_);
    title_ = std::move(title);
}

void BarState::stampStart(Clock::time_point when) {
    started_at_ticks_.store(std::chrono::duration_cast<Clock::duration>(when.time_since_epoch()).count());
}

BarState::Clock::time_point BarState::startedAt() const {
    return Clock::time_point(Clock::duration(started_at_ticks_.load()));
}

std::chrono::nanoseconds BarState::elapsed(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now - startedAt());
}

BarSnapshot BarState::snapshot(Clock::time_point now) const {
    BarSnapshot snap;
    snap.active = isActive();
    snap.title = title();
    snap.total = total();
    snap.current = current();
    snap.elapsed = elapsed(now);
    return snap;
}

}}
