#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace livebar {
namespace progress {

struct BarSnapshot {
    std::string title;
    int current = 0;
    int total = 0;
    bool active = false;
    std::chrono::nanoseconds elapsed{0};
};

// Mutable state of one live bar. Numeric fields are atomics and the title has its own
// lock, so a snapshot is consistent per field only: a render may pair a title and a
// count taken a few instructions apart.
class BarState {
public:
    using Clock = std::chrono::steady_clock;
    
    BarState(std::string title, int current, int total);
    
    BarState(const BarState&) = delete;
    BarState& operator=(const BarState&) = delete;
    
    // Returns the value after the addition.
    int add(int count);
    int current() const { return current_.load(); }
    
    int total() const { return total_.load(); }
    // Raises total to `value` if it is currently lower.
    void raiseTotalTo(int value);
    
    bool isActive() const { return active_.load(); }
    void activate() { active_.store(true); }
    // True only for the caller that actually flipped the flag.
    bool deactivate();
    
    std::string title() const;
    void setTitle(std::string title);
    
    void stampStart(Clock::time_point when);
    Clock::time_point startedAt() const;
    std::chrono::nanoseconds elapsed(Clock::time_point now) const;
    
    BarSnapshot snapshot(Clock::time_point now) const;

private:
    std::atomic<int> current_;
    std::atomic<int> total_;
    std::atomic<bool> active_{false};
    std::atomic<int64_t> started_at_ticks_;
    
    mutable std::mutex title_mutex_;
    std::string title_;
};

}}
