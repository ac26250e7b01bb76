#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace livebar {
namespace progress {

// Calls `tick` every `interval` on a dedicated thread until stop() is called or the
// callback returns false. stop() joins the thread, so no tick starts after it returns;
// a tick already running is allowed to finish. Calling stop() from inside a tick only
// requests the stop.
class RerenderTask {
public:
    using Tick = std::function<bool()>;
    
    RerenderTask(std::chrono::milliseconds interval, Tick tick);
    ~RerenderTask();
    
    RerenderTask(const RerenderTask&) = delete;
    RerenderTask& operator=(const RerenderTask&) = delete;
    
    static std::unique_ptr<RerenderTask> every(std::chrono::milliseconds interval, Tick tick);
    
    void start();
    void stop();
    
    bool isActive() const { return active_.load(); }
    size_t tickCount() const { return tick_count_.load(); }

private:
    std::chrono::milliseconds interval_;
    Tick tick_;
    
    std::thread worker_;
    std::mutex mutex_;
    std::mutex join_mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    
    std::atomic<bool> active_{false};
    std::atomic<size_t> tick_count_{0};
    
    void run();
};

}}
