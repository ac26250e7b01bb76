#include "livebar/progress/rerender_task.hpp"
#include "livebar/common/logger.hpp"
#include <utility>

namespace livebar {
namespace progress {

RerenderTask::RerenderTask(std::chrono::milliseconds interval, Tick tick)
    : interval_(interval), tick_(std::move(tick)) {}

RerenderTask::~RerenderTask() {
    stop();
}

std::unique_ptr<RerenderTask> RerenderTask::every(std::chrono::milliseconds interval, Tick tick) {
    auto task = std::make_unique<RerenderTask>(interval, std::move(tick));
    task->start();
    return task;
}

void RerenderTask::start() {
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (worker_.joinable()) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    
    active_.store(true);
    worker_ = std::thread(&RerenderTask::run, this);
    
    common::Logger::instance().debug("[RerenderTask] Started | interval_ms={}", interval_.count());
}

void RerenderTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (!worker_.joinable()) {
        return;
    }
    
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Called from inside a tick: the loop exits once the tick returns.
        return;
    }
    
    worker_.join();
    active_.store(false);
    common::Logger::instance().debug("[RerenderTask] Stopped | ticks={}", tick_count_.load());
}

void RerenderTask::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
                break;
            }
        }
        
        bool keep_running = false;
        try {
            keep_running = tick_();
        } catch (const std::exception& e) {
            common::Logger::instance().error("[RerenderTask] Tick failed | error={}", e.what());
            keep_running = true;
        }
        tick_count_.fetch_add(1);
        
        if (!keep_running) {
            break;
        }
    }
    
    active_.store(false);
}

}}
