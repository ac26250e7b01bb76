#include "livebar/progress/bar_registry.hpp"
#include "livebar/progress/progress_bar.hpp"
#include <algorithm>

namespace livebar {
namespace progress {

std::shared_ptr<BarRegistry> BarRegistry::processDefault() {
    static auto instance = std::make_shared<BarRegistry>();
    return instance;
}

void BarRegistry::add(const std::shared_ptr<ProgressBar>& bar) {
    if (!bar) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    sweepLocked();
    bars_.push_back(bar);
}

void BarRegistry::remove(const ProgressBar* bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    bars_.erase(std::remove_if(bars_.begin(), bars_.end(),
        [bar](const std::weak_ptr<ProgressBar>& entry) {
            auto locked = entry.lock();
            return !locked || locked.get() == bar;
        }), bars_.end());
}

std::vector<std::shared_ptr<ProgressBar>> BarRegistry::activeBars() const {
    std::vector<std::shared_ptr<ProgressBar>> result;
    
    std::lock_guard<std::mutex> lock(mutex_);
    sweepLocked();
    for (const auto& entry : bars_) {
        auto bar = entry.lock();
        if (bar && bar->isActive()) {
            result.push_back(std::move(bar));
        }
    }
    return result;
}

bool BarRegistry::anyActive() const {
    return !activeBars().empty();
}

size_t BarRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    sweepLocked();
    return bars_.size();
}

void BarRegistry::sweepLocked() const {
    bars_.erase(std::remove_if(bars_.begin(), bars_.end(),
        [](const std::weak_ptr<ProgressBar>& entry) { return entry.expired(); }), bars_.end());
}

}}
