#pragma once

#include <memory>
#include <mutex>
#include <vector>

namespace livebar {
namespace progress {

class ProgressBar;

// Bars that have been started and not yet stopped. Holds weak references only, so a
// bar dropped by its owner disappears from the registry without an explicit stop.
class BarRegistry {
public:
    BarRegistry() = default;
    
    BarRegistry(const BarRegistry&) = delete;
    BarRegistry& operator=(const BarRegistry&) = delete;
    
    static std::shared_ptr<BarRegistry> processDefault();
    
    void add(const std::shared_ptr<ProgressBar>& bar);
    void remove(const ProgressBar* bar);
    
    std::vector<std::shared_ptr<ProgressBar>> activeBars() const;
    bool anyActive() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::weak_ptr<ProgressBar>> bars_;
    
    void sweepLocked() const;
};

}}
