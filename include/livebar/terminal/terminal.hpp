#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>

namespace livebar {
namespace terminal {

// Geometry and cursor control of the terminal a bar is drawn on.
class Terminal {
public:
    virtual ~Terminal() = default;
    
    virtual int width() const = 0;
    virtual void hideCursor() = 0;
    virtual void showCursor() = 0;
};

class SystemTerminal : public Terminal {
public:
    SystemTerminal(std::ostream& out, int fd);
    
    static std::shared_ptr<SystemTerminal> standardOutput();
    
    int width() const override;
    void hideCursor() override;
    void showCursor() override;
    
    bool isInteractive() const;

private:
    std::ostream& out_;
    int fd_;
    std::mutex mutex_;
    mutable std::atomic<bool> fallback_logged_{false};
    
    void writeControl(const char* sequence);
};

}}
