#include "livebar/terminal/terminal.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/logger.hpp"
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace livebar {
namespace terminal {

SystemTerminal::SystemTerminal(std::ostream& out, int fd)
    : out_(out), fd_(fd) {}

std::shared_ptr<SystemTerminal> SystemTerminal::standardOutput() {
    static auto instance = std::make_shared<SystemTerminal>(std::cout, STDOUT_FILENO);
    return instance;
}

int SystemTerminal::width() const {
    struct winsize w;
    if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    if (!fallback_logged_.exchange(true)) {
        common::Logger::instance().debug("[Terminal] Width unavailable, using fallback | fd={} | width={}",
                                         fd_, constants::terminal::FALLBACK_WIDTH);
    }
    return constants::terminal::FALLBACK_WIDTH;
}

void SystemTerminal::hideCursor() {
    writeControl("\033[?25l");
}

void SystemTerminal::showCursor() {
    writeControl("\033[?25h");
}

bool SystemTerminal::isInteractive() const {
    return isatty(fd_);
}

void SystemTerminal::writeControl(const char* sequence) {
    if (!isInteractive()) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << sequence << std::flush;
    if (!out_) {
        common::Logger::instance().debug("[Terminal] Control sequence write failed");
        out_.clear();
    }
}

}}
