#include "livebar/terminal/output.hpp"
#include <iostream>

namespace livebar {
namespace terminal {

std::shared_ptr<StreamSink> StreamSink::standardOutput() {
    static auto instance = std::make_shared<StreamSink>(std::cout);
    return instance;
}

void StreamSink::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << std::flush;
    if (!out_) {
        out_.clear();
        throw std::ios_base::failure("output stream write failed");
    }
}

}}
