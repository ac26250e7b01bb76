#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace livebar {
namespace terminal {

class OutputSink {
public:
    virtual ~OutputSink() = default;
    
    virtual void write(const std::string& text) = 0;
    
    virtual void writeLine(const std::string& text = "") {
        write(text + "\n");
    }
    
    // Returns the cursor to column 0 and prints `text` over the current line.
    virtual void overwrite(const std::string& text) {
        write("\r" + text);
    }
    
    virtual void clearLine() {
        write("\r\033[K");
    }
};

// Throws std::ios_base::failure when the underlying stream goes bad.
class StreamSink : public OutputSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}
    
    static std::shared_ptr<StreamSink> standardOutput();
    
    void write(const std::string& text) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

}}
