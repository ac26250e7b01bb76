#pragma once

#include <memory>

namespace livebar {
namespace progress {

// Common surface of displays that redraw in place until stopped.
class LivePrinter {
public:
    virtual ~LivePrinter() = default;
    
    virtual std::shared_ptr<LivePrinter> genericStart() = 0;
    virtual std::shared_ptr<LivePrinter> genericStop() = 0;
};

}}
