#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace livebar {
namespace progress {

enum class BarErrorCode {
    BAR_NOT_CONFIGURED = 100,
    BAR_ALREADY_STOPPED = 101,
    
    SINK_WRITE_FAILED = 200
};

using BarErrorCodeHelper = common::ErrorRegistry<BarErrorCode>;

}
}

namespace livebar {
namespace common {

template<>
inline const std::unordered_map<progress::BarErrorCode, ErrorInfo<progress::BarErrorCode>>& 
ErrorRegistry<progress::BarErrorCode>::getInfoMap() {
    static const std::unordered_map<progress::BarErrorCode, ErrorInfo<progress::BarErrorCode>> map = {
        {progress::BarErrorCode::BAR_NOT_CONFIGURED, {
            progress::BarErrorCode::BAR_NOT_CONFIGURED,
            "BAR_NOT_CONFIGURED",
            "Progress bar has no total"
        }},
        {progress::BarErrorCode::BAR_ALREADY_STOPPED, {
            progress::BarErrorCode::BAR_ALREADY_STOPPED,
            "BAR_ALREADY_STOPPED",
            "Progress bar is already stopped"
        }},
        {progress::BarErrorCode::SINK_WRITE_FAILED, {
            progress::BarErrorCode::SINK_WRITE_FAILED,
            "SINK_WRITE_FAILED",
            "Writing to the output sink failed"
        }}
    };
    return map;
}

}
}
