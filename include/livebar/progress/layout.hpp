#pragma once

#include "bar_state.hpp"
#include "progress_options.hpp"
#include <chrono>
#include <string>

namespace livebar {
namespace progress {

int effectiveWidth(int terminal_width, int max_width);

// Digits needed to print `total`, used to zero-pad the current count.
int countPadding(int total);

int percentageRound(int total, int current);

// Rounds half away from zero to a multiple of `multiple`; non-positive multiples leave
// the duration untouched.
std::chrono::nanoseconds roundDuration(std::chrono::nanoseconds value, std::chrono::nanoseconds multiple);

// "0s", "750ms", "1.5s", "2m3s", "1h0m0s".
std::string formatDuration(std::chrono::nanoseconds value);

std::string renderBar(const BarSnapshot& snapshot, const ProgressBarOptions& options, int terminal_width);

}}
