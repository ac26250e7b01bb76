#include "livebar/progress/layout.hpp"
#include "livebar/terminal/style.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace livebar {
namespace progress {

namespace {

const terminal::RGB PERCENTAGE_START{255, 0, 0};
const terminal::RGB PERCENTAGE_END{0, 255, 0};

const terminal::Style GRAY{terminal::Color::Gray};
const terminal::Style LIGHT_WHITE{terminal::Color::LightWhite};

std::string paint(const ProgressBarOptions& options, const std::optional<terminal::Style>& style,
                  const std::string& text) {
    if (!options.use_colors || !style) {
        return text;
    }
    return style->apply(text);
}

std::string paint(const ProgressBarOptions& options, const terminal::Style& style, const std::string& text) {
    return options.use_colors ? style.apply(text) : text;
}

// Prints `value / unit` with the remainder as a fraction, trailing zeros trimmed.
std::string formatFraction(uint64_t value, uint64_t unit) {
    std::string result = std::to_string(value / unit);
    uint64_t remainder = value % unit;
    if (remainder == 0) {
        return result;
    }
    
    int digits = 0;
    for (uint64_t u = unit; u > 1; u /= 10) {
        ++digits;
    }
    
    std::string fraction = fmt::format("{:0{}d}", remainder, digits);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return result + "." + fraction;
}

}

int effectiveWidth(int terminal_width, int max_width) {
    if (max_width <= 0) {
        return terminal_width;
    }
    return std::min(terminal_width, max_width);
}

int countPadding(int total) {
    int digits = 1;
    for (int64_t value = total; value >= 10; value /= 10) {
        ++digits;
    }
    return digits;
}

int percentageRound(int total, int current) {
    if (total == 0) {
        return 0;
    }
    return static_cast<int>(std::lround(static_cast<double>(current) / total * 100.0));
}

std::chrono::nanoseconds roundDuration(std::chrono::nanoseconds value, std::chrono::nanoseconds multiple) {
    if (multiple.count() <= 0) {
        return value;
    }
    
    auto remainder = value % multiple;
    if (value.count() < 0) {
        remainder = -remainder;
        if (remainder + remainder < multiple) {
            return value + remainder;
        }
        return value - multiple + remainder;
    }
    
    if (remainder + remainder < multiple) {
        return value - remainder;
    }
    return value + multiple - remainder;
}

std::string formatDuration(std::chrono::nanoseconds value) {
    int64_t count = value.count();
    if (count == 0) {
        return "0s";
    }
    
    std::string sign = count < 0 ? "-" : "";
    uint64_t ns = count < 0 ? static_cast<uint64_t>(-(count + 1)) + 1 : static_cast<uint64_t>(count);
    
    constexpr uint64_t MICROSECOND = 1000;
    constexpr uint64_t MILLISECOND = 1000 * MICROSECOND;
    constexpr uint64_t SECOND = 1000 * MILLISECOND;
    
    if (ns < MICROSECOND) {
        return sign + std::to_string(ns) + "ns";
    }
    if (ns < MILLISECOND) {
        return sign + formatFraction(ns, MICROSECOND) + "µs";
    }
    if (ns < SECOND) {
        return sign + formatFraction(ns, MILLISECOND) + "ms";
    }
    
    uint64_t total_seconds = ns / SECOND;
    uint64_t hours = total_seconds / 3600;
    uint64_t minutes = (total_seconds % 3600) / 60;
    std::string seconds = formatFraction(ns % (60 * SECOND), SECOND) + "s";
    
    if (hours > 0) {
        return fmt::format("{}{}h{}m{}", sign, hours, minutes, seconds);
    }
    if (minutes > 0) {
        return fmt::format("{}{}m{}", sign, minutes, seconds);
    }
    return sign + seconds;
}

std::string renderBar(const BarSnapshot& snapshot, const ProgressBarOptions& options, int terminal_width) {
    if (!snapshot.active || snapshot.total <= 0) {
        return "";
    }
    
    int total = snapshot.total;
    int current = std::clamp(snapshot.current, 0, total);
    int width = effectiveWidth(terminal_width, options.max_width);
    
    std::string before;
    if (options.show_title) {
        before += paint(options, options.title_style, snapshot.title) + " ";
    }
    if (options.show_count) {
        before += paint(options, GRAY, "[")
               + paint(options, LIGHT_WHITE, fmt::format("{:0{}d}", current, countPadding(total)))
               + paint(options, GRAY, "/")
               + paint(options, LIGHT_WHITE, std::to_string(total))
               + paint(options, GRAY, "]") + " ";
    }
    
    std::string after = " ";
    if (options.show_percentage) {
        std::string percentage = fmt::format("{:3d}%", percentageRound(total, current));
        if (options.use_colors) {
            percentage = PERCENTAGE_START.fade(0, total, current, PERCENTAGE_END).apply(percentage);
        }
        after += percentage + " ";
    }
    if (options.show_elapsed_time) {
        after += "| " + formatDuration(roundDuration(snapshot.elapsed, options.elapsed_rounding));
    }
    
    int bar_max_length = width
        - static_cast<int>(terminal::visibleLength(before))
        - static_cast<int>(terminal::visibleLength(after))
        - 1;
    
    int filled_length = static_cast<int>(static_cast<int64_t>(current) * bar_max_length / total);
    
    std::string bar;
    if (filled_length > 0) {
        bar = paint(options, options.bar_style,
                    terminal::repeat(options.bar_character, filled_length) + options.last_character);
    }
    
    int filler_length = std::max(0, bar_max_length - filled_length);
    if (filler_length > 0) {
        bar += paint(options, options.filler_style, terminal::repeat(options.bar_filler, filler_length));
    }
    
    return before + bar + after;
}

}}
