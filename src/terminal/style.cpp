#include "livebar/terminal/style.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace livebar {
namespace terminal {

namespace {

constexpr const char* RESET_SEQUENCE = "\033[0m";

uint8_t interpolate(uint8_t from, uint8_t to, double fraction) {
    double value = from + (static_cast<double>(to) - from) * fraction;
    return static_cast<uint8_t>(std::lround(std::clamp(value, 0.0, 255.0)));
}

}

std::string Style::apply(const std::string& text) const {
    if (colors_.empty() || text.empty()) {
        return text;
    }
    
    std::string codes;
    for (auto color : colors_) {
        if (!codes.empty()) {
            codes += ';';
        }
        codes += std::to_string(static_cast<int>(color));
    }
    
    return "\033[" + codes + "m" + text + RESET_SEQUENCE;
}

RGB RGB::fade(double min, double max, double current, const RGB& end) const {
    if (max <= min) {
        return end;
    }
    
    double fraction = std::clamp((current - min) / (max - min), 0.0, 1.0);
    
    return RGB{
        interpolate(red, end.red, fraction),
        interpolate(green, end.green, fraction),
        interpolate(blue, end.blue, fraction)
    };
}

std::string RGB::apply(const std::string& text) const {
    if (text.empty()) {
        return text;
    }
    return fmt::format("\033[38;2;{};{};{}m{}{}", red, green, blue, text, RESET_SEQUENCE);
}

std::string removeColor(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && !(text[j] >= 0x40 && text[j] <= 0x7E)) {
                ++j;
            }
            i = j;
            continue;
        }
        result += text[i];
    }
    
    return result;
}

size_t visibleLength(const std::string& text) {
    std::string plain = removeColor(text);
    
    size_t count = 0;
    for (unsigned char c : plain) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string repeat(const std::string& text, int count) {
    if (count <= 0 || text.empty()) {
        return "";
    }
    
    std::string result;
    result.reserve(text.size() * static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        result += text;
    }
    return result;
}

}}
