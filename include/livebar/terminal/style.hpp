#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <initializer_list>

namespace livebar {
namespace terminal {

enum class Color : int {
    Reset = 0,
    Bold = 1,
    Black = 30,
    Red = 31,
    Green = 32,
    Yellow = 33,
    Blue = 34,
    Magenta = 35,
    Cyan = 36,
    White = 37,
    Gray = 90,
    LightRed = 91,
    LightGreen = 92,
    LightYellow = 93,
    LightBlue = 94,
    LightMagenta = 95,
    LightCyan = 96,
    LightWhite = 97
};

// Ordered list of SGR attributes applied as one escape sequence.
class Style {
public:
    Style() = default;
    Style(std::initializer_list<Color> colors) : colors_(colors) {}
    
    std::string apply(const std::string& text) const;
    
    bool empty() const { return colors_.empty(); }
    const std::vector<Color>& colors() const { return colors_; }

private:
    std::vector<Color> colors_;
};

struct RGB {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    
    // Linear interpolation towards `end` as `current` moves from `min` to `max`.
    // The fraction is clamped to [0, 1].
    RGB fade(double min, double max, double current, const RGB& end) const;
    
    std::string apply(const std::string& text) const;
    
    bool operator==(const RGB& other) const {
        return red == other.red && green == other.green && blue == other.blue;
    }
};

std::string removeColor(const std::string& text);

// Number of terminal cells once escape sequences are removed, counting UTF-8 code points.
size_t visibleLength(const std::string& text);

std::string repeat(const std::string& text, int count);

}}
