#include "alphaforge/params.hpp"
#include "alphaforge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace af {

const char* to_string(Direction dir) {
    switch (dir) {
    case Direction::X:  return "x";
    case Direction::Y:  return "y";
    case Direction::XY: return "xy";
    case Direction::YX: return "yx";
    }
    return "?";
}

namespace params {

int blur(int passes) {
    return std::max(1, passes);
}

int brightness(int level) {
    return std::clamp(level, -255, 255);
}

int contrast(int level) {
    return std::clamp(level, -100, 100);
}

int smooth(int passes) {
    return std::clamp(passes, 1, 2048);
}

int percent(int p) {
    return std::clamp(p, 0, 100);
}

int opacity(double o) {
    if (std::isnan(o)) return 0;
    if (o <= 1.0) o *= 100.0;
    o = std::clamp(o, 0.0, 100.0);
    return static_cast<int>(std::lround(o));
}

int opacity_to_alpha(double opacity_percent) {
    const double p = std::clamp(opacity_percent, 0.0, 100.0);
    return static_cast<int>(std::lround((100.0 - p) / 100.0 * 127.0));
}

double rotate(double angle) {
    if (!std::isfinite(angle) || angle <= -360.0 || angle >= 360.0)
        throw InvalidAngle("rotate: angle must satisfy -360 < angle < 360, got "
                           + std::to_string(angle));
    return angle;
}

Direction direction(const std::string& dir) {
    // 去掉頭尾空白後轉小寫
    auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    auto first = std::find_if_not(dir.begin(), dir.end(), is_space);
    auto last  = std::find_if_not(dir.rbegin(), dir.rend(), is_space).base();

    std::string s;
    for (auto it = first; it < last; ++it)
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));

    if (s == "x")  return Direction::X;
    if (s == "y")  return Direction::Y;
    if (s == "xy") return Direction::XY;
    if (s == "yx") return Direction::YX;
    throw InvalidDirection("flip: direction must be one of x, y, xy, yx, got \"" + dir + "\"");
}

} // namespace params
} // namespace af
