#include "alphaforge/color.hpp"
#include "alphaforge/errors.hpp"

#include <cctype>
#include <cstdio>
#include <string>
#include <type_traits>

namespace af {

static int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

static void check_range(const ColorSpec& c, const char* fn) {
    auto bad = [](int v, int hi) { return v < 0 || v > hi; };
    if (bad(c.r, 255) || bad(c.g, 255) || bad(c.b, 255))
        throw InvalidColorComponent(std::string(fn) + ": r/g/b must be 0..255");
    if (bad(c.a, 127))
        throw InvalidColorComponent(std::string(fn) + ": alpha must be 0..127");
}

ColorSpec parse_hex_color(const std::string& hex) {
    std::string digits = hex;
    if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);

    if (digits.size() != 6)
        throw InvalidColorFormat("normalize_color: expected 6 hex digits, got \"" + hex + "\"");

    int v[6];
    for (int i = 0; i < 6; ++i) {
        v[i] = hex_digit(digits[i]);
        if (v[i] < 0)
            throw InvalidColorFormat("normalize_color: malformed hex color \"" + hex + "\"");
    }

    ColorSpec c;
    c.r = v[0] * 16 + v[1];
    c.g = v[2] * 16 + v[3];
    c.b = v[4] * 16 + v[5];
    c.a = 0;
    return c;
}

ColorSpec color_from_components(const std::vector<int>& components) {
    const std::size_t n = components.size();
    if (n != 3 && n != 4)
        throw InvalidColorFormat("normalize_color: expected 3 or 4 components, got "
                                 + std::to_string(n));

    ColorSpec c;
    c.r = components[0];
    c.g = components[1];
    c.b = components[2];
    c.a = (n == 4) ? components[3] : 0;

    check_range(c, "normalize_color");
    return c;
}

ColorSpec normalize_color(const ColorValue& value) {
    return std::visit([](const auto& v) -> ColorSpec {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return parse_hex_color(v);
        } else if constexpr (std::is_same_v<T, std::vector<int>>) {
            return color_from_components(v);
        } else {
            check_range(v, "normalize_color");
            return v;
        }
    }, value);
}

std::string to_hex(const ColorSpec& color) {
    check_range(color, "to_hex");
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return std::string(buf);
}

} // namespace af
