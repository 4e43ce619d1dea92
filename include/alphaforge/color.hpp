#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "bitmap.hpp"

namespace af {

// 正規化後的顏色：r/g/b 0..255，a 0..127（0 = 不透明）
struct ColorSpec {
    int r = 0;
    int g = 0;
    int b = 0;
    int a = 0;

    Rgba rgba() const {
        return Rgba{static_cast<uint8_t>(r), static_cast<uint8_t>(g),
                    static_cast<uint8_t>(b), static_cast<uint8_t>(a)};
    }

    bool operator==(const ColorSpec& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const ColorSpec& o) const { return !(*this == o); }
};

// 呼叫端可以給：hex 字串、3/4 個整數、或已經建好的 ColorSpec
using ColorValue = std::variant<std::string, std::vector<int>, ColorSpec>;

// "#RRGGBB" 或 "RRGGBB"；alpha 固定為 0
ColorSpec parse_hex_color(const std::string& hex);

// {r, g, b} 或 {r, g, b, a}；alpha 省略時為 0
ColorSpec color_from_components(const std::vector<int>& components);

// 依 ColorValue 實際型別分派；ColorSpec 也會重新檢查範圍
ColorSpec normalize_color(const ColorValue& value);

// "#RRGGBB"（大寫），不含 alpha
std::string to_hex(const ColorSpec& color);

} // namespace af
