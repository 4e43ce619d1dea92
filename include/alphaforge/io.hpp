#pragma once

#include <string>
#include "alphaforge/bitmap.hpp"

namespace af {

// 讀檔一律轉成 RGBA，alpha 轉為 0..127（127 - A/2）
Bitmap load_bitmap(const std::string& path);

// .png / .jpg；save_alpha 為 true 時 png 會寫出 alpha 通道
void save_bitmap(const std::string& path, const Bitmap& image);

// 邊界換算：8-bit alpha（255 = 不透明）<-> 7-bit 反向 alpha（0 = 不透明）
inline uint8_t alpha_from_8bit(uint8_t a8) {
    return static_cast<uint8_t>(127 - (a8 >> 1));
}

inline uint8_t alpha_to_8bit(uint8_t a7) {
    return static_cast<uint8_t>(255 - ((a7 << 1) + (a7 >> 6)));
}

} // namespace af
