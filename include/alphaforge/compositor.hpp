#pragma once

#include "alphaforge/bitmap.hpp"
#include "alphaforge/filters.hpp"  // Backend

namespace af {

struct Point {
    int x = 0;
    int y = 0;
};

struct Size {
    int w = 0;
    int h = 0;
};

// 把 src 的 (src_offset, size) 區域依 alpha 與 opacity_percent 混合到 dst 的 dst_offset。
//
//   o     = (127 - a) / 127
//   o_eff = o_src * opacity_percent / 100
//   c     = round(c_src * o_eff + c_dst * (1 - o_eff))
//   a     = round(127 * (1 - (o_eff + o_dst * (1 - o_eff))))
//
// 四捨五入採 half-away-from-zero。任一矩形超出畫布 → RegionOutOfBounds，
// 此時 dst 完全不會被修改。
void merge_alpha(Bitmap& dst,
                 const Bitmap& src,
                 Point dst_offset,
                 Point src_offset,
                 Size size,
                 double opacity_percent,
                 Backend backend = Backend::Auto);

// 單一像素的混合（merge_alpha 的核心）
Rgba merge_pixel(const Rgba& dst, const Rgba& src, double opacity_percent);

} // namespace af
