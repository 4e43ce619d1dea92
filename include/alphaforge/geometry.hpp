#pragma once

#include <string>
#include "alphaforge/bitmap.hpp"
#include "alphaforge/color.hpp"
#include "alphaforge/filters.hpp"  // 為了取得 Backend enum
#include "alphaforge/params.hpp"

namespace af {

// flip：回傳新畫布（先填全透明，再覆寫），來源不變
Bitmap flip(const Bitmap& src,
            Direction dir,
            Backend backend = Backend::Auto);

// 字串方向，先經過 params::direction 驗證
Bitmap flip(const Bitmap& src,
            const std::string& dir,
            Backend backend = Backend::Auto);

Bitmap flip_horizontal(const Bitmap& src,
                       Backend backend = Backend::Auto);

Bitmap flip_vertical(const Bitmap& src,
                     Backend backend = Backend::Auto);

// rotate：正角度為畫面上順時針；輸出畫布包住旋轉後內容，露出區域填 bg
Bitmap rotate(const Bitmap& src,
              double angle_deg,
              const ColorSpec& bg,
              Backend backend = Backend::Auto);

} // namespace af
