#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "alphaforge/bitmap.hpp"
#include "alphaforge/color.hpp"
#include "alphaforge/filters.hpp"

namespace af {

enum class BlurKind {
    Selective = 0,
    Gaussian = 1,
};

// 文字參數原封不動交給 renderer（字型大小、位置、顏色…）
using TextParams = std::map<std::string, std::string>;

using TextRenderer = std::function<void(Bitmap& image,
                                        const std::string& text,
                                        const std::string& font_file,
                                        const TextParams& params)>;

// ------------------------------------------------------------
// 對外效果 API
//
// 原地修改：sepia / grayscale / pixelate / edges / emboss / invert / blur /
//           brightness / contrast / colorize / mean_remove / smooth / fill / text
// 回傳新畫布：opacity / rotate / flip
// desaturate：percent == 100 時原地灰階並回傳「同一個」handle；
//             其他情況回傳新配置的灰階副本，原圖則被就地混合成結果。
// 被取代的舊畫布由呼叫端自行處理。
// ------------------------------------------------------------
class Filter {
public:
    // primitive 為 nullptr 時使用 NativeFilters
    explicit Filter(std::shared_ptr<FilterPrimitive> primitive = nullptr,
                    Backend backend = Backend::Auto);

    void set_text_renderer(TextRenderer renderer) { text_renderer_ = std::move(renderer); }

    FilterPrimitive& primitive() const { return *primitive_; }
    Backend backend() const { return backend_; }

    void sepia(Bitmap& image) const;
    void grayscale(Bitmap& image) const;
    void pixelate(Bitmap& image, int block_size = 10) const;
    void edges(Bitmap& image) const;
    void emboss(Bitmap& image) const;
    void invert(Bitmap& image) const;
    void blur(Bitmap& image, int passes = 1, BlurKind kind = BlurKind::Selective) const;
    void brightness(Bitmap& image, int level) const;
    void contrast(Bitmap& image, int level) const;

    // opacity 接受 0..1 或 0..100
    void colorize(Bitmap& image, const ColorValue& color, double opacity) const;

    void mean_remove(Bitmap& image) const;
    void smooth(Bitmap& image, int passes = 1) const;

    BitmapHandle desaturate(const BitmapHandle& image, int percent = 100) const;

    // opacity 接受 0..1 或 0..100
    BitmapHandle opacity(const Bitmap& image, double opacity) const;

    BitmapHandle rotate(const Bitmap& image,
                        double angle,
                        const ColorValue& bg_color = std::string("#000000")) const;

    BitmapHandle flip(const Bitmap& image, const std::string& direction) const;

    void fill(Bitmap& image, const ColorValue& color = std::string("#000000")) const;

    void text(Bitmap& image,
              const std::string& text,
              const std::string& font_file,
              const TextParams& params = TextParams{}) const;

private:
    std::shared_ptr<FilterPrimitive> primitive_;
    Backend backend_;
    TextRenderer text_renderer_;
};

// 整張畫布直接覆寫成 color（Filter::fill 的實作）
void fill(Bitmap& image, const ColorSpec& color, Backend backend = Backend::Auto);

// 新畫布先填全透明，再以 opacity_percent 把 src 混合上去
Bitmap opacity(const Bitmap& src, int opacity_percent, Backend backend = Backend::Auto);

} // namespace af
