#include "alphaforge/effects.hpp"
#include "alphaforge/compositor.hpp"
#include "alphaforge/errors.hpp"
#include "alphaforge/geometry.hpp"
#include "alphaforge/params.hpp"

#include <algorithm>
#include <stdexcept>

namespace af {

static constexpr int C = Bitmap::kChannels;

// ============================================================
// 共用實作
// ============================================================

void fill(Bitmap& image, const ColorSpec& color, Backend backend) {
    const Rgba px = normalize_color(color).rgba();
    if (image.empty()) throw std::invalid_argument("fill: empty image");

    // 保留 alpha，關掉混合：填色直接覆寫
    image.set_save_alpha(true);
    image.set_alpha_blending(false);

    uint8_t* out = image.data();
    const int H = image.h();
    const std::size_t row = static_cast<std::size_t>(image.w());
    const bool parallel = resolve_backend(backend) == Backend::OpenMP;
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < H; ++y) {
        uint8_t* p = out + static_cast<std::size_t>(y) * row * C;
        for (std::size_t x = 0; x < row; ++x, p += C) {
            p[0] = px.r;
            p[1] = px.g;
            p[2] = px.b;
            p[3] = px.a;
        }
    }
}

Bitmap opacity(const Bitmap& src, int opacity_percent, Backend backend) {
    if (src.empty()) throw std::invalid_argument("opacity: empty image");

    const int H = src.h();
    const int W = src.w();

    Bitmap dst(H, W);
    dst.clear(Rgba{0, 0, 0, kAlphaTransparent});
    dst.set_save_alpha(true);

    merge_alpha(dst, src, Point{0, 0}, Point{0, 0}, Size{W, H},
                params::percent(opacity_percent), backend);
    return dst;
}

// ============================================================
// Filter
// ============================================================

Filter::Filter(std::shared_ptr<FilterPrimitive> primitive, Backend backend)
    : primitive_(std::move(primitive)), backend_(backend)
{
    if (!primitive_) primitive_ = std::make_shared<NativeFilters>(backend_);
}

void Filter::sepia(Bitmap& image) const {
    grayscale(image);

    FilterParams p;
    p.red = 100;
    p.green = 50;
    p.blue = 0;
    apply_filter(*primitive_, image, FilterKind::Colorize, p);
}

void Filter::grayscale(Bitmap& image) const {
    apply_filter(*primitive_, image, FilterKind::Grayscale);
}

void Filter::pixelate(Bitmap& image, int block_size) const {
    FilterParams p;
    p.block_size = block_size;
    p.average = true;
    apply_filter(*primitive_, image, FilterKind::Pixelate, p);
}

void Filter::edges(Bitmap& image) const {
    apply_filter(*primitive_, image, FilterKind::EdgeDetect);
}

void Filter::emboss(Bitmap& image) const {
    apply_filter(*primitive_, image, FilterKind::Emboss);
}

void Filter::invert(Bitmap& image) const {
    apply_filter(*primitive_, image, FilterKind::Negate);
}

void Filter::blur(Bitmap& image, int passes, BlurKind kind) const {
    const int n = params::blur(passes);
    const FilterKind fk = (kind == BlurKind::Gaussian) ? FilterKind::GaussianBlur
                                                       : FilterKind::SelectiveBlur;
    // 每一次都是獨立的整張 pass
    for (int i = 0; i < n; ++i) {
        apply_filter(*primitive_, image, fk);
    }
}

void Filter::brightness(Bitmap& image, int level) const {
    FilterParams p;
    p.level = params::brightness(level);
    apply_filter(*primitive_, image, FilterKind::Brightness, p);
}

void Filter::contrast(Bitmap& image, int level) const {
    FilterParams p;
    p.level = params::contrast(level);
    apply_filter(*primitive_, image, FilterKind::Contrast, p);
}

void Filter::colorize(Bitmap& image, const ColorValue& color, double opacity) const {
    const ColorSpec c = normalize_color(color);
    const int percent = params::opacity(opacity);

    FilterParams p;
    p.red = c.r;
    p.green = c.g;
    p.blue = c.b;
    p.alpha = params::opacity_to_alpha(percent);
    apply_filter(*primitive_, image, FilterKind::Colorize, p);
}

void Filter::mean_remove(Bitmap& image) const {
    apply_filter(*primitive_, image, FilterKind::MeanRemoval);
}

// passes 夾在 1..2048 後當作 smooth kernel 的中心權重
void Filter::smooth(Bitmap& image, int passes) const {
    FilterParams p;
    p.weight = static_cast<float>(params::smooth(passes));
    apply_filter(*primitive_, image, FilterKind::Smooth, p);
}

BitmapHandle Filter::desaturate(const BitmapHandle& image, int percent) const {
    if (!image || image->empty()) throw std::invalid_argument("desaturate: empty image");

    percent = params::percent(percent);
    if (percent == 100) {
        grayscale(*image);
        return image;
    }

    // 原圖的 raw 副本（不混合）→ 灰階 → 以 percent 混合回原圖
    Bitmap copy = image->clone();
    copy.set_alpha_blending(false);
    grayscale(copy);

    merge_alpha(*image, copy, Point{0, 0}, Point{0, 0},
                Size{image->w(), image->h()}, percent, backend_);

    return make_handle(std::move(copy));
}

BitmapHandle Filter::opacity(const Bitmap& image, double value) const {
    return make_handle(af::opacity(image, params::opacity(value), backend_));
}

BitmapHandle Filter::rotate(const Bitmap& image, double angle, const ColorValue& bg_color) const {
    const double a = params::rotate(angle);
    const ColorSpec bg = normalize_color(bg_color);
    return make_handle(af::rotate(image, a, bg, backend_));
}

BitmapHandle Filter::flip(const Bitmap& image, const std::string& direction) const {
    const Direction dir = params::direction(direction);
    return make_handle(af::flip(image, dir, backend_));
}

void Filter::fill(Bitmap& image, const ColorValue& color) const {
    af::fill(image, normalize_color(color), backend_);
}

void Filter::text(Bitmap& image,
                  const std::string& text,
                  const std::string& font_file,
                  const TextParams& params) const {
    if (!text_renderer_)
        throw UnsupportedFilterKind("text: no text renderer installed");
    text_renderer_(image, text, font_file, params);
}

} // namespace af
