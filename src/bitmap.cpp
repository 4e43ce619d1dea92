#include "alphaforge/bitmap.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace af {

static inline std::size_t idx(int y, int x, int W) {
    return (static_cast<std::size_t>(y) * W + x) * Bitmap::kChannels;
}

Rgba Bitmap::pixel(int x, int y) const {
    if (empty()) throw std::invalid_argument("Bitmap::pixel: empty image");
    if (!in_bounds(x, y)) throw std::out_of_range("Bitmap::pixel: coordinate out of range");

    const uint8_t* p = data() + idx(y, x, w());
    return Rgba{p[0], p[1], p[2], p[3]};
}

void Bitmap::set_pixel(int x, int y, const Rgba& px) {
    if (empty()) throw std::invalid_argument("Bitmap::set_pixel: empty image");
    if (!in_bounds(x, y)) throw std::out_of_range("Bitmap::set_pixel: coordinate out of range");
    if (px.a > kAlphaTransparent)
        throw std::invalid_argument("Bitmap::set_pixel: alpha must be 0..127");

    uint8_t* p = data() + idx(y, x, w());
    p[0] = px.r;
    p[1] = px.g;
    p[2] = px.b;
    p[3] = px.a;
}

void Bitmap::draw_pixel(int x, int y, const Rgba& px) {
    if (!alpha_blending_) {
        set_pixel(x, y, px);
        return;
    }
    set_pixel(x, y, alpha_blend(pixel(x, y), px));
}

void Bitmap::clear(const Rgba& px) {
    if (empty()) throw std::invalid_argument("Bitmap::clear: empty image");
    if (px.a > kAlphaTransparent)
        throw std::invalid_argument("Bitmap::clear: alpha must be 0..127");

    uint8_t* out = data();
    for (std::size_t i = 0; i < pixel_count(); ++i) {
        out[i * kChannels + 0] = px.r;
        out[i * kChannels + 1] = px.g;
        out[i * kChannels + 2] = px.b;
        out[i * kChannels + 3] = px.a;
    }
}

Bitmap Bitmap::clone() const {
    if (empty()) throw std::invalid_argument("Bitmap::clone: empty image");

    Bitmap dst(h(), w());
    const std::size_t total = pixel_count() * kChannels;
    std::copy(data(), data() + total, dst.data());
    dst.alpha_blending_ = alpha_blending_;
    dst.save_alpha_     = save_alpha_;
    return dst;
}

// src 疊在 dst 上；權重以 0..127 計算（整數除法）
Rgba alpha_blend(const Rgba& dst, const Rgba& src) {
    if (src.a == kAlphaOpaque)      return src;
    if (src.a == kAlphaTransparent) return dst;
    if (dst.a == kAlphaTransparent) return src;

    const int src_weight = kAlphaTransparent - src.a;
    const int dst_weight = (kAlphaTransparent - dst.a) * src.a / kAlphaTransparent;
    const int tot_weight = src_weight + dst_weight;

    Rgba out;
    out.a = static_cast<uint8_t>(src.a * dst.a / kAlphaTransparent);
    out.r = static_cast<uint8_t>((src.r * src_weight + dst.r * dst_weight) / tot_weight);
    out.g = static_cast<uint8_t>((src.g * src_weight + dst.g * dst_weight) / tot_weight);
    out.b = static_cast<uint8_t>((src.b * src_weight + dst.b * dst_weight) / tot_weight);
    return out;
}

} // namespace af
