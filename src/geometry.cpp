#include "alphaforge/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace af {

static inline std::size_t idx(int y, int x, int c, int W) {
    return (static_cast<std::size_t>(y) * W + x) * Bitmap::kChannels + c;
}

static constexpr int C = Bitmap::kChannels;

// 新畫布：先填全透明，並開啟 alpha 保存，避免預設的不透明黑色
static Bitmap transparent_canvas(int h, int w) {
    Bitmap dst(h, w);
    dst.clear(Rgba{0, 0, 0, kAlphaTransparent});
    dst.set_save_alpha(true);
    return dst;
}

// ======================
//  Flip
// ======================
static Bitmap flip_horizontal_impl(const Bitmap& src, bool parallel) {
    if (src.empty()) throw std::invalid_argument("flip_horizontal: empty image");

    const int H = src.h();
    const int W = src.w();
    const uint8_t* in = src.data();

    Bitmap dst = transparent_canvas(H, W);
    uint8_t* out = dst.data();
    (void)parallel;

    // 一次搬一整欄：第 x 欄 <- 第 W-1-x 欄
#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int x = 0; x < W; ++x) {
        const int sx = W - 1 - x;
        for (int y = 0; y < H; ++y) {
            std::copy(in + idx(y, sx, 0, W), in + idx(y, sx, 0, W) + C,
                      out + idx(y, x, 0, W));
        }
    }

    return dst;
}

static Bitmap flip_vertical_impl(const Bitmap& src, bool parallel) {
    if (src.empty()) throw std::invalid_argument("flip_vertical: empty image");

    const int H = src.h();
    const int W = src.w();
    const uint8_t* in = src.data();
    const std::size_t row_bytes = static_cast<std::size_t>(W) * C;

    Bitmap dst = transparent_canvas(H, W);
    uint8_t* out = dst.data();
    (void)parallel;

    // 整條 scanline 複製：第 y 列 <- 第 H-1-y 列
#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < H; ++y) {
        const int sy = H - 1 - y;
        std::copy(in + idx(sy, 0, 0, W), in + idx(sy, 0, 0, W) + row_bytes,
                  out + idx(y, 0, 0, W));
    }

    return dst;
}

// ======================
//  Rotate
// ======================

// 90 的倍數：逐像素精確搬移（順時針 quarter_turns 次）
static Bitmap rotate_quarter(const Bitmap& src, int quarter_turns, bool parallel) {
    const int H = src.h();
    const int W = src.w();
    const uint8_t* in = src.data();

    const bool swap = (quarter_turns % 2) != 0;
    const int out_h = swap ? W : H;
    const int out_w = swap ? H : W;

    Bitmap dst = transparent_canvas(out_h, out_w);
    uint8_t* out = dst.data();
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < out_h; ++y) {
        for (int x = 0; x < out_w; ++x) {
            int sx = x, sy = y;
            switch (quarter_turns) {
            case 1: sx = y;         sy = H - 1 - x; break;  // 90
            case 2: sx = W - 1 - x; sy = H - 1 - y; break;  // 180
            case 3: sx = W - 1 - y; sy = x;         break;  // 270
            default: break;
            }
            std::copy(in + idx(sy, sx, 0, W), in + idx(sy, sx, 0, W) + C,
                      out + idx(y, x, 0, out_w));
        }
    }

    return dst;
}

// 任意角度：以中心為旋轉軸的 bilinear，輸出尺寸為包圍框
static Bitmap rotate_bilinear(const Bitmap& src, double angle_deg,
                              const Rgba& bg, bool parallel) {
    const int H = src.h();
    const int W = src.w();
    const uint8_t* in = src.data();

    const double pi = std::acos(-1.0);
    const double rad = angle_deg * pi / 180.0;
    const double cos_t = std::cos(rad);
    const double sin_t = std::sin(rad);

    // 1e-9：避免 cos/sin 的浮點誤差讓 ceil 多出一個像素
    const int out_w = std::max(1, static_cast<int>(std::ceil(
        std::fabs(W * cos_t) + std::fabs(H * sin_t) - 1e-9)));
    const int out_h = std::max(1, static_cast<int>(std::ceil(
        std::fabs(W * sin_t) + std::fabs(H * cos_t) - 1e-9)));

    Bitmap dst = transparent_canvas(out_h, out_w);
    uint8_t* out = dst.data();
    const uint8_t bg_px[C] = {bg.r, bg.g, bg.b, bg.a};
    (void)parallel;

    const double cx  = (W - 1) * 0.5;
    const double cy  = (H - 1) * 0.5;
    const double ocx = (out_w - 1) * 0.5;
    const double ocy = (out_h - 1) * 0.5;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < out_h; ++y) {
        for (int x = 0; x < out_w; ++x) {
            // 目的座標 (x, y) 對應回原圖座標 (sx, sy)
            const double dx = x - ocx;
            const double dy = y - ocy;

            const double sx =  cos_t * dx + sin_t * dy + cx;
            const double sy = -sin_t * dx + cos_t * dy + cy;

            // 落在原圖範圍外 → 背景色
            if (sx < -0.5 || sx > W - 0.5 || sy < -0.5 || sy > H - 0.5) {
                std::copy(bg_px, bg_px + C, out + idx(y, x, 0, out_w));
                continue;
            }

            const int x0 = static_cast<int>(std::floor(sx));
            const int y0 = static_cast<int>(std::floor(sy));
            const double fx = sx - x0;
            const double fy = sy - y0;

            const int xa = std::clamp(x0,     0, W - 1);
            const int xb = std::clamp(x0 + 1, 0, W - 1);
            const int ya = std::clamp(y0,     0, H - 1);
            const int yb = std::clamp(y0 + 1, 0, H - 1);

            for (int c = 0; c < C; ++c) {
                const double v00 = in[idx(ya, xa, c, W)];
                const double v10 = in[idx(ya, xb, c, W)];
                const double v01 = in[idx(yb, xa, c, W)];
                const double v11 = in[idx(yb, xb, c, W)];

                const double v0 = v00 + (v10 - v00) * fx;
                const double v1 = v01 + (v11 - v01) * fx;
                double v = v0 + (v1 - v0) * fy;

                v = std::round(v);
                v = std::clamp(v, 0.0, c == 3 ? 127.0 : 255.0);
                out[idx(y, x, c, out_w)] = static_cast<uint8_t>(v);
            }
        }
    }

    return dst;
}

// ======================
//  Public APIs with Backend
// ======================

Bitmap flip_horizontal(const Bitmap& src, Backend backend) {
    return flip_horizontal_impl(src, resolve_backend(backend) == Backend::OpenMP);
}

Bitmap flip_vertical(const Bitmap& src, Backend backend) {
    return flip_vertical_impl(src, resolve_backend(backend) == Backend::OpenMP);
}

Bitmap flip(const Bitmap& src, Direction dir, Backend backend) {
    switch (dir) {
    case Direction::X:
        return flip_horizontal(src, backend);
    case Direction::Y:
        return flip_vertical(src, backend);
    case Direction::XY:
    case Direction::YX:
    default: {
        // 兩步各自配置新畫布；x、y 可交換，固定先 x 再 y
        Bitmap tmp = flip_horizontal(src, backend);
        return flip_vertical(tmp, backend);
    }
    }
}

Bitmap flip(const Bitmap& src, const std::string& dir, Backend backend) {
    return flip(src, params::direction(dir), backend);
}

Bitmap rotate(const Bitmap& src,
              double angle_deg,
              const ColorSpec& bg,
              Backend backend) {
    const double angle = params::rotate(angle_deg);
    const Rgba bg_px = normalize_color(bg).rgba();
    if (src.empty()) throw std::invalid_argument("rotate: empty image");

    const bool parallel = resolve_backend(backend) == Backend::OpenMP;

    Bitmap dst;
    const double turns = angle / 90.0;
    if (turns == std::floor(turns)) {
        int q = static_cast<int>(turns) % 4;
        if (q < 0) q += 4;
        dst = rotate_quarter(src, q, parallel);
    } else {
        dst = rotate_bilinear(src, angle, bg_px, parallel);
    }

    dst.set_save_alpha(true);
    dst.set_alpha_blending(true);
    return dst;
}

} // namespace af
