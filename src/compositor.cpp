#include "alphaforge/compositor.hpp"
#include "alphaforge/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

namespace af {

static inline std::size_t idx(int y, int x, int W) {
    return (static_cast<std::size_t>(y) * W + x) * Bitmap::kChannels;
}

// alpha 超過 127（例如外部緩衝區寫壞）一律當作全透明
static inline double opacity_of(uint8_t a) {
    const double av = std::min(static_cast<double>(a), 127.0);
    return (127.0 - av) / 127.0;
}

static inline uint8_t round_clamp(double v, double hi) {
    v = std::clamp(static_cast<double>(std::lround(v)), 0.0, hi);
    return static_cast<uint8_t>(v);
}

static inline void merge_px(uint8_t* d, const uint8_t* s, double factor) {
    const double o_eff = opacity_of(s[3]) * factor;
    const double o_dst = opacity_of(d[3]);

    for (int c = 0; c < 3; ++c) {
        const double v = s[c] * o_eff + d[c] * (1.0 - o_eff);
        d[c] = round_clamp(v, 255.0);
    }
    const double a = 127.0 * (1.0 - (o_eff + o_dst * (1.0 - o_eff)));
    d[3] = round_clamp(a, 127.0);
}

Rgba merge_pixel(const Rgba& dst, const Rgba& src, double opacity_percent) {
    if (std::isnan(opacity_percent)) opacity_percent = 0.0;
    const double factor = std::clamp(opacity_percent, 0.0, 100.0) / 100.0;
    uint8_t d[4] = {dst.r, dst.g, dst.b, dst.a};
    const uint8_t s[4] = {src.r, src.g, src.b, src.a};
    merge_px(d, s, factor);
    return Rgba{d[0], d[1], d[2], d[3]};
}

static bool rect_inside(const Bitmap& img, Point off, Size size) {
    if (off.x < 0 || off.y < 0) return false;
    // 以 long long 比較避免 off + size 溢位
    return static_cast<long long>(off.x) + size.w <= img.w()
        && static_cast<long long>(off.y) + size.h <= img.h();
}

void merge_alpha(Bitmap& dst,
                 const Bitmap& src,
                 Point dst_offset,
                 Point src_offset,
                 Size size,
                 double opacity_percent,
                 Backend backend) {
    if (dst.empty() || src.empty())
        throw std::invalid_argument("merge_alpha: empty image");
    if (size.w < 0 || size.h < 0)
        throw RegionOutOfBounds("merge_alpha: negative region size");
    if (!rect_inside(src, src_offset, size))
        throw RegionOutOfBounds("merge_alpha: source region exceeds source bounds");
    if (!rect_inside(dst, dst_offset, size))
        throw RegionOutOfBounds("merge_alpha: destination region exceeds destination bounds");

    if (size.w == 0 || size.h == 0) return;

    if (std::isnan(opacity_percent)) opacity_percent = 0.0;
    const double factor = std::clamp(opacity_percent, 0.0, 100.0) / 100.0;

    const int SW = src.w();
    const int DW = dst.w();

    // src 與 dst 共用同一塊 buffer 時，先把來源區域複製出來（避免讀到已寫過的像素）
    const uint8_t* in = src.data();
    int in_w = SW;
    Point in_off = src_offset;
    Bitmap snapshot;
    if (src.data() == dst.data()) {
        snapshot = Bitmap(size.h, size.w);
        for (int y = 0; y < size.h; ++y) {
            const uint8_t* row = src.data() + idx(src_offset.y + y, src_offset.x, SW);
            std::copy(row, row + static_cast<std::size_t>(size.w) * Bitmap::kChannels,
                      snapshot.data() + idx(y, 0, size.w));
        }
        in = snapshot.data();
        in_w = size.w;
        in_off = Point{0, 0};
    }

    uint8_t* out = dst.data();
    const bool parallel = resolve_backend(backend) == Backend::OpenMP;
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < size.h; ++y) {
        for (int x = 0; x < size.w; ++x) {
            const uint8_t* s = in + idx(in_off.y + y, in_off.x + x, in_w);
            uint8_t* d = out + idx(dst_offset.y + y, dst_offset.x + x, DW);
            merge_px(d, s, factor);
        }
    }
}

} // namespace af
