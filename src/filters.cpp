#include "alphaforge/filters.hpp"
#include "alphaforge/errors.hpp"
#include "alphaforge/params.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace af {

// ============================================================
// 小工具：index 計算
// ============================================================

static constexpr int C = Bitmap::kChannels;

inline std::size_t linear_index(int y, int x, int c, int W) {
    return (static_cast<std::size_t>(y) * W + x) * C + c;
}

static inline uint8_t clamp_u8(int v) {
    return static_cast<uint8_t>(std::clamp(v, 0, 255));
}

static inline uint8_t clamp_alpha(int v) {
    return static_cast<uint8_t>(std::clamp(v, 0, 127));
}

static std::string lower(const std::string& s) {
    std::string out(s);
    for (char& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

Backend parse_backend(const std::string& s) {
    const std::string v = lower(s);
    if (v == "auto")   return resolve_backend(Backend::Auto);
    if (v == "single") return Backend::Single;
    if (v == "openmp" || v == "omp") return normalize_backend(Backend::OpenMP);
    throw std::invalid_argument("backend must be one of: auto, single, openmp");
}

// ============================================================
// FilterKind 名稱
// ============================================================

const char* to_string(FilterKind kind) {
    switch (kind) {
    case FilterKind::Grayscale:     return "grayscale";
    case FilterKind::Negate:        return "negate";
    case FilterKind::Brightness:    return "brightness";
    case FilterKind::Contrast:      return "contrast";
    case FilterKind::Colorize:      return "colorize";
    case FilterKind::EdgeDetect:    return "edgedetect";
    case FilterKind::Emboss:        return "emboss";
    case FilterKind::GaussianBlur:  return "gaussian_blur";
    case FilterKind::SelectiveBlur: return "selective_blur";
    case FilterKind::MeanRemoval:   return "mean_removal";
    case FilterKind::Smooth:        return "smooth";
    case FilterKind::Pixelate:      return "pixelate";
    }
    return "unknown";
}

FilterKind parse_filter_kind(const std::string& name) {
    static const FilterKind all[] = {
        FilterKind::Grayscale, FilterKind::Negate, FilterKind::Brightness,
        FilterKind::Contrast, FilterKind::Colorize, FilterKind::EdgeDetect,
        FilterKind::Emboss, FilterKind::GaussianBlur, FilterKind::SelectiveBlur,
        FilterKind::MeanRemoval, FilterKind::Smooth, FilterKind::Pixelate,
    };
    const std::string v = lower(name);
    for (FilterKind k : all) {
        if (v == to_string(k)) return k;
    }
    throw UnsupportedFilterKind("apply_filter: unsupported filter kind \"" + name + "\"");
}

// ============================================================
// 逐像素（point）運算：直接原地改，alpha 保留
// ============================================================

template <typename PixelOp>
static void for_each_pixel(Bitmap& img, bool parallel, PixelOp&& op) {
    uint8_t* data = img.data();
    const int H = img.h();
    const int W = img.w();
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            op(data + linear_index(y, x, 0, W));
        }
    }
}

static void grayscale_impl(Bitmap& img, bool parallel) {
    for_each_pixel(img, parallel, [](uint8_t* p) {
        const int v = static_cast<int>(0.299 * p[0] + 0.587 * p[1] + 0.114 * p[2]);
        p[0] = p[1] = p[2] = clamp_u8(v);
    });
}

static void negate_impl(Bitmap& img, bool parallel) {
    for_each_pixel(img, parallel, [](uint8_t* p) {
        p[0] = static_cast<uint8_t>(255 - p[0]);
        p[1] = static_cast<uint8_t>(255 - p[1]);
        p[2] = static_cast<uint8_t>(255 - p[2]);
    });
}

static void brightness_impl(Bitmap& img, int level, bool parallel) {
    for_each_pixel(img, parallel, [level](uint8_t* p) {
        for (int c = 0; c < 3; ++c) p[c] = clamp_u8(p[c] + level);
    });
}

static void contrast_impl(Bitmap& img, int level, bool parallel) {
    // level -100 → 放大 4 倍；level 100 → 全部壓成中灰
    double k = (100.0 - level) / 100.0;
    k = k * k;
    for_each_pixel(img, parallel, [k](uint8_t* p) {
        for (int c = 0; c < 3; ++c) {
            double v = p[c] / 255.0;
            v = ((v - 0.5) * k + 0.5) * 255.0;
            v = std::clamp(v, 0.0, 255.0);
            p[c] = static_cast<uint8_t>(v);
        }
    });
}

static void colorize_impl(Bitmap& img, const FilterParams& fp, bool parallel) {
    for_each_pixel(img, parallel, [&fp](uint8_t* p) {
        p[0] = clamp_u8(p[0] + fp.red);
        p[1] = clamp_u8(p[1] + fp.green);
        p[2] = clamp_u8(p[2] + fp.blue);
        p[3] = clamp_alpha(p[3] + fp.alpha);
    });
}

// ============================================================
// 3x3 convolution：從快照讀、寫回原圖；邊界 clamp，alpha 取中心像素
// ============================================================

static void convolve3x3(Bitmap& img, const float k[3][3], float div, float offset, bool parallel) {
    const Bitmap snap = img.clone();
    const uint8_t* in = snap.data();
    uint8_t* out = img.data();
    const int H = img.h();
    const int W = img.w();
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            float sum[3] = {0.f, 0.f, 0.f};
            for (int j = 0; j < 3; ++j) {
                const int yy = std::clamp(y + j - 1, 0, H - 1);
                for (int i = 0; i < 3; ++i) {
                    const int xx = std::clamp(x + i - 1, 0, W - 1);
                    const uint8_t* p = in + linear_index(yy, xx, 0, W);
                    for (int c = 0; c < 3; ++c) sum[c] += k[j][i] * static_cast<float>(p[c]);
                }
            }
            uint8_t* o = out + linear_index(y, x, 0, W);
            for (int c = 0; c < 3; ++c) {
                float v = sum[c] / div + offset;
                v = std::clamp(v, 0.f, 255.f);
                o[c] = static_cast<uint8_t>(v);
            }
        }
    }
}

static void edge_detect_impl(Bitmap& img, bool parallel) {
    const float k[3][3] = {{-1.f, 0.f, -1.f},
                           { 0.f, 4.f,  0.f},
                           {-1.f, 0.f, -1.f}};
    convolve3x3(img, k, 1.f, 127.f, parallel);
}

static void emboss_impl(Bitmap& img, bool parallel) {
    const float k[3][3] = {{1.5f, 0.f,   0.f},
                           {0.f,  0.f,   0.f},
                           {0.f,  0.f, -1.5f}};
    convolve3x3(img, k, 1.f, 127.f, parallel);
}

static void gaussian_blur_impl(Bitmap& img, bool parallel) {
    const float k[3][3] = {{1.f, 2.f, 1.f},
                           {2.f, 4.f, 2.f},
                           {1.f, 2.f, 1.f}};
    convolve3x3(img, k, 16.f, 0.f, parallel);
}

static void mean_removal_impl(Bitmap& img, bool parallel) {
    const float k[3][3] = {{-1.f, -1.f, -1.f},
                           {-1.f,  9.f, -1.f},
                           {-1.f, -1.f, -1.f}};
    convolve3x3(img, k, 1.f, 0.f, parallel);
}

static void smooth_impl(Bitmap& img, float weight, bool parallel) {
    const float k[3][3] = {{1.f, 1.f,    1.f},
                           {1.f, weight, 1.f},
                           {1.f, 1.f,    1.f}};
    convolve3x3(img, k, weight + 8.f, 0.f, parallel);
}

// 選擇性模糊：鄰居權重 = 1 / |中心 - 鄰居|（相等時為 1），中心固定 0.5，再正規化
static void selective_blur_impl(Bitmap& img, bool parallel) {
    const Bitmap snap = img.clone();
    const uint8_t* in = snap.data();
    uint8_t* out = img.data();
    const int H = img.h();
    const int W = img.w();
    (void)parallel;

#ifdef AF_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const uint8_t* center = in + linear_index(y, x, 0, W);

            float wt[3][3][3];
            float wsum[3] = {0.f, 0.f, 0.f};
            for (int j = 0; j < 3; ++j) {
                const int yy = std::clamp(y + j - 1, 0, H - 1);
                for (int i = 0; i < 3; ++i) {
                    const int xx = std::clamp(x + i - 1, 0, W - 1);
                    const uint8_t* p = in + linear_index(yy, xx, 0, W);
                    for (int c = 0; c < 3; ++c) {
                        float w = 0.5f;
                        if (j != 1 || i != 1) {
                            const float d = std::fabs(static_cast<float>(center[c]) - p[c]);
                            w = (d != 0.f) ? 1.f / d : 1.f;
                        }
                        wt[j][i][c] = w;
                        wsum[c] += w;
                    }
                }
            }

            float acc[3] = {0.f, 0.f, 0.f};
            for (int j = 0; j < 3; ++j) {
                const int yy = std::clamp(y + j - 1, 0, H - 1);
                for (int i = 0; i < 3; ++i) {
                    const int xx = std::clamp(x + i - 1, 0, W - 1);
                    const uint8_t* p = in + linear_index(yy, xx, 0, W);
                    for (int c = 0; c < 3; ++c)
                        acc[c] += static_cast<float>(p[c]) * wt[j][i][c] / wsum[c];
                }
            }

            uint8_t* o = out + linear_index(y, x, 0, W);
            for (int c = 0; c < 3; ++c)
                o[c] = static_cast<uint8_t>(std::clamp(acc[c], 0.f, 255.f));
        }
    }
}

static void pixelate_impl(Bitmap& img, int block, bool average) {
    if (block <= 1) return;

    const int H = img.h();
    const int W = img.w();
    uint8_t* data = img.data();

    for (int by = 0; by < H; by += block) {
        for (int bx = 0; bx < W; bx += block) {
            const int ey = std::min(by + block, H);
            const int ex = std::min(bx + block, W);

            uint8_t color[C];
            if (average) {
                long sum[C] = {0, 0, 0, 0};
                long count = 0;
                for (int y = by; y < ey; ++y) {
                    for (int x = bx; x < ex; ++x) {
                        const uint8_t* p = data + linear_index(y, x, 0, W);
                        for (int c = 0; c < C; ++c) sum[c] += p[c];
                        ++count;
                    }
                }
                for (int c = 0; c < C; ++c) color[c] = static_cast<uint8_t>(sum[c] / count);
            } else {
                std::copy(data + linear_index(by, bx, 0, W),
                          data + linear_index(by, bx, 0, W) + C, color);
            }

            for (int y = by; y < ey; ++y)
                for (int x = bx; x < ex; ++x)
                    std::copy(color, color + C, data + linear_index(y, x, 0, W));
        }
    }
}

// ============================================================
// Public API
// ============================================================

void NativeFilters::apply(Bitmap& image, FilterKind kind, const FilterParams& p) {
    if (image.empty()) {
        throw std::invalid_argument(std::string(to_string(kind)) + ": empty image");
    }

    const bool parallel = resolve_backend(backend_) == Backend::OpenMP;

    switch (kind) {
    case FilterKind::Grayscale:     grayscale_impl(image, parallel); return;
    case FilterKind::Negate:        negate_impl(image, parallel); return;
    case FilterKind::Brightness:    brightness_impl(image, p.level, parallel); return;
    case FilterKind::Contrast:      contrast_impl(image, p.level, parallel); return;
    case FilterKind::Colorize:      colorize_impl(image, p, parallel); return;
    case FilterKind::EdgeDetect:    edge_detect_impl(image, parallel); return;
    case FilterKind::Emboss:        emboss_impl(image, parallel); return;
    case FilterKind::GaussianBlur:  gaussian_blur_impl(image, parallel); return;
    case FilterKind::SelectiveBlur: selective_blur_impl(image, parallel); return;
    case FilterKind::MeanRemoval:   mean_removal_impl(image, parallel); return;
    case FilterKind::Smooth:        smooth_impl(image, p.weight, parallel); return;
    case FilterKind::Pixelate:      pixelate_impl(image, p.block_size, p.average); return;
    }

    throw UnsupportedFilterKind("apply_filter: unsupported filter kind #"
                                + std::to_string(static_cast<int>(kind)));
}

void apply_filter(FilterPrimitive& primitive,
                  Bitmap& image,
                  FilterKind kind,
                  const FilterParams& requested) {
    FilterParams p = requested;

    switch (kind) {
    case FilterKind::Brightness:
        p.level = params::brightness(p.level);
        break;
    case FilterKind::Contrast:
        p.level = params::contrast(p.level);
        break;
    case FilterKind::Colorize:
        p.red   = std::clamp(p.red,   -255, 255);
        p.green = std::clamp(p.green, -255, 255);
        p.blue  = std::clamp(p.blue,  -255, 255);
        p.alpha = std::clamp(p.alpha, -127, 127);
        break;
    case FilterKind::Smooth:
        if (std::isnan(p.weight)) p.weight = 1.0f;
        p.weight = std::clamp(p.weight, 1.0f, 2048.0f);
        break;
    case FilterKind::Pixelate:
        p.block_size = std::max(0, p.block_size);
        break;
    case FilterKind::Grayscale:
    case FilterKind::Negate:
    case FilterKind::EdgeDetect:
    case FilterKind::Emboss:
    case FilterKind::GaussianBlur:
    case FilterKind::SelectiveBlur:
    case FilterKind::MeanRemoval:
        break;
    default:
        throw UnsupportedFilterKind("apply_filter: unsupported filter kind #"
                                    + std::to_string(static_cast<int>(kind)));
    }

    primitive.apply(image, kind, p);
}

} // namespace af
