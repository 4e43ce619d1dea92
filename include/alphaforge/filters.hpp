#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "alphaforge/bitmap.hpp"

namespace af {

// ------------------------------------------------------------
// 後端（Auto 在有 OpenMP 時選 OpenMP，否則 Single）
// ------------------------------------------------------------
enum class Backend {
    Auto = 0,
    Single = 1,
    OpenMP = 2,
};

inline Backend normalize_backend(Backend b) {
#ifdef AF_HAS_OPENMP
    return b;
#else
    if (b == Backend::OpenMP) return Backend::Single;
    return b;
#endif
}

// 把 Auto 展開成實際後端
inline Backend resolve_backend(Backend b) {
    b = normalize_backend(b);
    if (b == Backend::Auto) {
#ifdef AF_HAS_OPENMP
        return Backend::OpenMP;
#else
        return Backend::Single;
#endif
    }
    return b;
}

// "auto" | "single" | "openmp" | "omp"
Backend parse_backend(const std::string& s);

// ------------------------------------------------------------
// 內建 filter 種類
// ------------------------------------------------------------
enum class FilterKind {
    Grayscale,
    Negate,
    Brightness,
    Contrast,
    Colorize,
    EdgeDetect,
    Emboss,
    GaussianBlur,
    SelectiveBlur,
    MeanRemoval,
    Smooth,
    Pixelate,
};

const char* to_string(FilterKind kind);

// 名稱 -> FilterKind，不認得就丟 UnsupportedFilterKind
FilterKind parse_filter_kind(const std::string& name);

struct FilterParams {
    int level = 0;              // Brightness / Contrast

    int red = 0;                // Colorize：各通道加減量
    int green = 0;
    int blue = 0;
    int alpha = 0;              // Colorize：alpha 加減量（0..127 制）

    int  block_size = 1;        // Pixelate
    bool average = true;        // Pixelate：區塊取平均色

    float weight = 1.0f;        // Smooth：中心權重
};

// ------------------------------------------------------------
// 單次 filter 的注入點：原地修改，不重新配置
// ------------------------------------------------------------
class FilterPrimitive {
public:
    virtual ~FilterPrimitive() = default;

    virtual void apply(Bitmap& image, FilterKind kind, const FilterParams& params) = 0;
};

// 內建實作（3x3 kernel 等），alpha 通道保留
class NativeFilters : public FilterPrimitive {
public:
    explicit NativeFilters(Backend backend = Backend::Auto)
        : backend_(backend) {}

    void apply(Bitmap& image, FilterKind kind, const FilterParams& params) override;

    Backend backend() const { return backend_; }

private:
    Backend backend_;
};

// 先夾限參數，再呼叫 primitive 一次
void apply_filter(FilterPrimitive& primitive,
                  Bitmap& image,
                  FilterKind kind,
                  const FilterParams& params = FilterParams{});

} // namespace af
