#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace af {

using std::uint8_t;

// 像素：r/g/b 0..255，alpha 0..127（0 = 不透明，127 = 全透明）
struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    bool operator==(const Rgba& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

constexpr uint8_t kAlphaOpaque      = 0;
constexpr uint8_t kAlphaTransparent = 127;

class Bitmap {
public:
    static constexpr int kChannels = 4;

    Bitmap() = default;

    // 自行配置；初始為不透明黑色
    Bitmap(int h, int w)
        : h_(h), w_(w)
    {
        if (h <= 0 || w <= 0)
            throw std::invalid_argument("Bitmap: invalid shape");
        const size_t n = static_cast<size_t>(h_) * w_ * kChannels;
        data_ = std::shared_ptr<uint8_t[]>(new uint8_t[n](), std::default_delete<uint8_t[]>());
    }

    // 共享外部緩衝區（零拷貝），alpha 必須已經是 0..127
    Bitmap(int h, int w, std::shared_ptr<uint8_t[]> external)
        : h_(h), w_(w), data_(std::move(external))
    {
        if (!data_) throw std::invalid_argument("Bitmap: null external buffer");
        if (h <= 0 || w <= 0)
            throw std::invalid_argument("Bitmap: invalid shape");
    }

    // 不允許複製（避免意外深拷），需要時用 clone()
    Bitmap(const Bitmap&)            = delete;
    Bitmap& operator=(const Bitmap&) = delete;

    Bitmap(Bitmap&&)            = default;
    Bitmap& operator=(Bitmap&&) = default;

    int  h() const { return static_cast<int>(h_); }
    int  w() const { return static_cast<int>(w_); }
    int  c() const { return kChannels; }
    bool empty() const { return !data_; }

    size_t pixel_count() const { return h_ * w_; }

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    // 暴露 shared_ptr 以便 pybind11 綁定時延長生命週期
    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

    bool in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < w() && y < h();
    }

    Rgba pixel(int x, int y) const;
    void set_pixel(int x, int y, const Rgba& p);

    // 依 alpha_blending 旗標決定：混合到既有像素上，或直接覆寫
    void draw_pixel(int x, int y, const Rgba& p);

    // 整張畫布填同一個值（直接覆寫，不看 alpha_blending）
    void clear(const Rgba& p);

    Bitmap clone() const;

    bool alpha_blending() const { return alpha_blending_; }
    void set_alpha_blending(bool on) { alpha_blending_ = on; }

    // 匯出時是否保留 alpha 通道
    bool save_alpha() const { return save_alpha_; }
    void set_save_alpha(bool on) { save_alpha_ = on; }

private:
    size_t h_ = 0, w_ = 0;
    std::shared_ptr<uint8_t[]> data_;
    bool alpha_blending_ = true;
    bool save_alpha_     = false;
};

// 可能回傳同一張或新配置畫布的操作（例如 desaturate）用 handle 表示
using BitmapHandle = std::shared_ptr<Bitmap>;

inline BitmapHandle make_handle(Bitmap&& bmp) {
    return std::make_shared<Bitmap>(std::move(bmp));
}

// 兩張 alpha 0..127 像素的疊加（src 疊在 dst 上）
Rgba alpha_blend(const Rgba& dst, const Rgba& src);

} // namespace af
