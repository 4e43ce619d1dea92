#include "alphaforge/io.hpp"
#include <memory>
#include <string>
#include <stdexcept>
#include <vector>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace af {

// 一律要求 4 通道輸出，再把 8-bit alpha 轉成 0..127 的反向 alpha
Bitmap load_bitmap(const std::string& path)
{
    int w = 0, h = 0, ch_in = 0;

    stbi_uc* raw = stbi_load(path.c_str(), &w, &h, &ch_in, 4);
    if (!raw) throw std::runtime_error("stb_image: failed to load " + path);

    // deleter 使用 stbi_image_free
    std::unique_ptr<stbi_uc, void (*)(void*)> guard(raw, stbi_image_free);

    Bitmap img(h, w);
    uint8_t* out = img.data();
    bool has_alpha = false;

    const std::size_t n = img.pixel_count();
    for (std::size_t i = 0; i < n; ++i) {
        const stbi_uc* p = raw + i * 4;
        out[i * 4 + 0] = p[0];
        out[i * 4 + 1] = p[1];
        out[i * 4 + 2] = p[2];
        out[i * 4 + 3] = alpha_from_8bit(p[3]);
        if (out[i * 4 + 3] != kAlphaOpaque) has_alpha = true;
    }

    img.set_save_alpha(has_alpha);
    return img;
}


// .png：save_alpha 時寫 RGBA，否則 RGB
// .jpg/.jpeg：RGB，quality 95
void save_bitmap(const std::string& path, const Bitmap& image)
{
    if (image.empty())
        throw std::invalid_argument("save_image: invalid input");

    const auto ends_with = [](const std::string& s, const char* suf){
        const size_t n = std::char_traits<char>::length(suf);
        return s.size() >= n && s.compare(s.size()-n, n, suf) == 0;
    };

    const int h = image.h();
    const int w = image.w();
    const bool is_png = ends_with(path, ".png") || ends_with(path, ".PNG");
    const bool is_jpg = ends_with(path, ".jpg") || ends_with(path, ".jpeg")
                     || ends_with(path, ".JPG") || ends_with(path, ".JPEG");

    if (!is_png && !is_jpg)
        throw std::runtime_error("save_image: unsupported extension (use .png/.jpg): " + path);

    const int c = (is_png && image.save_alpha()) ? 4 : 3;

    std::vector<uint8_t> buf(static_cast<std::size_t>(h) * w * c);
    const uint8_t* in = image.data();
    const std::size_t n = image.pixel_count();
    for (std::size_t i = 0; i < n; ++i) {
        buf[i * c + 0] = in[i * 4 + 0];
        buf[i * c + 1] = in[i * 4 + 1];
        buf[i * c + 2] = in[i * 4 + 2];
        if (c == 4) buf[i * c + 3] = alpha_to_8bit(in[i * 4 + 3]);
    }

    if (is_png)
    {
        int stride = w * c; // bytes per row
        if (!stbi_write_png(path.c_str(), w, h, c, buf.data(), stride))
            throw std::runtime_error("stb_image_write: failed to write png " + path);
    }
    else
    {
        int quality = 95;
        if (!stbi_write_jpg(path.c_str(), w, h, c, buf.data(), quality))
            throw std::runtime_error("stb_image_write: failed to write jpg " + path);
    }
}

} // namespace af
