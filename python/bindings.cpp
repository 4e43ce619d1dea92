#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "alphaforge/bitmap.hpp"
#include "alphaforge/color.hpp"
#include "alphaforge/compositor.hpp"
#include "alphaforge/effects.hpp"
#include "alphaforge/errors.hpp"
#include "alphaforge/filters.hpp"
#include "alphaforge/geometry.hpp"
#include "alphaforge/io.hpp"
#include "alphaforge/params.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace afpy {

using af::Bitmap;
using af::BitmapHandle;
using af::Backend;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxWx4)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
};

static ShapeInfo check_uint8_hwc4(const py::buffer_info& info) {
    if (info.ndim != 3) {
        throw std::runtime_error("expected HxWx4 uint8 array");
    }
    if (info.itemsize != 1) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);
    const int c = static_cast<int>(info.shape[2]);

    if (c != 4) {
        throw std::runtime_error("expected 4 channels (r, g, b, a with a in 0..127)");
    }

    // H x W x 4: strides = [W*4, 4, 1]
    if (!(info.strides[0] == static_cast<ssize_t>(w * 4) &&
          info.strides[1] == 4 &&
          info.strides[2] == 1)) {
        throw std::runtime_error("expected C-contiguous array (HxWx4)");
    }

    return {h, w};
}

// ------------------------------------------------------------
// numpy.ndarray -> Bitmap（複製一份，之後的原地修改不會影響 numpy）
// ------------------------------------------------------------
static BitmapHandle numpy_to_bitmap(const py::array& array) {
    py::buffer_info info = array.request();
    auto shape = check_uint8_hwc4(info);

    const auto* ptr = static_cast<const uint8_t*>(info.ptr);
    const std::size_t n = static_cast<std::size_t>(shape.h) * shape.w;
    for (std::size_t i = 0; i < n; ++i) {
        if (ptr[i * 4 + 3] > af::kAlphaTransparent)
            throw std::runtime_error("alpha channel must be 0..127 (0 = opaque)");
    }

    auto bmp = std::make_shared<Bitmap>(shape.h, shape.w);
    std::copy(ptr, ptr + n * 4, bmp->data());
    return bmp;
}

// ------------------------------------------------------------
// Bitmap -> numpy.ndarray（零拷貝）
// ------------------------------------------------------------
static py::array bitmap_to_numpy(const Bitmap& img) {
    if (img.empty()) {
        throw std::runtime_error("Image is empty");
    }

    std::vector<ssize_t> shape   = {img.h(), img.w(), 4};
    std::vector<ssize_t> strides = {static_cast<ssize_t>(img.w() * 4), 4, 1};

    // 建立 shared_ptr 副本放進 capsule，讓 numpy 管理一份 ref 計數
    auto* sp_copy = new std::shared_ptr<uint8_t[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<uint8_t[]>*>(p);
    });

    py::array view(
        py::dtype::of<uint8_t>(),
        shape,
        strides,
        img.shared().get(),  // data pointer
        base                 // base object to keep memory alive
    );

    // 唯讀：避免從 numpy 寫入超過 127 的 alpha；要修改請 from_array
    view.attr("setflags")(py::arg("write") = false);
    return view;
}

// ------------------------------------------------------------
// 檔案 I/O 包裝
// ------------------------------------------------------------
static BitmapHandle load_image_py(const std::string& path) {
    return af::make_handle(af::load_bitmap(path));
}

static void save_image_py(const std::string& path, const BitmapHandle& img) {
    if (!img) throw std::runtime_error("save_image: image is None");
    af::save_bitmap(path, *img);
}

static af::BlurKind parse_blur_kind(const std::string& s) {
    if (s == "selective") return af::BlurKind::Selective;
    if (s == "gaussian")  return af::BlurKind::Gaussian;
    throw std::runtime_error("blur kind must be one of: selective, gaussian");
}

static af::Filter make_filter(const std::string& backend) {
    return af::Filter(nullptr, af::parse_backend(backend));
}

// renderer(img, text, font_file, params) 由 Python 端提供；None 時交給 Filter::text 報錯
static void text_py(const BitmapHandle& img,
                    const std::string& text,
                    const std::string& font_file,
                    const af::TextParams& params,
                    const py::object& renderer) {
    if (!img) throw std::runtime_error("text: image is None");

    af::Filter filter;
    if (!renderer.is_none()) {
        filter.set_text_renderer([&img, &renderer](Bitmap&, const std::string& t,
                                                   const std::string& f, const af::TextParams& p) {
            renderer(img, t, f, p);
        });
    }
    filter.text(*img, text, font_file, params);
}

} // namespace afpy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace afpy;

    m.doc() = "AlphaForge core (alpha-aware raster filters, 0 = opaque / 127 = transparent)";

    // 錯誤：Python 端都是 ValueError 的子類別
    auto base_err = py::register_exception<af::Error>(m, "AlphaForgeError", PyExc_ValueError);
    py::register_exception<af::InvalidColorFormat>(m, "InvalidColorFormat", base_err.ptr());
    py::register_exception<af::InvalidColorComponent>(m, "InvalidColorComponent", base_err.ptr());
    py::register_exception<af::InvalidAngle>(m, "InvalidAngle", base_err.ptr());
    py::register_exception<af::InvalidDirection>(m, "InvalidDirection", base_err.ptr());
    py::register_exception<af::RegionOutOfBounds>(m, "RegionOutOfBounds", base_err.ptr());
    py::register_exception<af::UnsupportedFilterKind>(m, "UnsupportedFilterKind", base_err.ptr());

    // -------------------- Bitmap --------------------
    py::class_<Bitmap, BitmapHandle>(m, "Bitmap")
        .def(py::init([](int height, int width) {
                 return std::make_shared<Bitmap>(height, width);
             }),
             py::arg("height"), py::arg("width"),
             "Allocate an opaque black canvas.")
        .def_static("from_array", &numpy_to_bitmap, py::arg("array"),
                    "Copy a HxWx4 uint8 array (alpha 0..127) into a new Bitmap.")
        .def("to_array", [](const Bitmap& b) { return bitmap_to_numpy(b); },
             "Zero-copy read-only HxWx4 uint8 view of the pixels.")
        .def_property_readonly("height", &Bitmap::h)
        .def_property_readonly("width", &Bitmap::w)
        .def_property("alpha_blending", &Bitmap::alpha_blending, &Bitmap::set_alpha_blending)
        .def_property("save_alpha", &Bitmap::save_alpha, &Bitmap::set_save_alpha)
        .def("pixel", [](const Bitmap& b, int x, int y) {
                 const af::Rgba p = b.pixel(x, y);
                 return py::make_tuple(p.r, p.g, p.b, p.a);
             }, py::arg("x"), py::arg("y"))
        .def("draw_pixel", [](Bitmap& b, int x, int y, std::vector<int> rgba) {
                 const af::ColorSpec c = af::normalize_color(rgba);
                 b.draw_pixel(x, y, c.rgba());
             }, py::arg("x"), py::arg("y"), py::arg("color"),
             "Write one pixel, blending onto it when alpha_blending is on.")
        .def("clone", [](const Bitmap& b) { return af::make_handle(b.clone()); });

    // -------------------- Color --------------------
    m.def("normalize_color",
          [](const af::ColorValue& value) {
              const af::ColorSpec c = af::normalize_color(value);
              return py::make_tuple(c.r, c.g, c.b, c.a);
          },
          py::arg("color"),
          "Normalize '#RRGGBB' or [r, g, b(, a)] into (r, g, b, a).");

    m.def("to_hex",
          [](const af::ColorValue& value) { return af::to_hex(af::normalize_color(value)); },
          py::arg("color"),
          "Render a color as '#RRGGBB'.");

    // -------------------- Image IO --------------------
    m.def("load_image", &load_image_py,
          py::arg("path"),
          "Load an image file as a Bitmap.");

    m.def("save_image", &save_image_py,
          py::arg("path"), py::arg("img"),
          "Save a Bitmap to file (.png/.jpg).");

    // -------------------- Compositor --------------------
    m.def("merge_alpha",
          [](const BitmapHandle& dst, const BitmapHandle& src,
             std::pair<int, int> dst_offset, std::pair<int, int> src_offset,
             std::pair<int, int> size, double opacity_percent,
             const std::string& backend) {
              if (!dst || !src) throw std::runtime_error("merge_alpha: image is None");
              af::merge_alpha(*dst, *src,
                              af::Point{dst_offset.first, dst_offset.second},
                              af::Point{src_offset.first, src_offset.second},
                              af::Size{size.first, size.second},
                              opacity_percent, af::parse_backend(backend));
          },
          py::arg("dst"), py::arg("src"),
          py::arg("dst_offset"), py::arg("src_offset"),
          py::arg("size"), py::arg("opacity_percent"),
          py::arg("backend") = "auto",
          "Alpha-aware merge of src onto dst; offsets are (x, y), size is (w, h).");

    // -------------------- In-place effects --------------------
    m.def("sepia",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).sepia(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("grayscale",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).grayscale(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("pixelate",
          [](Bitmap& img, int block_size, const std::string& backend) {
              make_filter(backend).pixelate(img, block_size);
          },
          py::arg("img"), py::arg("block_size") = 10, py::arg("backend") = "auto");

    m.def("edges",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).edges(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("emboss",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).emboss(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("invert",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).invert(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("blur",
          [](Bitmap& img, int passes, const std::string& kind, const std::string& backend) {
              make_filter(backend).blur(img, passes, parse_blur_kind(kind));
          },
          py::arg("img"), py::arg("passes") = 1, py::arg("kind") = "selective",
          py::arg("backend") = "auto");

    m.def("brightness",
          [](Bitmap& img, int level, const std::string& backend) {
              make_filter(backend).brightness(img, level);
          },
          py::arg("img"), py::arg("level"), py::arg("backend") = "auto",
          "Brightness level, -255 (darkest) .. 255 (lightest).");

    m.def("contrast",
          [](Bitmap& img, int level, const std::string& backend) {
              make_filter(backend).contrast(img, level);
          },
          py::arg("img"), py::arg("level"), py::arg("backend") = "auto",
          "Contrast level, -100 .. 100.");

    m.def("colorize",
          [](Bitmap& img, const af::ColorValue& color, double opacity, const std::string& backend) {
              make_filter(backend).colorize(img, color, opacity);
          },
          py::arg("img"), py::arg("color"), py::arg("opacity"), py::arg("backend") = "auto");

    m.def("mean_remove",
          [](Bitmap& img, const std::string& backend) { make_filter(backend).mean_remove(img); },
          py::arg("img"), py::arg("backend") = "auto");

    m.def("smooth",
          [](Bitmap& img, int passes, const std::string& backend) {
              make_filter(backend).smooth(img, passes);
          },
          py::arg("img"), py::arg("passes") = 1, py::arg("backend") = "auto");

    m.def("fill",
          [](Bitmap& img, const af::ColorValue& color, const std::string& backend) {
              make_filter(backend).fill(img, color);
          },
          py::arg("img"), py::arg("color") = "#000000", py::arg("backend") = "auto");

    m.def("text", &text_py,
          py::arg("img"), py::arg("text"), py::arg("font_file"),
          py::arg("params") = af::TextParams{}, py::arg("renderer") = py::none(),
          "Draw text through renderer(img, text, font_file, params); "
          "raises UnsupportedFilterKind when renderer is None.");

    // -------------------- Allocating effects --------------------
    m.def("desaturate",
          [](const BitmapHandle& img, int percent, const std::string& backend) {
              return make_filter(backend).desaturate(img, percent);
          },
          py::arg("img"), py::arg("percent") = 100, py::arg("backend") = "auto",
          "percent == 100 returns the same Bitmap (grayscaled in place); "
          "otherwise returns a new grayscale copy and blends it into img.");

    m.def("opacity",
          [](const Bitmap& img, double opacity, const std::string& backend) {
              return make_filter(backend).opacity(img, opacity);
          },
          py::arg("img"), py::arg("opacity"), py::arg("backend") = "auto",
          "Return a new Bitmap; opacity is 0..1 or 0..100.");

    m.def("rotate",
          [](const Bitmap& img, double angle, const af::ColorValue& bg_color,
             const std::string& backend) {
              return make_filter(backend).rotate(img, angle, bg_color);
          },
          py::arg("img"), py::arg("angle"), py::arg("bg_color") = "#000000",
          py::arg("backend") = "auto",
          "Rotate clockwise by angle (-360 < angle < 360) into a new Bitmap.");

    m.def("flip",
          [](const Bitmap& img, const std::string& direction, const std::string& backend) {
              return make_filter(backend).flip(img, direction);
          },
          py::arg("img"), py::arg("direction"), py::arg("backend") = "auto",
          "Flip into a new Bitmap; direction is x, y, xy or yx.");
}
