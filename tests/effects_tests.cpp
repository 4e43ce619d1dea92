#include "alphaforge/compositor.hpp"
#include "alphaforge/effects.hpp"
#include "alphaforge/errors.hpp"
#include "alphaforge/geometry.hpp"
#include "recording_primitive.hpp"
#include "test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace aftest;

namespace {

struct RecordingFilter {
    std::shared_ptr<RecordingPrimitive> rec = std::make_shared<RecordingPrimitive>();
    af::Filter filter{rec, af::Backend::Single};
};

void testBlurRunsOnePassPerRequest() {
    RecordingFilter f;
    af::Bitmap img(2, 2);

    f.filter.blur(img, 3, af::BlurKind::Gaussian);
    require(f.rec->calls.size() == 3, "blur(3) should call the primitive three times");
    for (const auto& c : f.rec->calls)
        require(c.kind == af::FilterKind::GaussianBlur, "Gaussian kind should map to GaussianBlur");

    f.rec->calls.clear();
    f.filter.blur(img, 0);
    require(f.rec->calls.size() == 1, "blur(0) should clamp to a single pass");
    require(f.rec->calls[0].kind == af::FilterKind::SelectiveBlur, "Default blur kind is selective");
}

void testSepiaIsGrayscaleThenColorize() {
    RecordingFilter f;
    af::Bitmap img(1, 1);
    f.filter.sepia(img);

    require(f.rec->calls.size() == 2, "sepia should issue two primitive calls");
    require(f.rec->calls[0].kind == af::FilterKind::Grayscale, "sepia starts with grayscale");
    const auto& c = f.rec->calls[1];
    require(c.kind == af::FilterKind::Colorize, "sepia continues with colorize");
    require(c.params.red == 100 && c.params.green == 50 && c.params.blue == 0 && c.params.alpha == 0,
            "sepia tint is (100, 50, 0)");
}

void testColorizeConvertsOpacityToAlpha() {
    RecordingFilter f;
    af::Bitmap img(1, 1);

    f.filter.colorize(img, std::string("#FF8000"), 0.5);
    require(f.rec->calls.size() == 1, "colorize should call the primitive once");
    const auto& c = f.rec->calls[0].params;
    require(c.red == 255 && c.green == 128 && c.blue == 0, "colorize should pass the parsed color");
    require(c.alpha == 64, "opacity 0.5 should become alpha 64");

    f.filter.colorize(img, std::vector<int>{10, 20, 30}, 100);
    require(f.rec->calls[1].params.alpha == 0, "opacity 100 should become alpha 0");

    requireThrows<af::InvalidColorFormat>([&] { f.filter.colorize(img, std::string("#12"), 1); },
                                          "Malformed color should be rejected");
    require(f.rec->calls.size() == 2, "A rejected color must not reach the primitive");
}

void testLevelsAreClampedBeforeDispatch() {
    RecordingFilter f;
    af::Bitmap img(1, 1);

    f.filter.brightness(img, 1000);
    f.filter.contrast(img, -1000);
    f.filter.smooth(img, 5000);
    f.filter.smooth(img, 0);
    f.filter.pixelate(img);

    require(f.rec->calls[0].params.level == 255, "brightness clamps to 255");
    require(f.rec->calls[1].params.level == -100, "contrast clamps to -100");
    require(f.rec->calls[2].params.weight == 2048.0f, "smooth weight clamps to 2048");
    require(f.rec->calls[3].params.weight == 1.0f, "smooth weight clamps to 1");
    require(f.rec->calls[4].kind == af::FilterKind::Pixelate, "pixelate kind");
    require(f.rec->calls[4].params.block_size == 10 && f.rec->calls[4].params.average,
            "pixelate defaults to averaged 10px blocks");
}

void testSimpleEffectsMapToKinds() {
    RecordingFilter f;
    af::Bitmap img(1, 1);

    f.filter.grayscale(img);
    f.filter.edges(img);
    f.filter.emboss(img);
    f.filter.invert(img);
    f.filter.mean_remove(img);

    const af::FilterKind expected[] = {af::FilterKind::Grayscale, af::FilterKind::EdgeDetect,
                                       af::FilterKind::Emboss, af::FilterKind::Negate,
                                       af::FilterKind::MeanRemoval};
    require(f.rec->calls.size() == 5, "each effect calls the primitive once");
    for (std::size_t i = 0; i < 5; ++i)
        require(f.rec->calls[i].kind == expected[i], std::string("unexpected kind ") + af::to_string(f.rec->calls[i].kind));
}

void testDefaultPrimitiveIsNative() {
    af::Filter filter;
    af::Bitmap img = makeSolid(1, 1, af::Rgba{10, 20, 30, 5});
    filter.invert(img);
    requirePixel(img, 0, 0, af::Rgba{245, 235, 225, 5}, "Default filter should run the native kernels");
}

void testFillOverwritesEveryPixel() {
    af::Filter filter;
    af::Bitmap img = makePattern(10, 10);

    filter.fill(img, std::string("#112233"));
    for (int y = 0; y < 10; ++y)
        for (int x = 0; x < 10; ++x)
            requirePixel(img, x, y, af::Rgba{0x11, 0x22, 0x33, 0}, "fill should write the exact color");
    require(img.save_alpha(), "fill should enable the alpha channel");
    require(!img.alpha_blending(), "fill should disable blending");

    filter.fill(img, std::vector<int>{1, 2, 3, 100});
    requirePixel(img, 4, 7, af::Rgba{1, 2, 3, 100}, "fill should not blend a translucent color");

    filter.fill(img);
    requirePixel(img, 9, 9, af::Rgba{0, 0, 0, 0}, "fill defaults to opaque black");
}

void testDesaturateFullReturnsSameHandle() {
    af::Filter filter;
    const af::BitmapHandle img = af::make_handle(makeSolid(2, 2, af::Rgba{100, 150, 200, 9}));

    const af::BitmapHandle out = filter.desaturate(img, 100);
    require(out == img, "desaturate(100) should return the same handle");
    requirePixel(*img, 1, 1, af::Rgba{140, 140, 140, 9}, "desaturate(100) grays in place");

    const af::BitmapHandle again = filter.desaturate(img, 150);
    require(again == img, "percent above 100 is treated as 100");
}

void testDesaturatePartialBlendsOriginalAndReturnsCopy() {
    af::Filter filter;
    const af::BitmapHandle img = af::make_handle(makePattern(4, 5));

    // 另外算一份期望值
    const af::Bitmap snapshot = img->clone();
    af::Bitmap gray = snapshot.clone();
    af::NativeFilters native(af::Backend::Single);
    af::apply_filter(native, gray, af::FilterKind::Grayscale);
    af::Bitmap expected = snapshot.clone();
    af::merge_alpha(expected, gray, {0, 0}, {0, 0}, {5, 4}, 50.0, af::Backend::Single);

    const af::BitmapHandle out = filter.desaturate(img, 50);

    require(out && out != img, "desaturate(50) should return a new handle");
    require(out->data() != img->data(), "the returned canvas should not share pixels");
    require(samePixels(*out, gray), "the returned canvas is the grayscale copy");
    require(!out->alpha_blending(), "the grayscale copy has blending disabled");
    require(samePixels(*img, expected), "the original is blended with the grayscale copy at 50%");

    requireThrows<std::invalid_argument>([&] { filter.desaturate(nullptr, 50); },
                                         "A null handle should be rejected");
}

void testOpacityBuildsNewCanvas() {
    af::Filter filter;
    const af::Bitmap img = makeSolid(2, 3, af::Rgba{200, 100, 0, 0});

    const af::BitmapHandle half = filter.opacity(img, 50);
    require(half->w() == 3 && half->h() == 2, "opacity keeps the size");
    requirePixel(*half, 2, 1, af::Rgba{100, 50, 0, 64}, "50% over a transparent canvas");
    require(half->save_alpha(), "opacity canvas keeps alpha");
    requirePixel(img, 0, 0, af::Rgba{200, 100, 0, 0}, "opacity must not touch its input");

    const af::BitmapHandle fraction = filter.opacity(img, 0.5);
    require(samePixels(*fraction, *half), "0.5 and 50 should be the same opacity");

    const af::BitmapHandle none = filter.opacity(img, 0);
    requirePixel(*none, 0, 0, af::Rgba{0, 0, 0, 127}, "0% leaves a transparent canvas");
}

void testRotateAndFlipReturnNewHandles() {
    af::Filter filter;
    const af::Bitmap img = makePattern(3, 4);

    const af::BitmapHandle flipped = filter.flip(img, "yx");
    require(samePixels(*flipped, af::flip(img, af::Direction::XY)), "facade flip matches geometry flip");

    const af::BitmapHandle turned = filter.rotate(img, 90);
    require(turned->w() == 3 && turned->h() == 4, "facade rotate swaps dimensions");

    requireThrows<af::InvalidAngle>([&] { filter.rotate(img, 360); }, "360 should be rejected");
    requireThrows<af::InvalidColorFormat>([&] { filter.rotate(img, 10, std::string("blue")); },
                                          "Bad background should be rejected");
    requireThrows<af::InvalidDirection>([&] { filter.flip(img, "up"); }, "Bad direction should be rejected");
}

void testTextNeedsRenderer() {
    af::Filter filter;
    af::Bitmap img(2, 2);

    requireThrows<af::UnsupportedFilterKind>([&] { filter.text(img, "hi", "font.ttf"); },
                                             "text without a renderer should fail");

    std::string seen_text;
    std::string seen_font;
    std::string seen_size;
    filter.set_text_renderer([&](af::Bitmap& image, const std::string& text,
                                 const std::string& font, const af::TextParams& p) {
        seen_text = text;
        seen_font = font;
        auto it = p.find("size");
        if (it != p.end()) seen_size = it->second;
        image.set_pixel(0, 0, af::Rgba{1, 2, 3, 0});
    });

    af::TextParams params;
    params["size"] = "12";
    filter.text(img, "hello", "font.ttf", params);
    require(seen_text == "hello" && seen_font == "font.ttf", "renderer should receive text and font");
    require(seen_size == "12", "renderer should receive the parameters unchanged");
    requirePixel(img, 0, 0, af::Rgba{1, 2, 3, 0}, "renderer draws onto the given image");
}

} // namespace

int main() {
    return runTests("effects_tests", {
        {"testBlurRunsOnePassPerRequest", testBlurRunsOnePassPerRequest},
        {"testSepiaIsGrayscaleThenColorize", testSepiaIsGrayscaleThenColorize},
        {"testColorizeConvertsOpacityToAlpha", testColorizeConvertsOpacityToAlpha},
        {"testLevelsAreClampedBeforeDispatch", testLevelsAreClampedBeforeDispatch},
        {"testSimpleEffectsMapToKinds", testSimpleEffectsMapToKinds},
        {"testDefaultPrimitiveIsNative", testDefaultPrimitiveIsNative},
        {"testFillOverwritesEveryPixel", testFillOverwritesEveryPixel},
        {"testDesaturateFullReturnsSameHandle", testDesaturateFullReturnsSameHandle},
        {"testDesaturatePartialBlendsOriginalAndReturnsCopy", testDesaturatePartialBlendsOriginalAndReturnsCopy},
        {"testOpacityBuildsNewCanvas", testOpacityBuildsNewCanvas},
        {"testRotateAndFlipReturnNewHandles", testRotateAndFlipReturnNewHandles},
        {"testTextNeedsRenderer", testTextNeedsRenderer},
    });
}
