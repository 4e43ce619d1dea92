#include "alphaforge/bitmap.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace aftest;

namespace {

void testNewBitmapIsOpaqueBlack() {
    const af::Bitmap img(3, 2);
    require(img.h() == 3 && img.w() == 2 && img.c() == 4, "shape");
    require(img.alpha_blending() && !img.save_alpha(), "default flags");
    requirePixel(img, 1, 2, af::Rgba{0, 0, 0, af::kAlphaOpaque}, "new canvas is opaque black");
}

void testInvalidShapeAndBounds() {
    requireThrows<std::invalid_argument>([] { af::Bitmap bad(0, 4); }, "zero height");
    af::Bitmap img(2, 2);
    requireThrows<std::out_of_range>([&] { img.pixel(2, 0); }, "x out of range");
    requireThrows<std::out_of_range>([&] { img.set_pixel(0, -1, af::Rgba{}); }, "y out of range");
    requireThrows<std::invalid_argument>([&] { img.set_pixel(0, 0, af::Rgba{0, 0, 0, 128}); },
                                         "alpha above 127");
}

void testCloneIsDeepAndKeepsFlags() {
    af::Bitmap img = makePattern(3, 3);
    img.set_save_alpha(true);
    img.set_alpha_blending(false);

    af::Bitmap copy = img.clone();
    require(samePixels(copy, img), "clone copies pixels");
    require(copy.save_alpha() && !copy.alpha_blending(), "clone copies flags");

    copy.set_pixel(0, 0, af::Rgba{1, 1, 1, 1});
    require(img.pixel(0, 0) != copy.pixel(0, 0), "clone owns its own buffer");
}

void testAlphaBlendShortcuts() {
    const af::Rgba dst{10, 20, 30, 40};
    const af::Rgba opaque{200, 100, 50, 0};
    const af::Rgba clear{200, 100, 50, 127};
    const af::Rgba half{200, 100, 50, 64};

    require(af::alpha_blend(dst, opaque) == opaque, "an opaque source replaces");
    require(af::alpha_blend(dst, clear) == dst, "a transparent source keeps dst");
    require(af::alpha_blend(af::Rgba{1, 2, 3, 127}, half) == half, "anything over transparent is itself");
}

void testAlphaBlendWeights() {
    // src 權重 63，dst 權重 127 * 64 / 127 = 64
    const af::Rgba out = af::alpha_blend(af::Rgba{0, 0, 0, 0}, af::Rgba{255, 127, 0, 64});
    require(out == (af::Rgba{126, 63, 0, 0}), "translucent over opaque: got " + describe(out));
}

void testDrawPixelHonorsBlendingFlag() {
    af::Bitmap img = makeSolid(1, 2, af::Rgba{0, 0, 0, 0});
    const af::Rgba half{255, 127, 0, 64};

    img.draw_pixel(0, 0, half);
    requirePixel(img, 0, 0, af::Rgba{126, 63, 0, 0}, "blending on");

    img.set_alpha_blending(false);
    img.draw_pixel(1, 0, half);
    requirePixel(img, 1, 0, half, "blending off writes the raw value");
}

} // namespace

int main() {
    return runTests("bitmap_tests", {
        {"testNewBitmapIsOpaqueBlack", testNewBitmapIsOpaqueBlack},
        {"testInvalidShapeAndBounds", testInvalidShapeAndBounds},
        {"testCloneIsDeepAndKeepsFlags", testCloneIsDeepAndKeepsFlags},
        {"testAlphaBlendShortcuts", testAlphaBlendShortcuts},
        {"testAlphaBlendWeights", testAlphaBlendWeights},
        {"testDrawPixelHonorsBlendingFlag", testDrawPixelHonorsBlendingFlag},
    });
}
