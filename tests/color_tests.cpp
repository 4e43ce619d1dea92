#include "alphaforge/color.hpp"
#include "alphaforge/errors.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace aftest;

namespace {

void testHexWithHash() {
    const af::ColorSpec c = af::normalize_color("#FF0000");
    require(c == af::ColorSpec{255, 0, 0, 0}, "#FF0000 should normalize to opaque red");
}

void testHexWithoutHashAndLowercase() {
    const af::ColorSpec c = af::normalize_color("11aAfF");
    require(c == af::ColorSpec{0x11, 0xAA, 0xFF, 0}, "Hex digits should be case-insensitive and '#' optional");
}

void testComponentArrays() {
    const af::ColorSpec rgba = af::normalize_color(std::vector<int>{255, 0, 0, 64});
    require(rgba == af::ColorSpec{255, 0, 0, 64}, "4-element array should keep its alpha");

    const af::ColorSpec rgb = af::normalize_color(std::vector<int>{1, 2, 3});
    require(rgb == af::ColorSpec{1, 2, 3, 0}, "3-element array should default alpha to opaque");

    const af::ColorSpec edge = af::normalize_color(std::vector<int>{0, 255, 0, 127});
    require(edge == af::ColorSpec{0, 255, 0, 127}, "Boundary components should be accepted");
}

void testMalformedHexIsFormatError() {
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color("#ZZZZZZ"); },
                                          "Non-hex digits should fail with InvalidColorFormat");
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color("#FFF"); },
                                          "Short hex should fail with InvalidColorFormat");
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color("#FF00000"); },
                                          "7 digits should fail with InvalidColorFormat");
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color("##FF0000"); },
                                          "Only one leading '#' is allowed");
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color(""); },
                                          "Empty string should fail with InvalidColorFormat");
}

void testWrongArityIsFormatError() {
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color(std::vector<int>{1, 2}); },
                                          "2 components should fail with InvalidColorFormat");
    requireThrows<af::InvalidColorFormat>([] { af::normalize_color(std::vector<int>{1, 2, 3, 4, 5}); },
                                          "5 components should fail with InvalidColorFormat");
}

void testOutOfRangeIsComponentError() {
    requireThrows<af::InvalidColorComponent>([] { af::normalize_color(std::vector<int>{300, 0, 0}); },
                                             "Red 300 should fail with InvalidColorComponent");
    requireThrows<af::InvalidColorComponent>([] { af::normalize_color(std::vector<int>{0, -1, 0}); },
                                             "Negative green should fail with InvalidColorComponent");
    requireThrows<af::InvalidColorComponent>([] { af::normalize_color(std::vector<int>{0, 0, 0, 128}); },
                                             "Alpha 128 should fail with InvalidColorComponent");
    requireThrows<af::InvalidColorComponent>([] { af::normalize_color(af::ColorSpec{0, 0, 0, 200}); },
                                             "A prebuilt ColorSpec is range-checked too");
}

void testErrorsCarryCodes() {
    try {
        af::normalize_color(std::vector<int>{0, 0, 256});
    } catch (const af::Error& e) {
        require(e.code() == af::ErrorCode::InvalidColorComponent, "Error code should match the class");
        require(std::string(af::to_string(e.code())) == "InvalidColorComponent", "Error code name");
        return;
    }
    throw std::runtime_error("normalize_color should have thrown");
}

void testToHex() {
    require(af::to_hex(af::ColorSpec{0x11, 0x22, 0x33, 5}) == "#112233", "to_hex should render #RRGGBB");
    require(af::to_hex(af::normalize_color("#abcdef")) == "#ABCDEF", "to_hex should use uppercase digits");
}

} // namespace

int main() {
    return runTests("color_tests", {
        {"testHexWithHash", testHexWithHash},
        {"testHexWithoutHashAndLowercase", testHexWithoutHashAndLowercase},
        {"testComponentArrays", testComponentArrays},
        {"testMalformedHexIsFormatError", testMalformedHexIsFormatError},
        {"testWrongArityIsFormatError", testWrongArityIsFormatError},
        {"testOutOfRangeIsComponentError", testOutOfRangeIsComponentError},
        {"testErrorsCarryCodes", testErrorsCarryCodes},
        {"testToHex", testToHex},
    });
}
