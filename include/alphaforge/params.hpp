#pragma once

#include <string>

namespace af {

enum class Direction {
    X,   // 水平翻轉（左右）
    Y,   // 垂直翻轉（上下）
    XY,
    YX
};

const char* to_string(Direction dir);

// ------------------------------------------------------------
// 參數夾限：除了 rotate / direction 以外都不會丟例外
// ------------------------------------------------------------
namespace params {

// 次數 >= 1，沒有上限
int blur(int passes);

// [-255, 255]
int brightness(int level);

// [-100, 100]
int contrast(int level);

// [1, 2048]
int smooth(int passes);

// [0, 100]
int percent(int p);

// <= 1 視為比例（乘 100），四捨五入後夾在 [0, 100]
int opacity(double o);

// opacity 百分比 -> 0..127 alpha（100% 不透明 = 0）
int opacity_to_alpha(double opacity_percent);

// 必須 -360 < angle < 360，否則 InvalidAngle
double rotate(double angle);

// x | y | xy | yx（不分大小寫），否則 InvalidDirection
Direction direction(const std::string& dir);

} // namespace params
} // namespace af
