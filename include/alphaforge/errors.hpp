#pragma once

#include <stdexcept>
#include <string>

namespace af {

enum class ErrorCode {
    InvalidColorFormat,
    InvalidColorComponent,
    InvalidAngle,
    InvalidDirection,
    RegionOutOfBounds,
    UnsupportedFilterKind,
};

const char* to_string(ErrorCode code);

// 所有輸入驗證錯誤的共同基底，訊息格式 "<function>: <reason>"
class Error : public std::invalid_argument {
public:
    Error(ErrorCode code, const std::string& what)
        : std::invalid_argument(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidColorFormat : public Error {
public:
    explicit InvalidColorFormat(const std::string& what)
        : Error(ErrorCode::InvalidColorFormat, what) {}
};

class InvalidColorComponent : public Error {
public:
    explicit InvalidColorComponent(const std::string& what)
        : Error(ErrorCode::InvalidColorComponent, what) {}
};

class InvalidAngle : public Error {
public:
    explicit InvalidAngle(const std::string& what)
        : Error(ErrorCode::InvalidAngle, what) {}
};

class InvalidDirection : public Error {
public:
    explicit InvalidDirection(const std::string& what)
        : Error(ErrorCode::InvalidDirection, what) {}
};

class RegionOutOfBounds : public Error {
public:
    explicit RegionOutOfBounds(const std::string& what)
        : Error(ErrorCode::RegionOutOfBounds, what) {}
};

class UnsupportedFilterKind : public Error {
public:
    explicit UnsupportedFilterKind(const std::string& what)
        : Error(ErrorCode::UnsupportedFilterKind, what) {}
};

} // namespace af
