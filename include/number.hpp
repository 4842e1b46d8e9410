#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

enum class NumberErrorKind {
    Empty,
    InvalidSyntax,
    InvalidMultiplier
};

const char* describeNumberError(NumberErrorKind kind);

class NumberParseError : public std::runtime_error {
public:
    explicit NumberParseError(NumberErrorKind k)
        : std::runtime_error(describeNumberError(k)), errKind(k) {}

    NumberErrorKind kind() const { return errKind; }

private:
    NumberErrorKind errKind;
};

// 网表中的一个数值字面量
// value: 乘过单位倍率之后的数值
// raw  : 完整的原始文本（包括后缀及其后的任何字符），输出时原样写回
struct SpiceNumber {
    double value = 0.0;
    std::string raw = "0";

    SpiceNumber() = default;
    SpiceNumber(double v, const std::string& r)
        : value(v), raw(r) {}
};

// 比较只看 value，不看 raw
inline bool operator==(const SpiceNumber& a, const SpiceNumber& b) { return a.value == b.value; }
inline bool operator!=(const SpiceNumber& a, const SpiceNumber& b) { return !(a == b); }
inline bool operator< (const SpiceNumber& a, const SpiceNumber& b) { return a.value <  b.value; }
inline bool operator> (const SpiceNumber& a, const SpiceNumber& b) { return b < a; }
inline bool operator<=(const SpiceNumber& a, const SpiceNumber& b) { return a.value <= b.value; }
inline bool operator>=(const SpiceNumber& a, const SpiceNumber& b) { return b <= a; }

inline std::ostream& operator<<(std::ostream& os, const SpiceNumber& n) {
    return os << n.raw;
}

// 科学计数法 + SPICE 后缀：10k, 1u, 3e12, 3.3meg, 1.23pFarad 等
// 解析失败抛出 NumberParseError
SpiceNumber parseSpiceNumber(const std::string& token);
