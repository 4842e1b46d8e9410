#include "number.hpp"
#include "magnitude.hpp"

#include <charconv>
#include <limits>
#include <system_error>

enum class LexState {
    Start,
    IntegerPart,
    FractionPart,
    ExponentStart,
    ExponentDigits
};

static bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

static bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// 超出 double 范围时按 IEEE 舍入：上溢为 inf，下溢为 0
// 只需判断数量级的正负，用首个非零数字的位置加上指数估算
static double outOfRangeValue(const char* first, const char* last, bool negative) {
    long scale = 0;
    bool seenPoint = false;
    bool seenNonZero = false;

    const char* p = first;
    for (; p != last && *p != 'e' && *p != 'E'; ++p) {
        if (*p == '.') {
            seenPoint = true;
        } else if (!seenNonZero && *p == '0') {
            if (seenPoint) --scale;
        } else {
            seenNonZero = true;
            if (!seenPoint) ++scale;
        }
    }

    long exponent = 0;
    if (p != last) {
        ++p;
        bool negExp = false;
        if (p != last && (*p == '+' || *p == '-')) {
            negExp = (*p == '-');
            ++p;
        }
        for (; p != last; ++p) {
            if (exponent < 1000000) exponent = exponent * 10 + (*p - '0');
        }
        if (negExp) exponent = -exponent;
    }

    double magnitude = (scale + exponent > 0) ? std::numeric_limits<double>::infinity() : 0.0;
    return negative ? -magnitude : magnitude;
}

// 数字部分交给 from_chars（与 locale 无关），必须整体被吃掉
// 溢出不算错误
static double parseDigits(const std::string& digits) {
    const char* first = digits.data();
    const char* last = first + digits.size();

    // from_chars 不认前导 '+'
    bool negative = false;
    if (first != last && (*first == '+' || *first == '-')) {
        negative = (*first == '-');
        ++first;
    }
    if (first == last || *first == '+' || *first == '-') {
        throw NumberParseError(NumberErrorKind::InvalidSyntax);
    }

    double v = 0.0;
    std::from_chars_result res = std::from_chars(first, last, v);
    if (res.ptr != last) {
        throw NumberParseError(NumberErrorKind::InvalidSyntax);
    }
    if (res.ec == std::errc::result_out_of_range) {
        return outOfRangeValue(first, last, negative);
    }
    if (res.ec != std::errc()) {
        throw NumberParseError(NumberErrorKind::InvalidSyntax);
    }
    return negative ? -v : v;
}

const char* describeNumberError(NumberErrorKind kind) {
    switch (kind) {
        case NumberErrorKind::Empty:             return "cannot parse number from empty string";
        case NumberErrorKind::InvalidSyntax:     return "invalid number";
        case NumberErrorKind::InvalidMultiplier: return "invalid multiplier";
    }
    return "invalid number";
}

SpiceNumber parseSpiceNumber(const std::string& token) {
    if (token.empty()) {
        throw NumberParseError(NumberErrorKind::Empty);
    }

    std::string digits;
    double mult = 1.0;
    LexState state = LexState::Start;
    bool done = false;

    for (std::size_t i = 0; i < token.size() && !done; ++i) {
        char c = token[i];

        switch (state) {
            case LexState::Start:
            case LexState::ExponentStart:
                if (c != '+' && c != '-' && !isDigit(c)) {
                    throw NumberParseError(NumberErrorKind::InvalidSyntax);
                }
                digits += c;
                state = (state == LexState::Start) ? LexState::IntegerPart
                                                   : LexState::ExponentDigits;
                break;

            case LexState::IntegerPart:
            case LexState::FractionPart:
                if (isDigit(c)) {
                    // 只记得"刚读过小数点"，"1.2.3" 这种留给 strtod 去拒绝
                    digits += c;
                    state = LexState::IntegerPart;
                } else if (c == '.') {
                    if (state == LexState::FractionPart) {
                        throw NumberParseError(NumberErrorKind::InvalidSyntax);
                    }
                    digits += c;
                    state = LexState::FractionPart;
                } else if (c == 'e' || c == 'E') {
                    digits += c;
                    state = LexState::ExponentStart;
                } else if (isAsciiAlpha(c)) {
                    // 单位后缀：后面的字符不再检查（1.23pFarad）
                    mult = resolveMagnitude(c, token.substr(i + 1, 2));
                    done = true;
                } else {
                    throw NumberParseError(NumberErrorKind::InvalidSyntax);
                }
                break;

            case LexState::ExponentDigits:
                // 指数之后的后缀一律忽略：123e3F == 123e3
                if (isDigit(c)) {
                    digits += c;
                } else {
                    done = true;
                }
                break;
        }
    }

    return SpiceNumber(parseDigits(digits) * mult, token);
}
