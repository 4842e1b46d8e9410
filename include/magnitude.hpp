#pragma once

#include <string>

// 单位倍率后缀
//   T=1e12  G=1e9  X/Meg=1e6  K=1e3  M=1e-3  U=1e-6  N=1e-9  P=1e-12  F=1e-15
// letter 为后缀首字母（大小写均可）
// lookahead 为 letter 之后最多两个字符，只有 M 会看它（"EG" -> Meg）
// 其他字母抛出 NumberParseError(InvalidMultiplier)
double resolveMagnitude(char letter, const std::string& lookahead);
