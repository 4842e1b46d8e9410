#pragma once

#include <ostream>
#include "config.hpp"

// 按 cfg 解析所有字面量，把 "<raw> = <value>" 逐行写到 out
// 失败的字面量由 LiteralScanner 报到 std::cerr
// 全部成功返回 0，否则（含文件读不了）返回 1
int runScan(const ScanConfig& cfg, std::ostream& out);
