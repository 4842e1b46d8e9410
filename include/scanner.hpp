#pragma once

#include <istream>
#include <string>
#include <vector>
#include "number.hpp"

struct ScannedLiteral {
    int lineNo = 0;        // 0 表示来自命令行
    std::string token;
    bool ok = false;
    SpiceNumber number;
    NumberErrorKind errorKind = NumberErrorKind::InvalidSyntax;  // 只在 !ok 时有意义
};

// 按行读入数值字面量并逐个解析
//   行首 '*' 或 ';'  : 整行注释
//   '$' 之后         : 行内注释
//   其余按空白切 token
// 单个 token 失败只记录并报错，不影响后面的 token
class LiteralScanner {
public:
    bool scanFile(const std::string& filename);

    bool scanStream(std::istream& in, const std::string& originName = "<stream>");

    void scanTokens(const std::vector<std::string>& tokens,
                    const std::string& originName = "<command line>");

    const std::vector<ScannedLiteral>& results() const { return items; }
    int errorCount() const { return errors; }
    void clear();

    // 成功解析的数值；sortByValue 为稳定排序，unique 去掉与前面数值相等的项
    std::vector<SpiceNumber> resolvedValues(bool sortByValue, bool unique) const;

private:
    std::vector<ScannedLiteral> items;
    std::string sourceName;
    int errors = 0;

    void scanLine(const std::string& line, int lineNo);
    void resolveToken(const std::string& token, int lineNo);

    // ---- 工具函数 ----
    static std::string stripInlineComment(const std::string& s);
    static bool isFullLineComment(const std::string& s);
};
