#pragma once

#include <ostream>
#include <string>
#include <vector>

struct ScanConfig {
    std::string inputFile;              // "-" 表示 stdin
    std::vector<std::string> literals;  // 命令行上直接给出的字面量

    int  precision    = 6;
    bool scientific   = true;
    bool sortByValue  = false;
    bool uniqueValues = false;
    bool showHelp     = false;

    bool hasInput() const {
        return !inputFile.empty() || !literals.empty();
    }
};

// args 不含程序名；出错时把原因写到 err 并返回 false
bool parseCommandLine(const std::vector<std::string>& args, ScanConfig& cfg,
                      std::ostream& err);

void printUsage(std::ostream& os);
