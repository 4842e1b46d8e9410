// main.cpp -- 解析 SPICE 数值字面量并打印数值

#include <iostream>
#include <string>
#include <vector>

#include "app.hpp"
#include "config.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    ScanConfig cfg;
    if (!parseCommandLine(args, cfg, std::cerr)) {
        printUsage(std::cerr);
        return 1;
    }

    if (cfg.showHelp) {
        printUsage(std::cout);
        return 0;
    }

    return runScan(cfg, std::cout);
}
