#include "app.hpp"
#include "scanner.hpp"

#include <iomanip>
#include <iostream>

int runScan(const ScanConfig& cfg, std::ostream& out) {
    LiteralScanner scanner;
    bool readOk = true;

    if (!cfg.literals.empty()) {
        scanner.scanTokens(cfg.literals);
    }

    if (!cfg.inputFile.empty()) {
        if (cfg.inputFile == "-") {
            readOk = scanner.scanStream(std::cin, "<stdin>");
        } else {
            readOk = scanner.scanFile(cfg.inputFile);
        }
    }

    if (cfg.scientific) {
        out << std::scientific;
    } else {
        out << std::fixed;
    }
    out << std::setprecision(cfg.precision);

    for (const auto& n : scanner.resolvedValues(cfg.sortByValue, cfg.uniqueValues)) {
        out << n << " = " << n.value << "\n";
    }

    if (scanner.errorCount() > 0) {
        std::cerr << scanner.errorCount() << " of " << scanner.results().size()
                  << " literal(s) failed to resolve.\n";
    }

    return (readOk && scanner.errorCount() == 0) ? 0 : 1;
}
