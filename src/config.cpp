#include "config.hpp"
#include <cctype>
#include <stdexcept>

// "-4E-08"、"-.5" 是字面量，不是选项
static bool looksLikeLiteral(const std::string& arg) {
    if(arg.empty() || arg[0] != '-') return true;
    if(arg.size() < 2) return false;

    unsigned char c1 = static_cast<unsigned char>(arg[1]);
    return std::isdigit(c1) || arg[1] == '.';
}

static bool parsePrecision(const std::string& s, int& out) {
    try {
        std::size_t pos = 0;
        int p = std::stoi(s, &pos);
        if(pos != s.size() || p < 0 || p > 17) return false;
        out = p;
        return true;
    } catch(const std::exception&) {
        return false;
    }
}

bool parseCommandLine(const std::vector<std::string>& args, ScanConfig& cfg,
                      std::ostream& err)
{
    bool optionsDone = false;

    for(std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if(optionsDone || looksLikeLiteral(a)) {
            cfg.literals.push_back(a);
            continue;
        }

        auto needValue = [&](std::string& out) -> bool {
            if(i + 1 >= args.size()) {
                err << "option " << a << " needs an argument\n";
                return false;
            }
            out = args[++i];
            return true;
        };

        if(a == "--") {
            optionsDone = true;
        } else if(a == "-h" || a == "--help") {
            cfg.showHelp = true;
        } else if(a == "-f" || a == "--file") {
            if(!needValue(cfg.inputFile)) return false;
        } else if(a == "-p" || a == "--precision") {
            std::string v;
            if(!needValue(v)) return false;
            if(!parsePrecision(v, cfg.precision)) {
                err << "invalid precision '" << v << "' (expected 0..17)\n";
                return false;
            }
        } else if(a == "--fixed") {
            cfg.scientific = false;
        } else if(a == "--sort") {
            cfg.sortByValue = true;
        } else if(a == "--unique") {
            cfg.uniqueValues = true;
        } else {
            err << "unknown option '" << a << "'\n";
            return false;
        }
    }

    if(!cfg.showHelp && !cfg.hasInput()) {
        err << "no literal or input file given\n";
        return false;
    }
    return true;
}

void printUsage(std::ostream& os) {
    os << "Usage: spicenum [options] <literal>... | -f <file>\n"
       << "  -f, --file <file>       read literals from file ('-' = stdin)\n"
       << "  -p, --precision <n>     output digits, 0..17 (default 6)\n"
       << "      --fixed             fixed notation instead of scientific\n"
       << "      --sort              print values sorted by value\n"
       << "      --unique            drop values equal to an earlier one\n"
       << "  -h, --help              show this message\n";
}
