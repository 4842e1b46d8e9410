#include "scanner.hpp"
#include "utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

std::string LiteralScanner::stripInlineComment(const std::string& s)
{
    auto pos = s.find('$');
    if(pos == std::string::npos) return s;

    return s.substr(0, pos);
}

bool LiteralScanner::isFullLineComment(const std::string& s) {
    std::size_t i = 0;
    while(i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;

    if(i >= s.size()) return false;
    char c = s[i];
    return (c == '*' || c == ';');
}

void LiteralScanner::clear() {
    items.clear();
    sourceName.clear();
    errors = 0;
}

bool LiteralScanner::scanFile(const std::string& filename) {
    std::ifstream fin(filename);
    if(!fin) {
        std::cerr << "Cannot open literal file: " << filename << "\n";
        return false;
    }

    return scanStream(fin, filename);
}

bool LiteralScanner::scanStream(std::istream& in, const std::string& originName)
{
    sourceName = originName;

    std::string physical;
    int lineNo = 0;

    while(std::getline(in, physical)) {
        ++lineNo;

        if(!physical.empty() && physical.back() == '\r') {
            physical.pop_back();
        }

        if(isFullLineComment(physical)) continue;

        std::string s = rtrim(ltrim(stripInlineComment(physical)));
        if(s.empty()) continue;

        scanLine(s, lineNo);
    }

    if(in.bad()) {
        std::cerr << sourceName << ": read error after line " << lineNo << "\n";
        return false;
    }
    return true;
}

void LiteralScanner::scanTokens(const std::vector<std::string>& tokens,
                                const std::string& originName)
{
    sourceName = originName;
    for(const auto& tok : tokens) {
        resolveToken(tok, 0);
    }
}

void LiteralScanner::scanLine(const std::string& line, int lineNo) {
    std::istringstream iss(line);
    std::string tok;
    while(iss >> tok) {
        resolveToken(tok, lineNo);
    }
}

void LiteralScanner::resolveToken(const std::string& token, int lineNo) {
    ScannedLiteral item;
    item.lineNo = lineNo;
    item.token = token;

    try {
        item.number = parseSpiceNumber(token);
        item.ok = true;
    } catch(const NumberParseError& e) {
        item.errorKind = e.kind();
        ++errors;

        std::cerr << sourceName << ": ";
        if(lineNo > 0) std::cerr << "Line " << lineNo << ": ";
        std::cerr << e.what() << ": '" << token << "'\n";
    }

    items.push_back(std::move(item));
}

std::vector<SpiceNumber> LiteralScanner::resolvedValues(bool sortByValue, bool unique) const {
    std::vector<SpiceNumber> out;
    for(const auto& item : items) {
        if(!item.ok) continue;

        if(unique) {
            bool seen = std::find(out.begin(), out.end(), item.number) != out.end();
            if(seen) continue;
        }
        out.push_back(item.number);
    }

    if(sortByValue) {
        std::stable_sort(out.begin(), out.end());
    }
    return out;
}
