#pragma once
#include <cctype>
#include <string>

inline std::string ltrim(const std::string& s) {
    std::size_t pos = s.find_first_not_of(" \t\r\n");
    if (pos == std::string::npos) return "";
    return s.substr(pos);
}

inline std::string rtrim(const std::string& s) {
    std::size_t pos = s.find_last_not_of(" \t\r\n");
    if (pos == std::string::npos) return "";
    return s.substr(0, pos + 1);
}

inline std::string toUpper(const std::string& s) {
    std::string t = s;
    for (char &c : t) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return t;
}
