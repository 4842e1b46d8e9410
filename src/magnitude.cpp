#include "magnitude.hpp"
#include "number.hpp"
#include "utils.hpp"

double resolveMagnitude(char letter, const std::string& lookahead)
{
    char c = static_cast<char>(
        std::toupper(static_cast<unsigned char>(letter))
    );

    switch (c) {
        case 'T': return 1e12;   // Tera
        case 'G': return 1e9;    // Giga
        case 'X': return 1e6;    // Mega
        case 'K': return 1e3;    // Kilo
        case 'M':
            // Meg 还是 milli；不足两个字符时自然不等于 "EG"
            if (toUpper(lookahead.substr(0, 2)) == "EG") return 1e6;
            return 1e-3;
        case 'U': return 1e-6;   // Micro
        case 'N': return 1e-9;   // Nano
        case 'P': return 1e-12;  // Pico
        case 'F': return 1e-15;  // Femto
        default:
            throw NumberParseError(NumberErrorKind::InvalidMultiplier);
    }
}
