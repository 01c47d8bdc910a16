#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <vector>

namespace PreflightUtils {
    /**
     * @brief Minden előfordulást lecserél a szövegben.
     */
    std::string replaceAll(std::string str, const std::string& from, const std::string& to);

    /**
     * @brief Szétvágás egy elválasztó mentén. Az üres mezők megmaradnak (PATH szemantika).
     */
    std::vector<std::string> split(const std::string& s, char delimiter);

    std::string join(const std::vector<std::string>& parts, char delimiter);

    /**
     * @brief POSIX shell egyszeres idézőjeles alak: abc'd -> 'abc'\''d'
     */
    std::string shellQuote(const std::string& value);
}

#endif
