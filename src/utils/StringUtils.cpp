#include "utils/StringUtils.hpp"

namespace PreflightUtils {
    std::string replaceAll(std::string str, const std::string& from, const std::string& to) {
        if(from.empty()) return str;
        size_t start_pos = 0;
        while((start_pos = str.find(from, start_pos)) != std::string::npos) {
            str.replace(start_pos, from.length(), to);
            start_pos += to.length();
        }
        return str;
    }

    std::vector<std::string> split(const std::string& s, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = s.find(delimiter, start);
            if (pos == std::string::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::string join(const std::vector<std::string>& parts, char delimiter) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += delimiter;
            out += parts[i];
        }
        return out;
    }

    std::string shellQuote(const std::string& value) {
        return "'" + replaceAll(value, "'", "'\\''") + "'";
    }
}
