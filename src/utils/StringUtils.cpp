#include "utils/StringUtils.hpp"
#include <cctype>

namespace AdaptiveUtils {
    std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
            start++;
        }
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
            end--;
        }
        return s.substr(start, end - start);
    }

    bool isBlank(const std::string& s) {
        return trim(s).empty();
    }
}
