#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>

namespace AdaptiveUtils {
    /**
     * @brief Whitespace eltávolítása az elejéről és a végéről.
     */
    std::string trim(const std::string& s);

    /**
     * @brief Üres vagy csak whitespace-ből álló szöveg.
     */
    bool isBlank(const std::string& s);
}

#endif
