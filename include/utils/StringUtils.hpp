#ifndef VIGIL_STRINGUTILS_HPP
#define VIGIL_STRINGUTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace VigilUtils {
    /**
     * @brief Lowercase hex, two characters per byte.
     */
    std::string toHex(const uint8_t* data, size_t len);
    std::string toHex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Inverse of toHex. Throws std::invalid_argument on odd length or non-hex input.
     */
    std::vector<uint8_t> fromHex(const std::string& hex);

    bool isHex(const std::string& s);

    /**
     * @brief Strips leading and trailing whitespace.
     */
    std::string trim(const std::string& s);

    /**
     * @brief Unix seconds -> "2026-10-19 18:40:00 UTC".
     */
    std::string formatTimestamp(uint64_t unixSeconds);
}

#endif
