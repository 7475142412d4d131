#include "utils/StringUtils.hpp"
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace VigilUtils {

    namespace {
        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string toHex(const uint8_t* data, size_t len) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            out.push_back(kHex[data[i] >> 4]);
            out.push_back(kHex[data[i] & 0x0F]);
        }
        return out;
    }

    std::string toHex(const std::vector<uint8_t>& bytes) {
        return toHex(bytes.data(), bytes.size());
    }

    std::vector<uint8_t> fromHex(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw std::invalid_argument("hex string has odd length");
        }
        std::vector<uint8_t> out;
        out.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            int hi = hexValue(hex[i]);
            int lo = hexValue(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("invalid hex character");
            }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    bool isHex(const std::string& s) {
        for (char c : s) {
            if (hexValue(c) < 0) return false;
        }
        return true;
    }

    std::string trim(const std::string& s) {
        size_t first = 0;
        while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
        size_t last = s.size();
        while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
        return s.substr(first, last - first);
    }

    std::string formatTimestamp(uint64_t unixSeconds) {
        std::time_t t = static_cast<std::time_t>(unixSeconds);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm) == 0) {
            return std::to_string(unixSeconds);
        }
        return buf;
    }
}
