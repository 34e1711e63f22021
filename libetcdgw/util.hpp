#pragma once

#include <stdint.h>
#include <string>
#include <string_view>
#include <utility>
#include <type_traits>

#include "errors.hpp"

namespace libetcdgw::util {

template<class T>
struct always_false : std::false_type {};

inline std::pair<std::string, std::string> split_url(const std::string &url)
{
    static const std::string DELIM = "://";

    const auto pos = url.find(DELIM);

    if (pos == std::string::npos)
        throw InvalidAddress("URL must be of 'protocol://address' format");

    return {url.substr(0, pos), url.substr(pos + DELIM.size())};
}

inline std::string pack_u16(uint16_t value)
{
    std::string result(2, '\0');
    result[0] = static_cast<char>(value >> 8);
    result[1] = static_cast<char>(value & 0xFF);
    return result;
}

inline uint16_t unpack_u16(std::string_view data)
{
    if (data.size() < 2)
        throw CodecError("need 2 bytes to decode uint16, got " + std::to_string(data.size()));
    return static_cast<uint16_t>((static_cast<uint8_t>(data[0]) << 8) | static_cast<uint8_t>(data[1]));
}

inline std::string pack_u64(uint64_t value)
{
    std::string result(8, '\0');
    for (int i = 7; i >= 0; --i) {
        result[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    return result;
}

inline uint64_t unpack_u64(std::string_view data)
{
    if (data.size() != 8)
        throw CodecError("need 8 bytes to decode uint64, got " + std::to_string(data.size()));
    uint64_t value = 0;
    for (char c : data)
        value = (value << 8) | static_cast<uint8_t>(c);
    return value;
}

// Smallest key greater than every key starting with `key`; empty when no such
// key exists (all bytes are 0xFF), which the store reads as "no upper bound".
inline std::string successor_of_prefix(std::string key)
{
    while (!key.empty()) {
        auto last = static_cast<uint8_t>(key.back());
        if (last != 0xFF) {
            key.back() = static_cast<char>(last + 1);
            return key;
        }
        key.pop_back();
    }
    return key;
}

// for log lines
inline std::string printable(std::string_view data)
{
    static const char HEX[] = "0123456789abcdef";

    std::string result;
    result.reserve(data.size());
    for (char c : data) {
        auto byte = static_cast<uint8_t>(c);
        if (byte >= 0x20 && byte < 0x7F && byte != '\\') {
            result.push_back(c);
        } else {
            result.append("\\x");
            result.push_back(HEX[byte >> 4]);
            result.push_back(HEX[byte & 0xF]);
        }
    }
    return result;
}

} // namespace libetcdgw::util
