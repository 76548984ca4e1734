#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace ccidgadget {

// hex через пробел. После limit байт вывод обрывается на " ...",
// чтобы extended APDU не попадали в журнал целиком.
inline std::string bytesToHex(const std::uint8_t* p, size_t n, size_t limit = SIZE_MAX){
    static const char* H="0123456789abcdef";
    const size_t shown = n < limit ? n : limit;
    std::string s; s.reserve(shown*3 + 4);
    for (size_t i=0;i<shown;++i){
        std::uint8_t b=p[i];
        s.push_back(H[(b>>4)&0xF]); s.push_back(H[b&0xF]);
        if (i+1<shown) s.push_back(' ');
    }
    if (shown<n) s += " ...";
    return s;
}

inline std::string bytesToHex(const std::vector<std::uint8_t>& v, size_t limit = SIZE_MAX){
    return bytesToHex(v.data(), v.size(), limit);
}

} // namespace ccidgadget
