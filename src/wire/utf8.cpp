#include "utf8.hpp"

#include <cstdint>

namespace jettison::wire
{

std::optional<size_t> find_invalid_utf8(std::string_view text)
{
    const auto*  p = reinterpret_cast<const uint8_t*>(text.data());
    const size_t n = text.size();
    size_t       i = 0;

    while (i < n)
    {
        uint8_t b0 = p[i];
        if (b0 < 0x80)
        {
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        // (tightened to exclude overlongs, surrogates and > U+10FFFF).
        size_t  len = 0;
        uint8_t lo  = 0x80;
        uint8_t hi  = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF)
            len = 2;
        else if (b0 == 0xE0)
        {
            len = 3;
            lo  = 0xA0;
        }
        else if (b0 >= 0xE1 && b0 <= 0xEC)
            len = 3;
        else if (b0 == 0xED)
        {
            len = 3;
            hi  = 0x9F;
        }
        else if (b0 >= 0xEE && b0 <= 0xEF)
            len = 3;
        else if (b0 == 0xF0)
        {
            len = 4;
            lo  = 0x90;
        }
        else if (b0 >= 0xF1 && b0 <= 0xF3)
            len = 4;
        else if (b0 == 0xF4)
        {
            len = 4;
            hi  = 0x8F;
        }
        else
            return i;  // 0x80-0xC1 or 0xF5-0xFF cannot start a sequence

        if (i + len > n)
            return i;
        if (p[i + 1] < lo || p[i + 1] > hi)
            return i;
        for (size_t k = 2; k < len; ++k)
        {
            if ((p[i + k] & 0xC0) != 0x80)
                return i;
        }
        i += len;
    }
    return std::nullopt;
}

}  // namespace jettison::wire
