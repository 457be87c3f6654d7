/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_COMMON_BASE64_HPP
#define TPS_COMMON_BASE64_HPP

#include <array>
#include "bytes.hpp"

namespace tps::base64 {
    using code_set = std::array<signed char, 128>;

    // Requires the padded form: the input length must be a multiple of four
    // and '=' may appear only as the last one or two characters.
    inline uint8_vector decode_explicit(const std::string_view &in, const code_set &codes)
    {
        if (in.size() % 4 != 0)
            throw error(fmt::format("base64 input length must be a multiple of 4 but got {}", in.size()));
        size_t pad = 0;
        if (!in.empty() && in[in.size() - 1] == '=') {
            ++pad;
            if (in[in.size() - 2] == '=')
                ++pad;
        }
        uint8_vector out {};
        out.reserve(in.size() / 4 * 3);
        int val = 0, valb = -8;
        for (size_t pos = 0; pos < in.size() - pad; ++pos) {
            const signed char c = in[pos];
            if (c < 0 || codes[c] == -1)
                throw error(fmt::format("unsupported encoding character: '0x{:x}' at pos {} in {}!", static_cast<uint8_t>(c), pos, in));
            val = ((val << 6) + codes[c]) & 0xFFFF;
            valb += 6;
            if (valb >= 0) {
                out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        // the bits left over by a padded group must be zero
        if (valb > -8 && (val & ((1 << (valb + 8)) - 1)) != 0)
            throw error(fmt::format("base64 input has non-zero trailing bits: {}", in));
        return out;
    }

    inline uint8_vector decode_url(const std::string_view &in)
    {
        static const code_set codes {
            /* 0x00 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x10 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x20 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  62,  -1,  -1,
            /* 0x30 */ 52,  53,  54,  55,  56,  57,  58,  59,  60,  61,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x40 */ -1,   0,   1,   2,   3,   4,   5,   6,   7,   8,   9,  10,  11,  12,  13,  14,
            /* 0x50 */ 15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25,  -1,  -1,  -1,  -1,  63,
            /* 0x60 */ -1,  26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,
            /* 0x70 */ 41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51,  -1,  -1,  -1,  -1,  -1
        };
        return decode_explicit(in, codes);
    }
}

#endif // !TPS_COMMON_BASE64_HPP
