/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_FLOAT16_HPP
#define TPS_CBOR_FLOAT16_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace tps::cbor::float16 {
    inline double to_double(const uint16_t h) noexcept
    {
        const int exp = (h >> 10) & 0x1F;
        const int mant = h & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else
            val = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
        return h & 0x8000 ? -val : val;
    }

    // The half-precision bit pattern of v if the conversion is exact; NaNs are not handled.
    inline std::optional<uint16_t> from_double(const double v) noexcept
    {
        const uint16_t sign = std::signbit(v) ? 0x8000 : 0;
        const double a = std::fabs(v);
        if (std::isinf(a))
            return sign | 0x7C00;
        if (a == 0.0)
            return sign;
        if (a > 65504.0)
            return {};
        if (a < std::ldexp(1.0, -14)) {
            const double scaled = std::ldexp(a, 24);
            if (scaled != std::floor(scaled))
                return {};
            return sign | static_cast<uint16_t>(scaled);
        }
        int exp2;
        std::frexp(a, &exp2);
        const int e = exp2 - 1;
        const double mant = (std::ldexp(a, -e) - 1.0) * 1024.0;
        if (mant != std::floor(mant))
            return {};
        return sign | static_cast<uint16_t>((e + 15) << 10) | static_cast<uint16_t>(mant);
    }
}

#endif // !TPS_CBOR_FLOAT16_HPP
