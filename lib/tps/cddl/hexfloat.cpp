/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cmath>
#include <tps/common/bytes.hpp>
#include "hexfloat.hpp"

namespace tps::cddl {
    namespace {
        constexpr int64_t max_exp_magnitude = 100000;

        int64_t parse_exp(std::string_view exp)
        {
            bool neg = false;
            if (!exp.empty() && (exp.front() == '+' || exp.front() == '-')) {
                neg = exp.front() == '-';
                exp.remove_prefix(1);
            }
            if (exp.empty())
                throw tps::error("a hexfloat exponent must have at least one digit");
            int64_t val = 0;
            for (const char c: exp) {
                if (c < '0' || c > '9')
                    throw tps::error(fmt::format("unexpected character in a hexfloat exponent: {}", c));
                // the exact value does not matter once it is out of the double range
                val = std::min(val * 10 + (c - '0'), max_exp_magnitude);
            }
            return neg ? -val : val;
        }
    }

    double parse_hexfloat(const bool negative, const std::string_view int_digits, const std::string_view frac_digits, const std::string_view exp)
    {
        if (int_digits.empty())
            throw tps::error("a hexfloat must have at least one integer digit");
        double val = 0.0;
        for (const char c: int_digits)
            val = val * 16 + uint_from_hex(c);
        int frac_exp = 0;
        for (const char c: frac_digits) {
            frac_exp -= 4;
            val += std::ldexp(static_cast<double>(uint_from_hex(c)), frac_exp);
        }
        const auto res = std::ldexp(val, static_cast<int>(parse_exp(exp)));
        if (std::isinf(res))
            throw tps::error(fmt::format("hexfloat 0x{}.{}p{} overflows a double", int_digits, frac_digits, exp));
        if (res == 0.0 && val != 0.0)
            throw tps::error(fmt::format("hexfloat 0x{}.{}p{} underflows a double", int_digits, frac_digits, exp));
        return negative ? -res : res;
    }
}
