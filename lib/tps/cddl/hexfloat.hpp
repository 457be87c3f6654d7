/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_HEXFLOAT_HPP
#define TPS_CDDL_HEXFLOAT_HPP

#include <string_view>

namespace tps::cddl {
    // Converts the parts of a hexadecimal float literal 0x<int>.<frac>p<exp> into a double.
    // The exponent may carry a sign. Throws tps::error when the value does not fit into a double.
    extern double parse_hexfloat(bool negative, std::string_view int_digits, std::string_view frac_digits, std::string_view exp);
}

#endif // !TPS_CDDL_HEXFLOAT_HPP
