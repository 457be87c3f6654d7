/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_PRELUDE_HPP
#define TPS_CDDL_PRELUDE_HPP

#include <string_view>

namespace tps::cddl {
    // the standard prelude of RFC 8610 Appendix D
    extern std::string_view prelude();
}

#endif // !TPS_CDDL_PRELUDE_HPP
