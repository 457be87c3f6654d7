/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_PARSER_HPP
#define TPS_CDDL_PARSER_HPP

#include <string_view>
#include "ast.hpp"

namespace tps::cddl {
    // Parses a complete CDDL document. The whole text must be consumed and at least one rule is required.
    extern rule_list parse(std::string_view text, std::string_view file_name);
}

#endif // !TPS_CDDL_PARSER_HPP
