/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_READER_HPP
#define TPS_CDDL_READER_HPP

#include <string>
#include "ast.hpp"

namespace tps::cddl {
    // The rules of the prelude, when requested, come first followed by the rules of the file.
    extern rule_list read(const std::string &path, bool with_prelude=false);
    extern rule_list parse_prelude();
}

#endif // !TPS_CDDL_READER_HPP
