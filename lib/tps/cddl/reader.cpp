/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/file.hpp>
#include <tps/logger.hpp>
#include "parser.hpp"
#include "prelude.hpp"
#include "reader.hpp"

namespace tps::cddl {
    rule_list parse_prelude()
    {
        return parse(prelude(), "<prelude>");
    }

    rule_list read(const std::string &path, const bool with_prelude)
    {
        uint8_vector text {};
        try {
            file::read(path, text);
        } catch (const std::exception &ex) {
            throw error::io(path, ex);
        }
        auto file_rules = parse(text.str(), path);
        logger::debug("parsed {} cddl rules from {}", file_rules.size(), path);
        if (!with_prelude)
            return file_rules;
        auto rules = parse_prelude();
        logger::debug("merging {} prelude rules with {} rules from {}", rules.size(), file_rules.size(), path);
        rules.reserve(rules.size() + file_rules.size());
        for (auto &r: file_rules)
            rules.emplace_back(std::move(r));
        return rules;
    }
}
