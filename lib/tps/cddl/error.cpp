/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include "error.hpp"

namespace tps::cddl {
    const std::string &source_span::file_name() const
    {
        static const std::string unknown { "<unknown>" };
        return file ? *file : unknown;
    }

    text_position position_of(const std::string_view text, const size_t offset)
    {
        text_position pos {};
        const auto end = std::min(offset, text.size());
        for (size_t i = 0; i < end; ++i) {
            if (text[i] == '\n') {
                ++pos.line;
                pos.column = 1;
            } else {
                ++pos.column;
            }
        }
        return pos;
    }

    error::error(const error_kind kind, const std::string_view msg):
        tps::error { msg }, _kind { kind }
    {
    }

    error error::io(const std::string_view path, const std::exception &cause)
    {
        error err { error_kind::io, fmt::format("cannot read cddl from {}: {}", path, cause.what()) };
        err._subject = path;
        return err;
    }

    error error::syntax(const error_kind kind, const syntax_kind sk, const source_span &span, const std::string_view source, const std::string_view detail)
    {
        const auto pos = position_of(source, span.begin);
        error err { kind, fmt::format("{}:{}:{}: cddl {} error: {}: {}", span.file_name(), pos.line, pos.column, kind, sk, detail) };
        err._syntax = sk;
        err._span = span;
        return err;
    }

    error error::duplicate_rule(const std::string_view name)
    {
        error err { error_kind::duplicate_rule, fmt::format("Value has already been assigned to {}. Reassignment not allowed", name) };
        err._subject = name;
        return err;
    }

    error error::unknown_rule(const std::string_view name)
    {
        error err { error_kind::unknown_rule, fmt::format("cddl rule {} is not defined", name) };
        err._subject = name;
        return err;
    }
}
