/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_ERROR_HPP
#define TPS_CDDL_ERROR_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tps/common/error.hpp>
#include <tps/common/format.hpp>

namespace tps::cddl {
    // Byte offsets into a named source. Spans of one source share the file name.
    struct source_span {
        std::shared_ptr<const std::string> file {};
        size_t begin = 0;
        size_t end = 0;

        const std::string &file_name() const;
    };

    struct text_position {
        size_t line = 1;
        size_t column = 1;
    };

    // one-based line and column of a byte offset
    extern text_position position_of(std::string_view text, size_t offset);

    enum class error_kind {
        io,
        lex,
        parse,
        duplicate_rule,
        unknown_rule
    };

    enum class syntax_kind {
        unexpected_token,
        unexpected_eof,
        invalid_literal,
        unterminated_string,
        bad_utf8,
        too_deep
    };
}

namespace fmt {
    template<>
    struct formatter<tps::cddl::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::error_kind;
            switch (v) {
                case error_kind::io: return fmt::format_to(ctx.out(), "io");
                case error_kind::lex: return fmt::format_to(ctx.out(), "lex");
                case error_kind::parse: return fmt::format_to(ctx.out(), "parse");
                case error_kind::duplicate_rule: return fmt::format_to(ctx.out(), "duplicate rule");
                case error_kind::unknown_rule: return fmt::format_to(ctx.out(), "unknown rule");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tps::cddl::syntax_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::syntax_kind;
            switch (v) {
                case syntax_kind::unexpected_token: return fmt::format_to(ctx.out(), "unexpected token");
                case syntax_kind::unexpected_eof: return fmt::format_to(ctx.out(), "unexpected end of input");
                case syntax_kind::invalid_literal: return fmt::format_to(ctx.out(), "invalid literal");
                case syntax_kind::unterminated_string: return fmt::format_to(ctx.out(), "unterminated string");
                case syntax_kind::bad_utf8: return fmt::format_to(ctx.out(), "bad utf-8");
                case syntax_kind::too_deep: return fmt::format_to(ctx.out(), "nesting too deep");
                default: return fmt::format_to(ctx.out(), "syntax_kind: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tps::cddl::source_span>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}[{}..{}]", v.file_name(), v.begin, v.end);
        }
    };
}

namespace tps::cddl {
    struct error: tps::error {
        static error io(std::string_view path, const std::exception &cause);
        // lex and parse errors: the source text resolves the span into a line and a column
        static error syntax(error_kind kind, syntax_kind sk, const source_span &span, std::string_view source, std::string_view detail);
        static error duplicate_rule(std::string_view name);
        static error unknown_rule(std::string_view name);

        error_kind kind() const noexcept
        {
            return _kind;
        }

        const std::optional<syntax_kind> &syntax() const noexcept
        {
            return _syntax;
        }

        const std::optional<source_span> &span() const noexcept
        {
            return _span;
        }

        // the file path of io errors or the rule name of rule errors
        const std::string &subject() const noexcept
        {
            return _subject;
        }
    private:
        error_kind _kind;
        std::optional<syntax_kind> _syntax {};
        std::optional<source_span> _span {};
        std::string _subject {};

        error(error_kind kind, std::string_view msg);
    };
}

#endif // !TPS_CDDL_ERROR_HPP
