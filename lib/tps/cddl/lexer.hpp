/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_LEXER_HPP
#define TPS_CDDL_LEXER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <tps/common/bytes.hpp>
#include "error.hpp"

namespace tps::cddl {
    enum class token_type: uint8_t {
        id, text, bytes, number, hash, ctlop,
        assign, assign_type_ext, assign_group_ext,
        slash, double_slash, arrow, colon, comma,
        question, star, plus, caret, tilde, amp,
        range_incl, range_excl,
        lparen, rparen, lbrace, rbrace, lbracket, rbracket, langle, rangle,
        eof
    };

    struct number_literal {
        std::variant<int64_t, double> val;
        // set for literals without a sign, a fraction, or an exponent
        bool is_uint = false;
    };

    // "#", "#<major>", or "#<major>.<ai>"
    struct hash_literal {
        std::optional<uint8_t> major {};
        std::optional<uint64_t> arg {};
    };

    struct token {
        using payload_type = std::variant<std::monostate, std::string, uint8_vector, number_literal, hash_literal>;

        token_type type;
        size_t begin = 0;
        size_t end = 0;
        // whitespace or a comment precedes the token
        bool space_before = false;
        payload_type payload {};

        // the name of id and ctlop tokens and the value of text tokens
        const std::string &str() const
        {
            return std::get<std::string>(payload);
        }

        const uint8_vector &bytes() const
        {
            return std::get<uint8_vector>(payload);
        }

        const number_literal &number() const
        {
            return std::get<number_literal>(payload);
        }

        const hash_literal &hash() const
        {
            return std::get<hash_literal>(payload);
        }
    };

    // Splits CDDL text into tokens terminated by a token of type eof.
    extern std::vector<token> tokenize(std::string_view text, const std::shared_ptr<const std::string> &file);
}

namespace fmt {
    template<>
    struct formatter<tps::cddl::token_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::token_type;
            switch (v) {
                case token_type::id: return fmt::format_to(ctx.out(), "id");
                case token_type::text: return fmt::format_to(ctx.out(), "text");
                case token_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case token_type::number: return fmt::format_to(ctx.out(), "number");
                case token_type::hash: return fmt::format_to(ctx.out(), "#");
                case token_type::ctlop: return fmt::format_to(ctx.out(), "ctlop");
                case token_type::assign: return fmt::format_to(ctx.out(), "=");
                case token_type::assign_type_ext: return fmt::format_to(ctx.out(), "/=");
                case token_type::assign_group_ext: return fmt::format_to(ctx.out(), "//=");
                case token_type::slash: return fmt::format_to(ctx.out(), "/");
                case token_type::double_slash: return fmt::format_to(ctx.out(), "//");
                case token_type::arrow: return fmt::format_to(ctx.out(), "=>");
                case token_type::colon: return fmt::format_to(ctx.out(), ":");
                case token_type::comma: return fmt::format_to(ctx.out(), ",");
                case token_type::question: return fmt::format_to(ctx.out(), "?");
                case token_type::star: return fmt::format_to(ctx.out(), "*");
                case token_type::plus: return fmt::format_to(ctx.out(), "+");
                case token_type::caret: return fmt::format_to(ctx.out(), "^");
                case token_type::tilde: return fmt::format_to(ctx.out(), "~");
                case token_type::amp: return fmt::format_to(ctx.out(), "&");
                case token_type::range_incl: return fmt::format_to(ctx.out(), "..");
                case token_type::range_excl: return fmt::format_to(ctx.out(), "...");
                case token_type::lparen: return fmt::format_to(ctx.out(), "(");
                case token_type::rparen: return fmt::format_to(ctx.out(), ")");
                case token_type::lbrace: return fmt::format_to(ctx.out(), "{{");
                case token_type::rbrace: return fmt::format_to(ctx.out(), "}}");
                case token_type::lbracket: return fmt::format_to(ctx.out(), "[");
                case token_type::rbracket: return fmt::format_to(ctx.out(), "]");
                case token_type::langle: return fmt::format_to(ctx.out(), "<");
                case token_type::rangle: return fmt::format_to(ctx.out(), ">");
                case token_type::eof: return fmt::format_to(ctx.out(), "eof");
                default: return fmt::format_to(ctx.out(), "token_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TPS_CDDL_LEXER_HPP
