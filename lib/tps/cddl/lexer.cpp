/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <limits>
#include <utfcpp/utf8.h>
#include <tps/common/base64.hpp>
#include "hexfloat.hpp"
#include "lexer.hpp"

namespace tps::cddl {
    namespace {
        bool is_alpha(const char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        bool is_ealpha(const char c)
        {
            return is_alpha(c) || c == '@' || c == '_' || c == '$';
        }

        bool is_digit(const char c)
        {
            return c >= '0' && c <= '9';
        }

        bool is_hex(const char c)
        {
            return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        bool is_bin(const char c)
        {
            return c == '0' || c == '1';
        }

        bool is_control(const char c)
        {
            return static_cast<uint8_t>(c) < 0x20 || c == 0x7F;
        }

        struct lexer {
            lexer(const std::string_view text, const std::shared_ptr<const std::string> &file):
                _text { text }, _file { file }
            {
            }

            std::vector<token> run()
            {
                if (const auto it = utf8::find_invalid(_text.begin(), _text.end()); it != _text.end()) {
                    const size_t pos = it - _text.begin();
                    _fail(syntax_kind::bad_utf8, pos, pos + 1, fmt::format("invalid utf-8 byte 0x{:02X}", static_cast<uint8_t>(*it)));
                }
                std::vector<token> toks {};
                for (;;) {
                    const bool space = _skip_space();
                    auto tok = _next();
                    tok.space_before = space;
                    const bool done = tok.type == token_type::eof;
                    toks.emplace_back(std::move(tok));
                    if (done)
                        break;
                }
                return toks;
            }
        private:
            std::string_view _text;
            std::shared_ptr<const std::string> _file;
            size_t _pos = 0;

            [[noreturn]] void _fail(const syntax_kind sk, const size_t begin, const size_t end, const std::string_view detail) const
            {
                throw error::syntax(error_kind::lex, sk, source_span { _file, begin, end }, _text, detail);
            }

            // NUL past the end of the input
            char _at(const size_t pos) const
            {
                return pos < _text.size() ? _text[pos] : '\0';
            }

            bool _starts(const std::string_view s) const
            {
                return _text.substr(_pos).starts_with(s);
            }

            bool _skip_space()
            {
                bool skipped = false;
                while (_pos < _text.size()) {
                    const char c = _text[_pos];
                    if (c == ' ' || c == '\n') {
                        ++_pos;
                    } else if (c == '\r') {
                        if (_at(_pos + 1) != '\n')
                            _fail(syntax_kind::unexpected_token, _pos, _pos + 1, "a carriage return must be followed by a line feed");
                        _pos += 2;
                    } else if (c == ';') {
                        // a comment may end at the end of the input
                        while (_pos < _text.size() && _text[_pos] != '\n')
                            ++_pos;
                    } else {
                        break;
                    }
                    skipped = true;
                }
                return skipped;
            }

            token _punct(const token_type type, const size_t len)
            {
                token tok { type, _pos, _pos + len };
                _pos += len;
                return tok;
            }

            token _next()
            {
                const auto start = _pos;
                if (_pos >= _text.size())
                    return { token_type::eof, start, start };
                const char c = _text[_pos];
                if (is_ealpha(c))
                    return _id_or_bytes();
                if (is_digit(c) || (c == '-' && is_digit(_at(_pos + 1))))
                    return _number();
                switch (c) {
                    case '"': return _text_string();
                    case '\'': return _byte_string(start, "");
                    case '#': return _hash();
                    case '.':
                        if (_starts("..."))
                            return _punct(token_type::range_excl, 3);
                        if (_starts(".."))
                            return _punct(token_type::range_incl, 2);
                        if (is_ealpha(_at(_pos + 1))) {
                            ++_pos;
                            auto name = _read_id();
                            return { token_type::ctlop, start, _pos, false, std::move(name) };
                        }
                        break;
                    case '/':
                        if (_starts("//="))
                            return _punct(token_type::assign_group_ext, 3);
                        if (_starts("//"))
                            return _punct(token_type::double_slash, 2);
                        if (_starts("/="))
                            return _punct(token_type::assign_type_ext, 2);
                        return _punct(token_type::slash, 1);
                    case '=':
                        if (_starts("=>"))
                            return _punct(token_type::arrow, 2);
                        return _punct(token_type::assign, 1);
                    case ':': return _punct(token_type::colon, 1);
                    case ',': return _punct(token_type::comma, 1);
                    case '?': return _punct(token_type::question, 1);
                    case '*': return _punct(token_type::star, 1);
                    case '+': return _punct(token_type::plus, 1);
                    case '^': return _punct(token_type::caret, 1);
                    case '~': return _punct(token_type::tilde, 1);
                    case '&': return _punct(token_type::amp, 1);
                    case '(': return _punct(token_type::lparen, 1);
                    case ')': return _punct(token_type::rparen, 1);
                    case '{': return _punct(token_type::lbrace, 1);
                    case '}': return _punct(token_type::rbrace, 1);
                    case '[': return _punct(token_type::lbracket, 1);
                    case ']': return _punct(token_type::rbracket, 1);
                    case '<': return _punct(token_type::langle, 1);
                    case '>': return _punct(token_type::rangle, 1);
                    case '\t':
                        _fail(syntax_kind::unexpected_token, start, start + 1, "tabs are not allowed, use spaces");
                    default:
                        break;
                }
                if (is_control(c) || static_cast<uint8_t>(c) >= 0x80)
                    _fail(syntax_kind::unexpected_token, start, start + 1, fmt::format("unexpected character 0x{:02X}", static_cast<uint8_t>(c)));
                _fail(syntax_kind::unexpected_token, start, start + 1, fmt::format("unexpected character '{}'", c));
            }

            // id = EALPHA *(*("-" / ".") (EALPHA / DIGIT))
            std::string _read_id()
            {
                const auto start = _pos++;
                for (;;) {
                    size_t p = _pos;
                    while (_at(p) == '-' || _at(p) == '.')
                        ++p;
                    if (!is_ealpha(_at(p)) && !is_digit(_at(p)))
                        break;
                    _pos = p + 1;
                }
                return std::string { _text.substr(start, _pos - start) };
            }

            token _id_or_bytes()
            {
                const auto start = _pos;
                auto name = _read_id();
                if (_at(_pos) == '\'' && (name == "h" || name == "b64"))
                    return _byte_string(start, name);
                return { token_type::id, start, _pos, false, std::move(name) };
            }

            token _byte_string(const size_t start, const std::string_view qualifier)
            {
                ++_pos;
                std::string raw {};
                for (;;) {
                    if (_pos >= _text.size())
                        _fail(syntax_kind::unterminated_string, start, _pos, "a byte string is missing its closing quote");
                    const char c = _text[_pos];
                    if (c == '\'') {
                        ++_pos;
                        break;
                    }
                    if (c == '\\') {
                        if (_pos + 1 >= _text.size())
                            _fail(syntax_kind::unterminated_string, start, _pos + 1, "a byte string is missing its closing quote");
                        if (is_control(_text[_pos + 1]))
                            _fail(syntax_kind::invalid_literal, _pos, _pos + 2, "a control character cannot be escaped");
                        raw += _text[_pos + 1];
                        _pos += 2;
                    } else if (c == '\n') {
                        raw += '\n';
                        ++_pos;
                    } else if (c == '\r' && _at(_pos + 1) == '\n') {
                        raw += '\n';
                        _pos += 2;
                    } else if (is_control(c)) {
                        _fail(syntax_kind::invalid_literal, _pos, _pos + 1, fmt::format("control character 0x{:02X} in a byte string", static_cast<uint8_t>(c)));
                    } else {
                        raw += c;
                        ++_pos;
                    }
                }
                uint8_vector data {};
                if (qualifier.empty()) {
                    data = uint8_vector { buffer { raw } };
                } else {
                    std::string compact {};
                    for (const char c: raw) {
                        if (c != ' ' && c != '\n')
                            compact += c;
                    }
                    try {
                        data = qualifier == "h" ? uint8_vector::from_hex(compact) : base64::decode_url(compact);
                    } catch (const tps::error &ex) {
                        _fail(syntax_kind::invalid_literal, start, _pos, fmt::format("invalid {} byte string: {}", qualifier, ex.what()));
                    }
                }
                return { token_type::bytes, start, _pos, false, std::move(data) };
            }

            token _text_string()
            {
                const auto start = _pos++;
                std::string val {};
                for (;;) {
                    if (_pos >= _text.size() || _text[_pos] == '\n')
                        _fail(syntax_kind::unterminated_string, start, _pos, "a text string is missing its closing quote");
                    const char c = _text[_pos];
                    if (c == '"') {
                        ++_pos;
                        break;
                    }
                    if (c == '\\') {
                        if (_pos + 1 >= _text.size() || _text[_pos + 1] == '\n')
                            _fail(syntax_kind::unterminated_string, start, _pos + 1, "a text string is missing its closing quote");
                        if (is_control(_text[_pos + 1]))
                            _fail(syntax_kind::invalid_literal, _pos, _pos + 2, "a control character cannot be escaped");
                        val += _text[_pos + 1];
                        _pos += 2;
                    } else if (is_control(c)) {
                        _fail(syntax_kind::invalid_literal, _pos, _pos + 1, fmt::format("control character 0x{:02X} in a text string", static_cast<uint8_t>(c)));
                    } else {
                        val += c;
                        ++_pos;
                    }
                }
                return { token_type::text, start, _pos, false, std::move(val) };
            }

            // uint = DIGIT1 *DIGIT / "0x" 1*HEXDIG / "0b" 1*BINDIG / "0"
            uint64_t _read_uint(const size_t start)
            {
                uint64_t val = 0;
                const auto accumulate = [&](const uint64_t base, const uint64_t digit) {
                    if (val > (std::numeric_limits<uint64_t>::max() - digit) / base)
                        _fail(syntax_kind::invalid_literal, start, _pos + 1, "an integer literal does not fit into 64 bits");
                    val = val * base + digit;
                    ++_pos;
                };
                if (_at(_pos) == '0' && _at(_pos + 1) == 'x' && is_hex(_at(_pos + 2))) {
                    _pos += 2;
                    while (is_hex(_at(_pos)))
                        accumulate(16, uint_from_hex(_at(_pos)));
                } else if (_at(_pos) == '0' && _at(_pos + 1) == 'b' && is_bin(_at(_pos + 2))) {
                    _pos += 2;
                    while (is_bin(_at(_pos)))
                        accumulate(2, _at(_pos) - '0');
                } else if (_at(_pos) == '0') {
                    ++_pos;
                } else {
                    while (is_digit(_at(_pos)))
                        accumulate(10, _at(_pos) - '0');
                }
                return val;
            }

            // "0x" 1*HEXDIG ["." 1*HEXDIG] "p" exponent
            std::optional<token> _hexfloat(const size_t start, const bool negative)
            {
                size_t p = _pos;
                if (_at(p) != '0' || _at(p + 1) != 'x' || !is_hex(_at(p + 2)))
                    return {};
                p += 2;
                const auto int_start = p;
                while (is_hex(_at(p)))
                    ++p;
                const auto int_digits = _text.substr(int_start, p - int_start);
                std::string_view frac_digits {};
                if (_at(p) == '.' && is_hex(_at(p + 1))) {
                    const auto frac_start = ++p;
                    while (is_hex(_at(p)))
                        ++p;
                    frac_digits = _text.substr(frac_start, p - frac_start);
                }
                if (_at(p) != 'p')
                    return {};
                const auto exp_start = ++p;
                if (_at(p) == '+' || _at(p) == '-')
                    ++p;
                if (!is_digit(_at(p)))
                    return {};
                while (is_digit(_at(p)))
                    ++p;
                const auto exp = _text.substr(exp_start, p - exp_start);
                _pos = p;
                double val = 0.0;
                try {
                    val = parse_hexfloat(negative, int_digits, frac_digits, exp);
                } catch (const tps::error &ex) {
                    _fail(syntax_kind::invalid_literal, start, _pos, ex.what());
                }
                return token { token_type::number, start, _pos, false, number_literal { val, false } };
            }

            token _number()
            {
                const auto start = _pos;
                const bool negative = _text[_pos] == '-';
                if (negative)
                    ++_pos;
                if (auto tok = _hexfloat(start, negative); tok)
                    return std::move(*tok);
                const auto mag = _read_uint(start);
                if (mag > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    _fail(syntax_kind::invalid_literal, start, _pos, "an integer literal does not fit into a 64-bit signed integer");
                std::string_view frac {};
                std::string_view exp {};
                if (_at(_pos) == '.' && is_digit(_at(_pos + 1))) {
                    const auto frac_start = ++_pos;
                    while (is_digit(_at(_pos)))
                        ++_pos;
                    frac = _text.substr(frac_start, _pos - frac_start);
                }
                if (_at(_pos) == 'e') {
                    size_t p = _pos + 1;
                    if (_at(p) == '+' || _at(p) == '-')
                        ++p;
                    if (is_digit(_at(p))) {
                        const auto exp_start = _pos + 1;
                        _pos = p;
                        while (is_digit(_at(_pos)))
                            ++_pos;
                        exp = _text.substr(exp_start, _pos - exp_start);
                    }
                }
                if (frac.empty() && exp.empty()) {
                    const auto ival = static_cast<int64_t>(mag);
                    return { token_type::number, start, _pos, false, number_literal { negative ? -ival : ival, !negative } };
                }
                auto repr = fmt::format("{}{}", negative ? "-" : "", mag);
                if (!frac.empty())
                    repr += fmt::format(".{}", frac);
                if (!exp.empty())
                    repr += fmt::format("e{}", exp);
                double val = 0.0;
                const auto [ptr, ec] = std::from_chars(repr.data(), repr.data() + repr.size(), val);
                if (ec != std::errc {} || ptr != repr.data() + repr.size())
                    _fail(syntax_kind::invalid_literal, start, _pos, fmt::format("cannot represent {} as a double", repr));
                return { token_type::number, start, _pos, false, number_literal { val, false } };
            }

            token _hash()
            {
                const auto start = _pos++;
                hash_literal h {};
                if (is_digit(_at(_pos))) {
                    h.major = static_cast<uint8_t>(_text[_pos] - '0');
                    ++_pos;
                    if (_at(_pos) == '.' && is_digit(_at(_pos + 1))) {
                        ++_pos;
                        h.arg = _read_uint(start);
                    }
                }
                return { token_type::hash, start, _pos, false, h };
            }
        };
    }

    std::vector<token> tokenize(const std::string_view text, const std::shared_ptr<const std::string> &file)
    {
        return lexer { text, file }.run();
    }
}
