/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <limits>
#include <unordered_map>
#include "lexer.hpp"
#include "parser.hpp"

namespace tps::cddl {
    namespace {
        struct parser {
            // combined depth of nested types and group entries
            static constexpr size_t max_depth = 256;

            parser(const std::string_view text, const std::string_view file_name):
                _text { text }, _file { std::make_shared<const std::string>(file_name) },
                _toks { tokenize(_text, _file) }
            {
            }

            rule_list run()
            {
                rule_list rules {};
                while (_peek().type != token_type::eof) {
                    auto r = _rule();
                    if (!r)
                        _fail();
                    rules.emplace_back(std::move(*r));
                }
                if (rules.empty())
                    _fail();
                return rules;
            }
        private:
            std::string_view _text;
            std::shared_ptr<const std::string> _file;
            std::vector<token> _toks;
            size_t _pos = 0;
            // the furthest token the parser failed to accept
            size_t _furthest = 0;
            size_t _depth = 0;
            // type1 results by start token: the parsed type (null on failure) and the end token
            std::unordered_map<size_t, std::pair<type_ptr, size_t>> _type1_cache {};

            struct depth_guard {
                explicit depth_guard(parser &p): _p { p }
                {
                    if (++_p._depth > max_depth) {
                        --_p._depth;
                        _p._fail_depth();
                    }
                }

                ~depth_guard()
                {
                    --_p._depth;
                }
            private:
                parser &_p;
            };

            [[noreturn]] void _fail() const
            {
                const auto &tok = _toks[std::min(_furthest, _toks.size() - 1)];
                const source_span span { _file, tok.begin, tok.end };
                if (tok.type == token_type::eof)
                    throw error::syntax(error_kind::parse, syntax_kind::unexpected_eof, span, _text, "the input ended before the rule was complete");
                throw error::syntax(error_kind::parse, syntax_kind::unexpected_token, span, _text,
                    fmt::format("unexpected token '{}'", _text.substr(tok.begin, tok.end - tok.begin)));
            }

            [[noreturn]] void _fail_depth() const
            {
                const auto &tok = _peek();
                throw error::syntax(error_kind::parse, syntax_kind::too_deep, source_span { _file, tok.begin, tok.end }, _text,
                    fmt::format("nesting deeper than {} levels", max_depth));
            }

            const token &_peek(const size_t offset=0) const
            {
                return _toks[std::min(_pos + offset, _toks.size() - 1)];
            }

            void _reject()
            {
                _furthest = std::max(_furthest, _pos);
            }

            const token *_accept(const token_type type)
            {
                const auto &tok = _peek();
                if (tok.type == type && type != token_type::eof) {
                    ++_pos;
                    return &tok;
                }
                _reject();
                return nullptr;
            }

            // the token at the current position must follow the previous one without whitespace
            const token *_accept_adjacent(const token_type type)
            {
                if (_peek().space_before) {
                    _reject();
                    return nullptr;
                }
                return _accept(type);
            }

            source_span _span(const size_t start) const
            {
                const auto begin = _toks[start].begin;
                return { _file, begin, _pos > start ? _toks[_pos - 1].end : begin };
            }

            // a rule ends at the end of the input or before the next "name [<params>] assign"
            bool _at_rule_boundary(size_t pos) const
            {
                if (_toks[pos].type == token_type::eof)
                    return true;
                if (_toks[pos].type != token_type::id)
                    return false;
                ++pos;
                if (_toks[pos].type == token_type::langle && !_toks[pos].space_before) {
                    while (_toks[pos].type != token_type::rangle && _toks[pos].type != token_type::eof)
                        ++pos;
                    if (_toks[pos].type == token_type::eof)
                        return false;
                    ++pos;
                }
                switch (_toks[pos].type) {
                    case token_type::assign:
                    case token_type::assign_type_ext:
                    case token_type::assign_group_ext:
                        return true;
                    default:
                        return false;
                }
            }

            std::optional<rule> _rule()
            {
                const auto start = _pos;
                const auto *name = _accept(token_type::id);
                if (!name)
                    return {};
                std::optional<generic_params> params {};
                if (_peek().type == token_type::langle && !_peek().space_before) {
                    params = _generic_params();
                    if (!params) {
                        _pos = start;
                        return {};
                    }
                }
                const auto head_end = _pos;

                std::optional<rule> type_rule {};
                size_t type_end = 0;
                if (const auto assign = _assign(token_type::assign_type_ext); assign) {
                    if (auto def = _type0(); def) {
                        type_rule.emplace(rule { rule_kind::type_def, name->str(), params, *assign, std::move(def), {}, _span(start) });
                        type_end = _pos;
                    }
                }
                _pos = head_end;
                std::optional<rule> group_rule {};
                size_t group_end = 0;
                if (const auto assign = _assign(token_type::assign_group_ext); assign) {
                    if (auto def = _grpent(); def) {
                        group_rule.emplace(rule { rule_kind::group_def, name->str(), params, *assign, {},
                            std::make_shared<const group_item>(std::move(*def)), _span(start) });
                        group_end = _pos;
                    }
                }

                // "a = x" is both a type and a group entry: the type wins unless only the group form
                // reaches the next rule or the group form consumes more input
                const bool type_complete = type_rule && _at_rule_boundary(type_end);
                const bool group_complete = group_rule && _at_rule_boundary(group_end);
                if (type_rule && (type_complete || (!group_complete && type_end >= group_end))) {
                    _pos = type_end;
                    return type_rule;
                }
                if (group_rule) {
                    _pos = group_end;
                    return group_rule;
                }
                _pos = start;
                return {};
            }

            std::optional<assignment> _assign(const token_type extend)
            {
                if (_accept(token_type::assign))
                    return assignment::assign;
                if (_accept(extend))
                    return assignment::assign_extend;
                return {};
            }

            // "<" id *("," id) ">"
            std::optional<generic_params> _generic_params()
            {
                const auto start = _pos;
                if (!_accept(token_type::langle))
                    return {};
                generic_params params {};
                for (;;) {
                    const auto *id = _accept(token_type::id);
                    if (!id)
                        break;
                    params.emplace_back(id->str());
                    if (!_accept(token_type::comma))
                        break;
                }
                if (params.empty() || !_accept(token_type::rangle)) {
                    _pos = start;
                    return {};
                }
                return params;
            }

            // "<" type1 *("," type1) ">"
            std::optional<generic_args> _generic_args()
            {
                const auto start = _pos;
                if (!_accept(token_type::langle))
                    return {};
                generic_args args {};
                for (;;) {
                    auto arg = _type1();
                    if (!arg)
                        break;
                    args.emplace_back(std::move(arg));
                    if (!_accept(token_type::comma))
                        break;
                }
                if (args.empty() || !_accept(token_type::rangle)) {
                    _pos = start;
                    return {};
                }
                return args;
            }

            // optional generic arguments directly after a name; false when present but malformed
            bool _opt_generic_args(std::optional<generic_args> &args)
            {
                if (_peek().type != token_type::langle || _peek().space_before)
                    return true;
                args = _generic_args();
                return args.has_value();
            }

            std::optional<value> _value()
            {
                const auto &tok = _peek();
                switch (tok.type) {
                    case token_type::number: {
                        ++_pos;
                        return std::visit([](const auto v) { return value { v }; }, tok.number().val);
                    }
                    case token_type::text:
                        ++_pos;
                        return value { tok.str() };
                    case token_type::bytes:
                        ++_pos;
                        return value { tok.bytes() };
                    default:
                        _reject();
                        return {};
                }
            }

            std::optional<int64_t> _uint()
            {
                const auto &tok = _peek();
                if (tok.type == token_type::number && tok.number().is_uint) {
                    ++_pos;
                    return std::get<int64_t>(tok.number().val);
                }
                _reject();
                return {};
            }

            // type = type1 *("/" type1)
            type_ptr _type0()
            {
                const auto start = _pos;
                auto first = _type1();
                if (!first)
                    return {};
                type_list alts { first };
                for (;;) {
                    const auto save = _pos;
                    if (!_accept(token_type::slash))
                        break;
                    auto next = _type1();
                    if (!next) {
                        _pos = save;
                        break;
                    }
                    alts.emplace_back(std::move(next));
                }
                if (alts.size() == 1)
                    return first;
                return make_type(type::choice { std::move(alts) }, _span(start));
            }

            // cached by start token: member keys and entry types parse the same type1
            type_ptr _type1()
            {
                const auto start = _pos;
                if (const auto it = _type1_cache.find(start); it != _type1_cache.end()) {
                    _pos = it->second.second;
                    return it->second.first;
                }
                auto res = _type1_uncached();
                _type1_cache.emplace(start, std::make_pair(res, _pos));
                return res;
            }

            // type1 = type2 [(rangeop / ctlop) type2]
            type_ptr _type1_uncached()
            {
                const auto start = _pos;
                auto lhs = _type2();
                if (!lhs)
                    return {};
                const auto save = _pos;
                std::optional<type_operator> op {};
                if (_accept(token_type::range_incl))
                    op = type_operator { type_operator::kind::range_incl };
                else if (_accept(token_type::range_excl))
                    op = type_operator { type_operator::kind::range_excl };
                else if (const auto *ctl = _accept(token_type::ctlop); ctl)
                    op = type_operator { type_operator::kind::control, ctl->str() };
                if (op) {
                    if (auto rhs = _type2(); rhs)
                        return make_type(type::combined { std::move(lhs), std::move(rhs), std::move(*op) }, _span(start));
                    _pos = save;
                }
                return lhs;
            }

            type_ptr _type2()
            {
                const depth_guard guard { *this };
                const auto start = _pos;
                const auto &tok = _peek();
                switch (tok.type) {
                    case token_type::number:
                    case token_type::text:
                    case token_type::bytes: {
                        auto val = _value();
                        return make_type(std::move(*val), _span(start));
                    }
                    case token_type::id: {
                        ++_pos;
                        std::optional<generic_args> args {};
                        if (!_opt_generic_args(args))
                            break;
                        return make_type(type::rule_ref { tok.str(), std::move(args) }, _span(start));
                    }
                    case token_type::lparen: {
                        ++_pos;
                        auto inner = _type0();
                        if (!inner || !_accept(token_type::rparen))
                            break;
                        return inner;
                    }
                    case token_type::lbrace: {
                        ++_pos;
                        auto items = _group();
                        if (!_accept(token_type::rbrace))
                            break;
                        return make_type(type::group_map { std::move(items) }, _span(start));
                    }
                    case token_type::lbracket: {
                        ++_pos;
                        auto items = _group();
                        if (!_accept(token_type::rbracket))
                            break;
                        return make_type(type::group_array { std::move(items) }, _span(start));
                    }
                    case token_type::tilde: {
                        ++_pos;
                        const auto *name = _accept(token_type::id);
                        std::optional<generic_args> args {};
                        if (!name || !_opt_generic_args(args))
                            break;
                        return make_type(type::unwrap { name->str(), std::move(args) }, _span(start));
                    }
                    case token_type::amp: {
                        ++_pos;
                        if (_accept(token_type::lparen)) {
                            auto items = _group();
                            if (!_accept(token_type::rparen))
                                break;
                            return make_type(type::group_enum { std::move(items) }, _span(start));
                        }
                        const auto *name = _accept(token_type::id);
                        std::optional<generic_args> args {};
                        if (!name || !_opt_generic_args(args))
                            break;
                        return make_type(type::group_name_enum { name->str(), std::move(args) }, _span(start));
                    }
                    case token_type::hash: {
                        ++_pos;
                        const auto &h = tok.hash();
                        if (!h.major)
                            return make_type(type::any {}, _span(start));
                        if (*h.major == 6) {
                            const auto save = _pos;
                            if (_accept_adjacent(token_type::lparen)) {
                                auto inner = _type0();
                                if (inner && _accept(token_type::rparen))
                                    return make_type(type::tagged { h.arg, std::move(inner) }, _span(start));
                            }
                            _pos = save;
                        }
                        return make_type(type::major { *h.major, h.arg }, _span(start));
                    }
                    default:
                        break;
                }
                _reject();
                _pos = start;
                return {};
            }

            // group = grpchoice *("//" grpchoice); the choices are flattened into one entry list
            group_ptr _group()
            {
                const auto start = _pos;
                group grp {};
                _grpchoice(grp.items);
                for (;;) {
                    if (!_accept(token_type::double_slash))
                        break;
                    _grpchoice(grp.items);
                }
                grp.span = _span(start);
                return std::make_shared<const group>(std::move(grp));
            }

            // grpchoice = *(grpent [","])
            void _grpchoice(std::vector<group_item> &items)
            {
                for (;;) {
                    auto item = _grpent();
                    if (!item)
                        break;
                    items.emplace_back(std::move(*item));
                    if (_peek().type == token_type::comma)
                        ++_pos;
                }
            }

            // occur = [uint] "*" [uint] / "+" / "?"
            std::optional<occurs> _occur()
            {
                const auto start = _pos;
                if (_accept(token_type::plus))
                    return occurs::of(occurs::kind::one_plus);
                if (_accept(token_type::question))
                    return occurs::of(occurs::kind::optional);
                const auto from = _uint();
                if (from ? !_accept_adjacent(token_type::star) : !_accept(token_type::star)) {
                    _pos = start;
                    return {};
                }
                std::optional<int64_t> upto {};
                if (!_peek().space_before)
                    upto = _uint();
                const auto from_val = from.value_or(0);
                if (from_val == 0 && !upto)
                    return occurs::of(occurs::kind::zero_plus);
                if (from_val == 0 && *upto == 1)
                    return occurs::of(occurs::kind::optional);
                return occurs::between(from_val, upto.value_or(std::numeric_limits<int64_t>::max()));
            }

            // memberkey = type1 ["^"] "=>" / bareword ":" / value ":"
            std::optional<member_key> _memberkey()
            {
                const auto start = _pos;
                if (auto key = _type1(); key) {
                    const bool cut = _accept(token_type::caret) != nullptr;
                    if (_accept(token_type::arrow))
                        return member_key { member_key::from_type { std::move(key), cut } };
                }
                _pos = start;
                if (const auto *bareword = _accept(token_type::id); bareword) {
                    if (_accept(token_type::colon))
                        return member_key { member_key::from_value { value { bareword->str() } } };
                }
                _pos = start;
                if (auto val = _value(); val) {
                    if (_accept(token_type::colon))
                        return member_key { member_key::from_value { std::move(*val) } };
                }
                _pos = start;
                return {};
            }

            // grpent = [occur] [memberkey] type / [occur] groupname [genericarg] / [occur] "(" group ")"
            std::optional<group_item> _grpent()
            {
                const depth_guard guard { *this };
                const auto start = _pos;
                const auto occ = _occur().value_or(occurs {});
                const auto after_occur = _pos;

                auto key = _memberkey();
                if (auto val = _type0(); val)
                    return group_item { group_item::key { std::move(key), std::move(val), occ }, _span(start) };

                // plain names are normally taken by the type alternative above
                _pos = after_occur;
                if (const auto *name = _accept(token_type::id); name) {
                    std::optional<generic_args> args {};
                    if (_opt_generic_args(args))
                        return group_item { group_item::name { name->str(), occ, std::move(args) }, _span(start) };
                }

                _pos = after_occur;
                if (_accept(token_type::lparen)) {
                    auto items = _group();
                    if (_accept(token_type::rparen))
                        return group_item { group_item::grp { std::move(items), occ }, _span(start) };
                }
                _pos = start;
                return {};
            }
        };
    }

    rule_list parse(const std::string_view text, const std::string_view file_name)
    {
        return parser { text, file_name }.run();
    }
}
