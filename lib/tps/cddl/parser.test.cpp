/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <chrono>
#include <tps/common/test.hpp>
#include "parser.hpp"

using namespace tps;
using namespace tps::cddl;

namespace {
    rule_list parse_test(const std::string_view text)
    {
        return parse(text, "test.cddl");
    }

    std::string format_rule(const std::string_view text)
    {
        const auto rules = parse_test(text);
        if (rules.size() != 1)
            throw tps::error(fmt::format("expected one rule but got {}", rules.size()));
        return fmt::format("{}", rules.front());
    }

    // the definition of the only rule of a type_def
    cddl::type_ptr def_of(const std::string_view text)
    {
        const auto rules = parse_test(text);
        if (rules.size() != 1 || rules.front().kind != rule_kind::type_def)
            throw tps::error(fmt::format("expected one type rule: {}", text));
        return rules.front().def_type;
    }

    // the occurrence of the only entry of an array type
    occurs array_occurrence(const std::string_view text)
    {
        const auto *arr = def_of(text)->get_if<cddl::type::group_array>();
        if (!arr || arr->items->items.size() != 1)
            throw tps::error(fmt::format("expected an array with one entry: {}", text));
        return arr->items->items.front().occurrence();
    }

    std::string nested(const size_t depth, const std::string_view open, const std::string_view inner, const std::string_view close)
    {
        std::string text { "a = " };
        for (size_t i = 0; i < depth; ++i)
            text += open;
        text += inner;
        for (size_t i = 0; i < depth; ++i)
            text += close;
        return text;
    }

    void expect_parse_error(const std::string_view text, const syntax_kind sk, const std::source_location &loc=std::source_location::current())
    {
        std::optional<syntax_kind> got {};
        try {
            parse_test(text);
        } catch (const cddl::error &ex) {
            expect(ex.kind() == error_kind::parse, loc);
            got = ex.syntax();
        }
        expect(got == sk, loc) << fmt::format("'{}': expected {} but got {}", text, sk, got);
    }
}

suite cddl_parser_suite = [] {
    "cddl::parser"_test = [] {
        "type rules"_test = [] {
            const auto rules = parse_test("a = uint\n b = tstr\n a /= nint");
            expect(rules.size() == 3U);
            test_same(rules[0].name, std::string { "a" });
            expect(rules[0].kind == rule_kind::type_def);
            expect(rules[0].assign == assignment::assign);
            expect(rules[2].assign == assignment::assign_extend);
            const auto *ref = rules[1].def_type->get_if<cddl::type::rule_ref>();
            expect(ref && ref->name == "tstr" && !ref->args);
            test_same(rules[0].span.file_name(), std::string { "test.cddl" });
            test_same(rules[0].span.begin, 0ULL);
            test_same(rules[0].span.end, 8ULL);
            // spans of one source share the file name
            expect(rules[0].span.file == rules[2].span.file);
        };
        "debug form"_test = [] {
            test_same(format_rule("a = uint"), std::string { "typedef(a, =, rule(uint))" });
            test_same(format_rule("a /= 1 / \"x\""), std::string { R"(typedef(a, /=, choice(value(int(1)), value(tstr("x")))))" });
            test_same(format_rule("m = { a: uint, ? \"b\" => tstr }"),
                std::string { R"(typedef(m, =, map([key(tstr("a"): rule(uint), once), key(value(tstr("b")) => rule(tstr), optional)])))" });
            test_same(format_rule("t = #6.32(tstr)"), std::string { "typedef(t, =, tagged(32, rule(tstr)))" });
            test_same(format_rule("g //= (a: int)"), std::string { R"(groupdef(g, //=, grp([key(tstr("a"): rule(int), once)], once)))" });
        };
        "choices"_test = [] {
            const auto *choice = def_of("t = int / tstr / nil")->get_if<cddl::type::choice>();
            expect(choice && choice->alts.size() == 3U);
            // a single alternative is not wrapped into a choice
            expect(def_of("t = int")->get_if<cddl::type::choice>() == nullptr);
            // parentheses only group the types
            const auto *nested = def_of("t = (int / tstr)")->get_if<cddl::type::choice>();
            expect(nested && nested->alts.size() == 2U);
        };
        "operators"_test = [] {
            const auto *incl = def_of("r = 0..10")->get_if<cddl::type::combined>();
            expect(incl && incl->op.k == type_operator::kind::range_incl);
            const auto *lhs = incl->lhs->get_if<cddl::value>();
            expect(lhs && std::get<int64_t>(lhs->val) == 0);
            const auto *excl = def_of("r = -1.5...5")->get_if<cddl::type::combined>();
            expect(excl && excl->op.k == type_operator::kind::range_excl);
            const auto *ctl = def_of("s = bstr .size 32")->get_if<cddl::type::combined>();
            expect(ctl && ctl->op.k == type_operator::kind::control && ctl->op.control == "size");
            const auto *rhs = ctl->rhs->get_if<cddl::value>();
            expect(rhs && std::get<int64_t>(rhs->val) == 32);
        };
        "maps and arrays"_test = [] {
            const auto *map = def_of("person = { name: tstr, age: uint, }")->get_if<cddl::type::group_map>();
            expect(map && map->items->items.size() == 2U);
            const auto &name = std::get<group_item::key>(map->items->items[0].val);
            const auto &mk = std::get<member_key::from_value>(name.member->val);
            test_same(std::get<std::string>(mk.key.val), std::string { "name" });
            const auto *cut = def_of("m = { \"a\" ^ => int }")->get_if<cddl::type::group_map>();
            const auto &cut_key = std::get<group_item::key>(cut->items->items[0].val);
            expect(std::get<member_key::from_type>(cut_key.member->val).cut);
            const auto *arr = def_of("p = [int, int // tstr]")->get_if<cddl::type::group_array>();
            expect(arr && arr->items->items.size() == 3U);
            const auto *num_key = def_of("m = { 1: int }")->get_if<cddl::type::group_map>();
            const auto &nk = std::get<member_key::from_value>(std::get<group_item::key>(num_key->items->items[0].val).member->val);
            expect(std::get<int64_t>(nk.key.val) == 1);
            const auto *empty = def_of("e = {}")->get_if<cddl::type::group_map>();
            expect(empty && empty->items->items.empty());
        };
        "occurrences"_test = [] {
            test_same(array_occurrence("a = [* int]"), occurs::of(occurs::kind::zero_plus));
            test_same(array_occurrence("a = [+ int]"), occurs::of(occurs::kind::one_plus));
            test_same(array_occurrence("a = [? int]"), occurs::of(occurs::kind::optional));
            test_same(array_occurrence("a = [0*1 int]"), occurs::of(occurs::kind::optional));
            test_same(array_occurrence("a = [3* int]"), occurs::between(3, std::numeric_limits<int64_t>::max()));
            test_same(array_occurrence("a = [2*4 int]"), occurs::between(2, 4));
            test_same(array_occurrence("a = [*5 int]"), occurs::between(0, 5));
            test_same(array_occurrence("a = [int]"), occurs {});
            // the bounds must be adjacent to the star
            test_same(array_occurrence("a = [* 5]"), occurs::of(occurs::kind::zero_plus));
        };
        "major types and tags"_test = [] {
            const auto *m = def_of("m = #1")->get_if<cddl::type::major>();
            expect(m && m->mt == 1 && !m->ai);
            const auto *f = def_of("f = #7.25")->get_if<cddl::type::major>();
            expect(f && f->mt == 7 && f->ai == 25U);
            expect(def_of("x = #")->get_if<cddl::type::any>() != nullptr);
            const auto *any_tag = def_of("t = #6(int)")->get_if<cddl::type::tagged>();
            expect(any_tag && !any_tag->tag);
            // a tag needs its type in adjacent parentheses
            expect_parse_error("t = #6.1 (int)", syntax_kind::unexpected_token);
        };
        "unwrap and enumerations"_test = [] {
            const auto *u = def_of("u = ~header")->get_if<cddl::type::unwrap>();
            expect(u && u->name == "header");
            const auto *e = def_of("e = &(a: 1, b: 2)")->get_if<cddl::type::group_enum>();
            expect(e && e->items->items.size() == 2U);
            const auto *n = def_of("n = &colors")->get_if<cddl::type::group_name_enum>();
            expect(n && n->name == "colors");
        };
        "generics"_test = [] {
            const auto rules = parse_test("message<t, v> = { type: t, value: v }\nm = message<\"reboot\", \"now\">");
            expect(rules.size() == 2U);
            expect(rules[0].params == generic_params { "t", "v" });
            const auto *ref = rules[1].def_type->get_if<cddl::type::rule_ref>();
            expect(ref && ref->args && ref->args->size() == 2U);
            // a space before "<" ends the name
            expect_parse_error("m = message <int>", syntax_kind::unexpected_token);
        };
        "group rules"_test = [] {
            const auto rules = parse_test("g = (a: int, b: tstr)\nh = x: int\nb = 1");
            expect(rules.size() == 3U);
            expect(rules[0].kind == rule_kind::group_def);
            const auto &grp = std::get<group_item::grp>(rules[0].def_group->val);
            expect(grp.items->items.size() == 2U);
            expect(rules[1].kind == rule_kind::group_def);
            expect(std::holds_alternative<group_item::key>(rules[1].def_group->val));
            expect(rules[2].kind == rule_kind::type_def);
            expect(rules[2].def_type->get_if<cddl::value>() != nullptr);
        };
        "syntax errors"_test = [] {
            expect_parse_error("", syntax_kind::unexpected_eof);
            expect_parse_error("; only a comment\n", syntax_kind::unexpected_eof);
            expect_parse_error("a = ", syntax_kind::unexpected_eof);
            expect_parse_error("a = [int", syntax_kind::unexpected_eof);
            expect_parse_error("a = uint )", syntax_kind::unexpected_token);
            expect_parse_error("= uint", syntax_kind::unexpected_token);
            expect_throws_msg<cddl::error>([] { parse_test("a = uint\nb = )"); }, "test.cddl:2:5: cddl parse error: unexpected token: unexpected token ')'");
        };
        "nested arrays and groups"_test = [] {
            const auto start = std::chrono::steady_clock::now();
            const auto arrays = parse_test(nested(30, "[", "uint", "]"));
            const auto groups = parse_test(nested(30, "[(", "x: uint", ")]"));
            const auto maps = parse_test(nested(30, "{ k: ", "uint", " }"));
            const auto took = std::chrono::duration<double> { std::chrono::steady_clock::now() - start }.count();
            expect(took < 1.0) << fmt::format("parsing of 30 nesting levels took {} sec", took);
            expect(arrays.size() == 1U);
            expect(groups.size() == 1U);
            expect(maps.size() == 1U);
            size_t depth = 0;
            for (auto t = arrays.front().def_type; t; ++depth) {
                const auto *arr = t->get_if<cddl::type::group_array>();
                if (!arr)
                    break;
                expect(arr->items->items.size() == 1U);
                const auto &k = std::get<group_item::key>(arr->items->items.front().val);
                expect(!k.member);
                t = k.val;
            }
            test_same(depth, 30U);
        };
        "nesting limit"_test = [] {
            expect(nothrow([] { parse_test(nested(100, "[", "uint", "]")); }));
            expect_parse_error(nested(200, "[", "uint", "]"), syntax_kind::too_deep);
            expect_parse_error(nested(20000, "{ k: ", "uint", " }"), syntax_kind::too_deep);
            expect_throws_msg<cddl::error>([] { parse_test(nested(1000, "(", "uint", ")")); }, "nesting deeper than 256 levels");
        };
    };
};
