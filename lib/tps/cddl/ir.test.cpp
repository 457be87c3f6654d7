/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/test.hpp>
#include "ir.hpp"
#include "parser.hpp"
#include "reader.hpp"

using namespace tps;
using namespace tps::cddl;

namespace {
    cddl::type_ptr ref(const std::string &name)
    {
        return make_type(cddl::type::rule_ref { name }, source_span {});
    }

    std::string ref_name(const cddl::type_ptr &t)
    {
        const auto *r = t->get_if<cddl::type::rule_ref>();
        if (!r)
            throw tps::error(fmt::format("not a rule reference: {}", t));
        return r->name;
    }
}

suite cddl_ir_suite = [] {
    "cddl::ir"_test = [] {
        "pass1 extension"_test = [] {
            const auto st = ir::pass1(parse("a = uint\n b = tstr\n a /= nint", "test.cddl"));
            expect(st.size() == 2U);
            const auto &a = st.at("a");
            expect(a.is_choice());
            const auto *choice = a.type()->get_if<cddl::type::choice>();
            expect(choice && choice->alts.size() == 2U);
            test_same(ref_name(choice->alts[0]), std::string { "uint" });
            test_same(ref_name(choice->alts[1]), std::string { "nint" });
            const auto &b = st.at("b");
            expect(!b.is_choice());
            test_same(ref_name(b.type()), std::string { "tstr" });
        };
        "pass1 duplicate"_test = [] {
            const auto rules = parse("a = uint\n a = tstr", "test.cddl");
            expect(rules.size() == 2U);
            std::optional<error_kind> kind {};
            std::string subject {};
            try {
                ir::pass1(rules);
            } catch (const cddl::error &ex) {
                kind = ex.kind();
                subject = ex.subject();
            }
            expect(kind == error_kind::duplicate_rule);
            test_same(subject, std::string { "a" });
            expect_throws_msg<cddl::error>([&] { ir::pass1(rules); }, "Value has already been assigned to a. Reassignment not allowed");
        };
        "extension law"_test = [] {
            ir::store st {};
            st.try_insert("k", ref("t0"));
            st.update("k", ref("t1"));
            test_same(st.at("k").alternatives.size(), 2ULL);
            st.update("k", ref("t2"));
            const auto &alts = st.at("k").alternatives;
            test_same(alts.size(), 3ULL);
            test_same(ref_name(alts[0]), std::string { "t0" });
            test_same(ref_name(alts[1]), std::string { "t1" });
            test_same(ref_name(alts[2]), std::string { "t2" });
        };
        "extension of a choice"_test = [] {
            const auto st = ir::pass1(parse("a = uint / tstr\na /= nint\nb = int / nil", "test.cddl"));
            const auto &a = st.at("a");
            test_same(a.alternatives.size(), 3ULL);
            test_same(ref_name(a.alternatives[0]), std::string { "uint" });
            test_same(ref_name(a.alternatives[1]), std::string { "tstr" });
            test_same(ref_name(a.alternatives[2]), std::string { "nint" });
            const auto *choice = a.type()->get_if<cddl::type::choice>();
            expect(choice && choice->alts.size() == 3U);
            for (const auto &alt: a.alternatives)
                expect(alt->get_if<cddl::type::choice>() == nullptr);
            const auto &b = st.at("b");
            expect(b.is_choice());
            test_same(b.alternatives.size(), 2ULL);
            test_same(fmt::format("{}", st.at("a")), fmt::format("{}", ir::pass1(parse("a = uint / tstr / nint", "test.cddl")).at("a")));
        };
        "update creates entries"_test = [] {
            ir::store st {};
            st.update("x", ref("uint"));
            expect(st.contains("x"));
            expect(!st.at("x").is_choice());
            expect_throws_msg<cddl::error>([&] { st.try_insert("x", ref("tstr")); }, "Reassignment not allowed");
        };
        "unknown rules"_test = [] {
            const ir::store st {};
            std::optional<error_kind> kind {};
            try {
                st.at("missing");
            } catch (const cddl::error &ex) {
                kind = ex.kind();
            }
            expect(kind == error_kind::unknown_rule);
        };
        "pass1 skips groups and generics"_test = [] {
            const auto st = ir::pass1(parse("g = (a: int)\nt<x> = [x]\nu = uint\ng2 //= (b: int)", "test.cddl"));
            expect(st.size() == 1U);
            expect(st.contains("u"));
            expect(!st.contains("g"));
            expect(!st.contains("t"));
        };
        "prelude"_test = [] {
            const auto st = ir::pass1(parse_prelude());
            expect(st.size() == 40U);
            const auto *int_def = st.at("int").type()->get_if<cddl::type::choice>();
            expect(int_def && int_def->alts.size() == 2U);
            const auto *tdate = st.at("tdate").type()->get_if<cddl::type::tagged>();
            expect(tdate && tdate->tag == 0U);
            const auto *undef = st.at("undefined").type()->get_if<cddl::type::major>();
            expect(undef && undef->mt == 7 && undef->ai == 23U);
        };
        "formatter"_test = [] {
            const auto st = ir::pass1(parse("a = uint\nb = tstr\na /= nint", "test.cddl"));
            test_same(fmt::format("{}", st), std::string { "a => choice(rule(uint), rule(nint))\nb => rule(tstr)\n" });
        };
    };
};
