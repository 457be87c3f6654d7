/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_AST_HPP
#define TPS_CDDL_AST_HPP

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <tps/common/bytes.hpp>
#include "error.hpp"

namespace tps::cddl {
    struct type;
    struct group;
    struct group_item;

    using type_ptr = std::shared_ptr<const type>;
    using type_list = std::vector<type_ptr>;
    using group_ptr = std::shared_ptr<const group>;
    using generic_params = std::vector<std::string>;
    using generic_args = std::vector<type_ptr>;

    struct value {
        using value_type = std::variant<uint8_vector, std::string, int64_t, double>;
        value_type val;

        bool operator==(const value &o) const =default;
    };

    struct occurs {
        enum class kind: uint8_t { once, optional, zero_plus, one_plus, between };

        kind k = kind::once;
        int64_t min = 1;
        int64_t max = 1;

        static occurs between(const int64_t min, const int64_t max)
        {
            return { kind::between, min, max };
        }

        static occurs of(const kind k)
        {
            switch (k) {
                case kind::optional: return { k, 0, 1 };
                case kind::zero_plus: return { k, 0, std::numeric_limits<int64_t>::max() };
                case kind::one_plus: return { k, 1, std::numeric_limits<int64_t>::max() };
                default: return { k, 1, 1 };
            }
        }

        bool operator==(const occurs &o) const =default;
    };

    struct type_operator {
        enum class kind: uint8_t { range_incl, range_excl, control };

        kind k = kind::range_incl;
        // the name of a control operator without the leading dot
        std::string control {};

        bool operator==(const type_operator &o) const =default;
    };

    struct member_key {
        // type1 ["^"] "=>"
        struct from_type {
            type_ptr key;
            bool cut = false;
        };
        // bareword ":" or value ":"
        struct from_value {
            value key;
        };

        std::variant<from_type, from_value> val;
    };

    struct group_item {
        struct key {
            std::optional<member_key> member {};
            type_ptr val;
            occurs occ {};
        };

        struct name {
            std::string id;
            occurs occ {};
            std::optional<generic_args> args {};
        };

        struct grp {
            group_ptr items;
            occurs occ {};
        };

        std::variant<key, name, grp> val;
        source_span span {};

        const occurs &occurrence() const noexcept
        {
            return std::visit([](const auto &v) -> const occurs & { return v.occ; }, val);
        }
    };

    struct group {
        std::vector<group_item> items {};
        source_span span {};
    };

    struct type {
        struct rule_ref {
            std::string name;
            std::optional<generic_args> args {};
        };

        struct choice {
            type_list alts;
        };

        struct group_map {
            group_ptr items;
        };

        struct group_array {
            group_ptr items;
        };

        // ~typename
        struct unwrap {
            std::string name;
            std::optional<generic_args> args {};
        };

        // &(group)
        struct group_enum {
            group_ptr items;
        };

        // &groupname
        struct group_name_enum {
            std::string name;
            std::optional<generic_args> args {};
        };

        // #6.tag(type)
        struct tagged {
            std::optional<uint64_t> tag {};
            type_ptr inner;
        };

        // #major.ai
        struct major {
            uint8_t mt = 0;
            std::optional<uint64_t> ai {};
        };

        struct combined {
            type_ptr lhs;
            type_ptr rhs;
            type_operator op;
        };

        struct any {
        };

        using value_type = std::variant<value, rule_ref, choice, group_map, group_array, unwrap, group_enum,
            group_name_enum, tagged, major, combined, any>;

        value_type val;
        source_span span {};

        template<typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&val);
        }
    };

    enum class rule_kind: uint8_t { type_def, group_def };
    enum class assignment: uint8_t { assign, assign_extend };

    struct rule {
        rule_kind kind;
        std::string name;
        std::optional<generic_params> params {};
        assignment assign = assignment::assign;
        // set for type_def rules
        type_ptr def_type {};
        // set for group_def rules
        std::shared_ptr<const group_item> def_group {};
        source_span span {};
    };

    using rule_list = std::vector<rule>;

    template<typename T>
    type_ptr make_type(T &&v, source_span span)
    {
        return std::make_shared<type>(type { std::forward<T>(v), std::move(span) });
    }

    // writes the items separated by commas without brackets
    template<typename OutIt, typename C>
    OutIt format_list(OutIt out_it, const C &items)
    {
        for (auto it = items.begin(); it != items.end(); ++it)
            out_it = fmt::format_to(out_it, "{}{}", it == items.begin() ? "" : ", ", *it);
        return out_it;
    }
}

namespace fmt {
    template<>
    struct formatter<tps::cddl::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::uint8_vector;
            if (const auto *b = std::get_if<uint8_vector>(&v.val); b)
                return fmt::format_to(ctx.out(), "bytes({})", *b);
            if (const auto *s = std::get_if<std::string>(&v.val); s)
                return fmt::format_to(ctx.out(), "tstr(\"{}\")", *s);
            if (const auto *i = std::get_if<int64_t>(&v.val); i)
                return fmt::format_to(ctx.out(), "int({})", *i);
            return fmt::format_to(ctx.out(), "float({})", std::get<double>(v.val));
        }
    };

    template<>
    struct formatter<tps::cddl::occurs>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using kind = tps::cddl::occurs::kind;
            switch (v.k) {
                case kind::once: return fmt::format_to(ctx.out(), "once");
                case kind::optional: return fmt::format_to(ctx.out(), "optional");
                case kind::zero_plus: return fmt::format_to(ctx.out(), "zero_plus");
                case kind::one_plus: return fmt::format_to(ctx.out(), "one_plus");
                case kind::between: return fmt::format_to(ctx.out(), "between({}, {})", v.min, v.max);
                default: return fmt::format_to(ctx.out(), "occurs: {}", static_cast<int>(v.k));
            }
        }
    };

    template<>
    struct formatter<tps::cddl::type_operator>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using kind = tps::cddl::type_operator::kind;
            switch (v.k) {
                case kind::range_incl: return fmt::format_to(ctx.out(), "..");
                case kind::range_excl: return fmt::format_to(ctx.out(), "...");
                case kind::control: return fmt::format_to(ctx.out(), ".{}", v.control);
                default: return fmt::format_to(ctx.out(), "type_operator: {}", static_cast<int>(v.k));
            }
        }
    };

    template<>
    struct formatter<tps::cddl::assignment>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            switch (v) {
                case tps::cddl::assignment::assign: return fmt::format_to(ctx.out(), "=");
                case tps::cddl::assignment::assign_extend: return fmt::format_to(ctx.out(), "/=");
                default: return fmt::format_to(ctx.out(), "assignment: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tps::cddl::type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::type;
            const auto with_args = [](auto out_it, const auto &args) {
                if (args)
                    out_it = fmt::format_to(tps::cddl::format_list(fmt::format_to(out_it, "<"), *args), ">");
                return fmt::format_to(out_it, ")");
            };
            return std::visit([&ctx, &with_args](const auto &t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, tps::cddl::value>) {
                    return fmt::format_to(ctx.out(), "value({})", t);
                } else if constexpr (std::is_same_v<T, type::rule_ref>) {
                    return with_args(fmt::format_to(ctx.out(), "rule({}", t.name), t.args);
                } else if constexpr (std::is_same_v<T, type::choice>) {
                    return fmt::format_to(tps::cddl::format_list(fmt::format_to(ctx.out(), "choice("), t.alts), ")");
                } else if constexpr (std::is_same_v<T, type::group_map>) {
                    return fmt::format_to(ctx.out(), "map({})", t.items);
                } else if constexpr (std::is_same_v<T, type::group_array>) {
                    return fmt::format_to(ctx.out(), "array({})", t.items);
                } else if constexpr (std::is_same_v<T, type::unwrap>) {
                    return with_args(fmt::format_to(ctx.out(), "unwrap({}", t.name), t.args);
                } else if constexpr (std::is_same_v<T, type::group_enum>) {
                    return fmt::format_to(ctx.out(), "enum({})", t.items);
                } else if constexpr (std::is_same_v<T, type::group_name_enum>) {
                    return with_args(fmt::format_to(ctx.out(), "enum({}", t.name), t.args);
                } else if constexpr (std::is_same_v<T, type::tagged>) {
                    if (t.tag)
                        return fmt::format_to(ctx.out(), "tagged({}, {})", *t.tag, t.inner);
                    return fmt::format_to(ctx.out(), "tagged(*, {})", t.inner);
                } else if constexpr (std::is_same_v<T, type::major>) {
                    if (t.ai)
                        return fmt::format_to(ctx.out(), "major({}.{})", t.mt, *t.ai);
                    return fmt::format_to(ctx.out(), "major({})", t.mt);
                } else if constexpr (std::is_same_v<T, type::combined>) {
                    return fmt::format_to(ctx.out(), "combined({}, {}, {})", t.lhs, t.op, t.rhs);
                } else {
                    return fmt::format_to(ctx.out(), "any");
                }
            }, v.val);
        }
    };

    template<>
    struct formatter<tps::cddl::member_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::member_key;
            if (const auto *t = std::get_if<member_key::from_type>(&v.val); t)
                return fmt::format_to(ctx.out(), "{}{} =>", t->key, t->cut ? " ^" : "");
            return fmt::format_to(ctx.out(), "{}:", std::get<member_key::from_value>(v.val).key);
        }
    };

    template<>
    struct formatter<tps::cddl::group_item>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::group_item;
            if (const auto *k = std::get_if<group_item::key>(&v.val); k) {
                if (k->member)
                    return fmt::format_to(ctx.out(), "key({} {}, {})", *k->member, k->val, k->occ);
                return fmt::format_to(ctx.out(), "key({}, {})", k->val, k->occ);
            }
            if (const auto *n = std::get_if<group_item::name>(&v.val); n) {
                auto out_it = fmt::format_to(ctx.out(), "name({}", n->id);
                if (n->args)
                    out_it = fmt::format_to(tps::cddl::format_list(fmt::format_to(out_it, "<"), *n->args), ">");
                return fmt::format_to(out_it, ", {})", n->occ);
            }
            const auto &g = std::get<group_item::grp>(v.val);
            return fmt::format_to(ctx.out(), "grp({}, {})", g.items, g.occ);
        }
    };

    template<>
    struct formatter<tps::cddl::group>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.items);
        }
    };

    template<>
    struct formatter<tps::cddl::rule>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cddl::rule_kind;
            using tps::cddl::assignment;
            auto out_it = ctx.out();
            if (v.kind == rule_kind::type_def)
                out_it = fmt::format_to(out_it, "typedef({}", v.name);
            else
                out_it = fmt::format_to(out_it, "groupdef({}", v.name);
            if (v.params)
                out_it = fmt::format_to(tps::cddl::format_list(fmt::format_to(out_it, "<"), *v.params), ">");
            if (v.kind == rule_kind::type_def)
                return fmt::format_to(out_it, ", {}, {})", v.assign, v.def_type);
            return fmt::format_to(out_it, ", {}, {})", v.assign == assignment::assign ? "=" : "//=", v.def_group);
        }
    };
}

#endif // !TPS_CDDL_AST_HPP
