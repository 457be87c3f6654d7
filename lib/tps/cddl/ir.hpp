/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CDDL_IR_HPP
#define TPS_CDDL_IR_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include "ast.hpp"

namespace tps::cddl::ir {
    // The definition of one type name: the branches of the first definition followed by every "/=" extension.
    struct entry {
        type_list alternatives {};

        bool is_choice() const noexcept
        {
            return alternatives.size() > 1;
        }

        // the single alternative or a choice over all of them
        type_ptr type() const;
    };

    struct store {
        using map_type = std::map<std::string, entry, std::less<>>;
        using const_iterator = map_type::const_iterator;

        // throws duplicate_rule when the name is already defined
        void try_insert(std::string_view name, type_ptr def);
        // adds an alternative to an existing entry or creates a new one
        void update(std::string_view name, type_ptr def);

        bool contains(const std::string_view name) const
        {
            return _entries.find(name) != _entries.end();
        }

        // throws unknown_rule when the name is not defined
        const entry &at(std::string_view name) const;

        size_t size() const noexcept
        {
            return _entries.size();
        }

        const_iterator begin() const noexcept
        {
            return _entries.begin();
        }

        const_iterator end() const noexcept
        {
            return _entries.end();
        }
    private:
        map_type _entries {};
    };

    // Collects "=" and "/=" type definitions without generic parameters.
    // Group definitions and generic rules are left to later passes.
    extern store pass1(const rule_list &rules);
}

namespace fmt {
    template<>
    struct formatter<tps::cddl::ir::entry>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.type());
        }
    };

    template<>
    struct formatter<tps::cddl::ir::store>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const auto &[name, e]: v)
                out_it = fmt::format_to(out_it, "{} => {}\n", name, e);
            return out_it;
        }
    };
}

#endif // !TPS_CDDL_IR_HPP
