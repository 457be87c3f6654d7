/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/logger.hpp>
#include "ir.hpp"

namespace tps::cddl::ir {
    // a choice definition contributes its branches so that extensions append to them
    static type_list alternatives_of(type_ptr def)
    {
        if (const auto *c = def->get_if<cddl::type::choice>(); c)
            return c->alts;
        return { std::move(def) };
    }

    type_ptr entry::type() const
    {
        if (alternatives.empty())
            throw tps::error("an ir entry without alternatives");
        if (alternatives.size() == 1)
            return alternatives.front();
        const auto &first = alternatives.front()->span;
        const auto &last = alternatives.back()->span;
        // spans of alternatives from different files are not merged
        source_span span = first;
        if (first.file == last.file && last.end > span.end)
            span.end = last.end;
        return make_type(cddl::type::choice { alternatives }, std::move(span));
    }

    void store::try_insert(const std::string_view name, type_ptr def)
    {
        if (contains(name))
            throw error::duplicate_rule(name);
        _entries.emplace(name, entry { alternatives_of(std::move(def)) });
    }

    void store::update(const std::string_view name, type_ptr def)
    {
        if (const auto it = _entries.find(name); it != _entries.end()) {
            it->second.alternatives.emplace_back(std::move(def));
            return;
        }
        _entries.emplace(name, entry { alternatives_of(std::move(def)) });
    }

    const entry &store::at(const std::string_view name) const
    {
        if (const auto it = _entries.find(name); it != _entries.end())
            return it->second;
        throw error::unknown_rule(name);
    }

    store pass1(const rule_list &rules)
    {
        store st {};
        for (const auto &r: rules) {
            if (r.kind != rule_kind::type_def || r.params) {
                logger::trace("pass 1 skips {} {}", r.kind == rule_kind::type_def ? "generic rule" : "group rule", r.name);
                continue;
            }
            switch (r.assign) {
                case assignment::assign:
                    logger::trace("pass 1 defines {}", r.name);
                    st.try_insert(r.name, r.def_type);
                    break;
                case assignment::assign_extend:
                    logger::trace("pass 1 extends {}", r.name);
                    st.update(r.name, r.def_type);
                    break;
                default:
                    throw tps::error(fmt::format("unsupported assignment type: {}", static_cast<int>(r.assign)));
            }
        }
        logger::debug("pass 1 collected {} type definitions from {} rules", st.size(), rules.size());
        return st;
    }
}
