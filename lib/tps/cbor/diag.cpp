/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <iterator>
#include <limits>
#include "decoder.hpp"
#include "diag.hpp"

namespace tps::cbor {
    namespace {
        template<typename OutIt>
        OutIt diag_float(OutIt out, const double v)
        {
            if (std::isnan(v))
                return fmt::format_to(out, "NaN");
            if (std::isinf(v))
                return fmt::format_to(out, "{}Infinity", v < 0 ? "-" : "");
            const auto s = fmt::format("{}", v);
            if (s.find_first_of(".e") == std::string::npos)
                return fmt::format_to(out, "{}.0", s);
            return fmt::format_to(out, "{}", s);
        }

        template<typename OutIt>
        OutIt diag_text(OutIt out, const std::string_view s)
        {
            *out++ = '"';
            for (const char c: s) {
                switch (c) {
                    case '"': out = fmt::format_to(out, "\\\""); break;
                    case '\\': out = fmt::format_to(out, "\\\\"); break;
                    case '\n': out = fmt::format_to(out, "\\n"); break;
                    case '\r': out = fmt::format_to(out, "\\r"); break;
                    case '\t': out = fmt::format_to(out, "\\t"); break;
                    default:
                        if (static_cast<uint8_t>(c) < 0x20)
                            out = fmt::format_to(out, "\\u{:04x}", static_cast<int>(c));
                        else
                            *out++ = c;
                }
            }
            *out++ = '"';
            return out;
        }

        template<typename OutIt>
        OutIt diag_item(OutIt out, const item &it)
        {
            switch (it.kind()) {
                case item_kind::uint:
                    return fmt::format_to(out, "{}", it.uint());
                case item_kind::nint:
                    if (it.nint() == std::numeric_limits<uint64_t>::max())
                        return fmt::format_to(out, "-18446744073709551616");
                    return fmt::format_to(out, "-{}", it.nint() + 1);
                case item_kind::bytes: {
                    const auto &b = std::get<bytes_value>(it.value());
                    out = fmt::format_to(out, "{}h'", b.indefinite ? "_ " : "");
                    for (const auto byte: b.data)
                        out = fmt::format_to(out, "{:02x}", byte);
                    return fmt::format_to(out, "'");
                }
                case item_kind::text: {
                    const auto &t = std::get<text_value>(it.value());
                    if (t.indefinite)
                        out = fmt::format_to(out, "_ ");
                    return diag_text(out, t.data);
                }
                case item_kind::array: {
                    const auto &a = it.array();
                    out = fmt::format_to(out, "[{}", a.indefinite ? "_ " : "");
                    bool first = true;
                    for (const auto &child: a.items()) {
                        if (!first)
                            out = fmt::format_to(out, ", ");
                        first = false;
                        out = diag_item(out, child);
                    }
                    return fmt::format_to(out, "]");
                }
                case item_kind::map: {
                    const auto &m = it.map();
                    out = fmt::format_to(out, "{{{}", m.indefinite ? "_ " : "");
                    auto dec = m.items();
                    for (uint64_t i = 0; i < m.size; ++i) {
                        if (i > 0)
                            out = fmt::format_to(out, ", ");
                        out = diag_item(out, dec.next());
                        out = fmt::format_to(out, ": ");
                        out = diag_item(out, dec.next());
                    }
                    return fmt::format_to(out, "}}");
                }
                case item_kind::tag: {
                    const auto &t = it.tag();
                    out = fmt::format_to(out, "{}(", t.id);
                    out = diag_item(out, t.value());
                    return fmt::format_to(out, ")");
                }
                case item_kind::simple:
                    return fmt::format_to(out, "simple({})", it.simple());
                case item_kind::boolean:
                    return fmt::format_to(out, "{}", it.boolean() ? "true" : "false");
                case item_kind::null:
                    return fmt::format_to(out, "null");
                case item_kind::undefined:
                    return fmt::format_to(out, "undefined");
                case item_kind::floating:
                    return diag_float(out, it.float64());
                case item_kind::eof:
                    return fmt::format_to(out, "eof");
                default:
                    throw error(error_kind::not_well_formed, fmt::format("unsupported item kind: {}", it.kind()));
            }
        }
    }

    std::string diag(const item &it)
    {
        std::string res {};
        diag_item(std::back_inserter(res), it);
        return res;
    }
}
