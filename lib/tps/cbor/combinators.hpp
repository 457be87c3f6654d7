/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_COMBINATORS_HPP
#define TPS_CBOR_COMBINATORS_HPP

#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include "decoder.hpp"

namespace tps::cbor {
    // A parser is any callable taking decoder & and returning a value.
    // Type mismatches throw an error of kind error_kind::expected and leave the position unchanged.
    template<typename P>
    using parser_result_t = std::invoke_result_t<P, decoder &>;

    template<typename F>
    item expect_item(decoder &dec, const std::string_view what, const F &pred)
    {
        const auto start = dec.position();
        auto it = dec.next();
        if (!pred(it)) [[unlikely]] {
            dec.seek(start);
            throw error::expected(what, fmt::format("{}", it.kind()));
        }
        return it;
    }

    inline item expect_kind(decoder &dec, const item_kind kind)
    {
        return expect_item(dec, fmt::format("{}", kind), [kind](const item &it) { return it.kind() == kind; });
    }

    inline item is_any(decoder &dec)
    {
        return expect_item(dec, "any item", [](const item &it) { return !it.is_eof(); });
    }

    inline uint64_t is_uint(decoder &dec)
    {
        return expect_kind(dec, item_kind::uint).uint();
    }

    // returns the raw argument: the value is -1 - arg
    inline uint64_t is_nint(decoder &dec)
    {
        return expect_kind(dec, item_kind::nint).nint();
    }

    // accepts uint or nint fitting into int64_t
    inline int64_t is_int(decoder &dec)
    {
        const auto start = dec.position();
        auto it = expect_item(dec, "int", [](const item &v) { return v.kind() == item_kind::uint || v.kind() == item_kind::nint; });
        try {
            return it.to<int64_t>();
        } catch (const error &) {
            dec.seek(start);
            throw;
        }
    }

    inline buffer is_bstr(decoder &dec)
    {
        return expect_kind(dec, item_kind::bytes).bytes();
    }

    inline std::string_view is_tstr(decoder &dec)
    {
        return expect_kind(dec, item_kind::text).text();
    }

    inline array_view is_array(decoder &dec)
    {
        return expect_kind(dec, item_kind::array).array();
    }

    inline map_view is_map(decoder &dec)
    {
        return expect_kind(dec, item_kind::map).map();
    }

    inline tag_view is_tag(decoder &dec)
    {
        return expect_kind(dec, item_kind::tag).tag();
    }

    inline auto is_tag(const uint64_t id)
    {
        return [id](decoder &dec) {
            return expect_item(dec, fmt::format("tag {}", id), [id](const item &it) {
                return it.kind() == item_kind::tag && it.tag().id == id;
            }).tag();
        };
    }

    // tag 1 over an integer
    inline int64_t is_epoch(decoder &dec)
    {
        const auto start = dec.position();
        const auto t = is_tag(static_cast<uint64_t>(tag_id::epoch))(dec);
        try {
            auto sub = t.items();
            return is_int(sub);
        } catch (const error &) {
            dec.seek(start);
            throw;
        }
    }

    // tag 0 over a text string
    inline std::string_view is_date_time(decoder &dec)
    {
        const auto start = dec.position();
        const auto t = is_tag(static_cast<uint64_t>(tag_id::date_time))(dec);
        try {
            auto sub = t.items();
            return is_tstr(sub);
        } catch (const error &) {
            dec.seek(start);
            throw;
        }
    }

    inline bool is_bool(decoder &dec)
    {
        return expect_kind(dec, item_kind::boolean).boolean();
    }

    inline bool is_true(decoder &dec)
    {
        return expect_item(dec, "true", [](const item &it) { return it.kind() == item_kind::boolean && it.boolean(); }).boolean();
    }

    inline bool is_false(decoder &dec)
    {
        return expect_item(dec, "false", [](const item &it) { return it.kind() == item_kind::boolean && !it.boolean(); }).boolean();
    }

    inline null_value is_null(decoder &dec)
    {
        expect_kind(dec, item_kind::null);
        return {};
    }

    inline undefined_value is_undefined(decoder &dec)
    {
        expect_kind(dec, item_kind::undefined);
        return {};
    }

    inline uint8_t is_simple(decoder &dec)
    {
        return expect_kind(dec, item_kind::simple).simple();
    }

    inline double is_float(decoder &dec)
    {
        return expect_kind(dec, item_kind::floating).float64();
    }

    // succeeds only when all bytes are consumed
    inline eof_value is_eof(decoder &dec)
    {
        if (!dec.done()) [[unlikely]]
            throw error::expected("eof", fmt::format("{}", dec.peek().kind()));
        return {};
    }

    // Converts a mismatch into std::nullopt. Any other failure propagates.
    template<typename P>
    auto opt(P p)
    {
        return [p = std::move(p)](decoder &dec) -> std::optional<parser_result_t<P>> {
            const auto start = dec.position();
            try {
                return p(dec);
            } catch (const error &ex) {
                if (!is_mismatch(ex))
                    throw;
                dec.seek(start);
                return {};
            }
        };
    }

    // runs p only when enabled
    template<typename P>
    auto cond(const bool enabled, P p)
    {
        return [enabled, p = std::move(p)](decoder &dec) -> std::optional<parser_result_t<P>> {
            if (!enabled)
                return {};
            return p(dec);
        };
    }

    // passes the value of p to the observer f and returns it unchanged
    template<typename P, typename F>
    auto apply(P p, F f)
    {
        return [p = std::move(p), f = std::move(f)](decoder &dec) {
            auto res = p(dec);
            f(std::as_const(res));
            return res;
        };
    }

    // Tries p1 and then p2 from the same position. Both must produce the same type.
    template<typename P1, typename P2>
    auto either(P1 p1, P2 p2)
    {
        static_assert(std::is_same_v<parser_result_t<P1>, parser_result_t<P2>>);
        return [p1 = std::move(p1), p2 = std::move(p2)](decoder &dec) -> parser_result_t<P1> {
            if (auto res = opt(p1)(dec); res)
                return std::move(*res);
            return p2(dec);
        };
    }

    template<typename P, typename F>
    auto with_pred(P p, F pred, std::string what="a value satisfying the predicate")
    {
        return [p = std::move(p), pred = std::move(pred), what = std::move(what)](decoder &dec) {
            const auto start = dec.position();
            auto res = p(dec);
            if (!pred(res)) [[unlikely]] {
                dec.seek(start);
                throw error::expected(what, "a value failing the predicate");
            }
            return res;
        };
    }

    template<typename P, typename V>
    auto with_value(P p, V expected)
    {
        return [p = std::move(p), expected = std::move(expected)](decoder &dec) {
            const auto start = dec.position();
            auto res = p(dec);
            if (!(res == expected)) [[unlikely]] {
                dec.seek(start);
                throw error::expected(fmt::format("{}", expected), fmt::format("{}", res));
            }
            return res;
        };
    }

    // Applies p until it reports a mismatch or stops advancing the position.
    template<typename P>
    auto many(P p)
    {
        return [p = std::move(p)](decoder &dec) {
            std::vector<parser_result_t<P>> res {};
            for (;;) {
                const auto start = dec.position();
                auto val = opt(p)(dec);
                if (!val)
                    break;
                res.emplace_back(std::move(*val));
                if (dec.position() == start)
                    break;
            }
            return res;
        };
    }

    // Applies p between min_items and max_items times.
    // When fewer than min_items match the position is restored and an expected error is thrown.
    template<typename P>
    auto range(const size_t min_items, const size_t max_items, P p)
    {
        return [min_items, max_items, p = std::move(p)](decoder &dec) {
            const auto start = dec.position();
            std::vector<parser_result_t<P>> res {};
            while (res.size() < max_items) {
                const auto pos = dec.position();
                auto val = opt(p)(dec);
                if (!val)
                    break;
                res.emplace_back(std::move(*val));
                if (dec.position() == pos)
                    break;
            }
            if (res.size() < min_items) [[unlikely]] {
                dec.seek(start);
                throw error::expected(fmt::format("at least {} items", min_items), fmt::format("{} items", res.size()));
            }
            return res;
        };
    }
}

#endif // !TPS_CBOR_COMBINATORS_HPP
