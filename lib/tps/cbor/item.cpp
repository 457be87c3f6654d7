/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include "decoder.hpp"

namespace tps::cbor {
    major_type item::type() const
    {
        switch (kind()) {
            case item_kind::uint: return major_type::uint;
            case item_kind::nint: return major_type::nint;
            case item_kind::bytes: return major_type::bytes;
            case item_kind::text: return major_type::text;
            case item_kind::array: return major_type::array;
            case item_kind::map: return major_type::map;
            case item_kind::tag: return major_type::tag;
            case item_kind::eof:
                throw error::expected("an item", "eof");
            default:
                return major_type::simple;
        }
    }

    bool item::operator==(const item &o) const
    {
        if (kind() != o.kind())
            return false;
        return std::visit([&o](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            const auto &ov = std::get<T>(o._val);
            if constexpr (std::is_same_v<T, uint_value>) {
                return v.val == ov.val;
            } else if constexpr (std::is_same_v<T, nint_value>) {
                return v.arg == ov.arg;
            } else if constexpr (std::is_same_v<T, bytes_value> || std::is_same_v<T, text_value>) {
                return v.data == ov.data && v.indefinite == ov.indefinite;
            } else if constexpr (std::is_same_v<T, array_view> || std::is_same_v<T, map_view>) {
                return v.size == ov.size && v.indefinite == ov.indefinite && v.body == ov.body;
            } else if constexpr (std::is_same_v<T, tag_view>) {
                return v.id == ov.id && v.body == ov.body;
            } else if constexpr (std::is_same_v<T, simple_value>) {
                return v.val == ov.val;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v == ov;
            } else if constexpr (std::is_same_v<T, float_value>) {
                if (std::isnan(v.val) && std::isnan(ov.val))
                    return true;
                return v.val == ov.val;
            } else {
                return true;
            }
        }, _val);
    }

    decoder array_view::items() const
    {
        return decoder { body };
    }

    std::optional<item> array_view::at(const uint64_t idx) const
    {
        if (idx >= size)
            return {};
        auto dec = items();
        for (uint64_t i = 0; i < idx; ++i)
            dec.next();
        return dec.next();
    }

    decoder map_view::items() const
    {
        return decoder { body };
    }

    std::optional<std::pair<item, item>> map_view::get_key_value(const item &key) const
    {
        auto dec = items();
        for (uint64_t i = 0; i < size; ++i) {
            auto k = dec.next();
            auto v = dec.next();
            if (k == key)
                return std::make_pair(std::move(k), std::move(v));
        }
        return {};
    }

    std::optional<std::pair<item, item>> map_view::get_key_value(const int64_t key) const
    {
        auto dec = items();
        for (uint64_t i = 0; i < size; ++i) {
            auto k = dec.next();
            auto v = dec.next();
            const bool match = key >= 0
                ? k.kind() == item_kind::uint && k.uint() == static_cast<uint64_t>(key)
                : k.kind() == item_kind::nint && k.nint() == static_cast<uint64_t>(-1 - key);
            if (match)
                return std::make_pair(std::move(k), std::move(v));
        }
        return {};
    }

    std::optional<std::pair<item, item>> map_view::get_key_value(const std::string_view key) const
    {
        auto dec = items();
        for (uint64_t i = 0; i < size; ++i) {
            auto k = dec.next();
            auto v = dec.next();
            if (k.kind() == item_kind::text && k.text() == key)
                return std::make_pair(std::move(k), std::move(v));
        }
        return {};
    }

    std::optional<item> map_view::get(const item &key) const
    {
        if (auto kv = get_key_value(key); kv)
            return std::move(kv->second);
        return {};
    }

    std::optional<item> map_view::get(const int64_t key) const
    {
        if (auto kv = get_key_value(key); kv)
            return std::move(kv->second);
        return {};
    }

    std::optional<item> map_view::get(const std::string_view key) const
    {
        if (auto kv = get_key_value(key); kv)
            return std::move(kv->second);
        return {};
    }

    bool map_view::contains(const item &key) const
    {
        return get_key_value(key).has_value();
    }

    item tag_view::value() const
    {
        return parse(body);
    }

    decoder tag_view::items() const
    {
        return decoder { body };
    }
}
