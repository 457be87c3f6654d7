/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_ITEM_HPP
#define TPS_CBOR_ITEM_HPP

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <tps/common/bytes.hpp>
#include "error.hpp"
#include "types.hpp"

namespace tps::cbor {
    struct decoder;
    struct item;

    // The order of the values matches the alternatives of item::value_type
    enum class item_kind: uint8_t {
        uint, nint, bytes, text, array, map, tag, simple, boolean, null, undefined, floating, eof
    };
}

namespace fmt {
    template<>
    struct formatter<tps::cbor::item_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cbor::item_kind;
            switch (v) {
                case item_kind::uint: return fmt::format_to(ctx.out(), "uint");
                case item_kind::nint: return fmt::format_to(ctx.out(), "nint");
                case item_kind::bytes: return fmt::format_to(ctx.out(), "bstr");
                case item_kind::text: return fmt::format_to(ctx.out(), "tstr");
                case item_kind::array: return fmt::format_to(ctx.out(), "array");
                case item_kind::map: return fmt::format_to(ctx.out(), "map");
                case item_kind::tag: return fmt::format_to(ctx.out(), "tag");
                case item_kind::simple: return fmt::format_to(ctx.out(), "simple");
                case item_kind::boolean: return fmt::format_to(ctx.out(), "bool");
                case item_kind::null: return fmt::format_to(ctx.out(), "null");
                case item_kind::undefined: return fmt::format_to(ctx.out(), "undefined");
                case item_kind::floating: return fmt::format_to(ctx.out(), "float");
                case item_kind::eof: return fmt::format_to(ctx.out(), "eof");
                default: return fmt::format_to(ctx.out(), "item_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace tps::cbor {
    struct uint_value {
        uint64_t val = 0;
    };

    // represents the integer -1 - arg
    struct nint_value {
        uint64_t arg = 0;
    };

    // Definite strings borrow the source bytes.
    // Chunked strings are joined into the shared storage.
    struct bytes_value {
        buffer data {};
        std::shared_ptr<const uint8_vector> storage {};
        bool indefinite = false;
    };

    struct text_value {
        std::string_view data {};
        std::shared_ptr<const std::string> storage {};
        bool indefinite = false;
    };

    // The body spans the encoded children without the head and without the final break.
    struct array_view {
        buffer body {};
        uint64_t size = 0;
        bool indefinite = false;

        std::optional<uint64_t> declared_size() const noexcept
        {
            if (indefinite)
                return {};
            return size;
        }

        decoder items() const;
        std::optional<item> at(uint64_t idx) const;
    };

    struct map_view {
        buffer body {};
        // the number of key/value pairs
        uint64_t size = 0;
        bool indefinite = false;

        std::optional<uint64_t> declared_size() const noexcept
        {
            if (indefinite)
                return {};
            return size;
        }

        decoder items() const;
        std::optional<std::pair<item, item>> get_key_value(const item &key) const;
        std::optional<std::pair<item, item>> get_key_value(int64_t key) const;
        std::optional<std::pair<item, item>> get_key_value(std::string_view key) const;
        std::optional<item> get(const item &key) const;
        std::optional<item> get(int64_t key) const;
        std::optional<item> get(std::string_view key) const;
        bool contains(const item &key) const;

        // converts the value at key and fails with an expected error when the key is absent
        template<typename T, typename K>
        T lookup(const K &key) const;
    };

    struct tag_view {
        uint64_t id = 0;
        buffer body {};

        // decodes the tagged item on demand
        item value() const;
        decoder items() const;
    };

    struct simple_value {
        uint8_t val = 0;
    };

    struct null_value {
    };

    struct undefined_value {
    };

    struct float_value {
        double val = 0.0;
        // the number of bytes in the encoded form: 2, 4, or 8
        uint8_t width = 8;
    };

    struct eof_value {
    };

    struct item {
        using value_type = std::variant<uint_value, nint_value, bytes_value, text_value, array_view, map_view, tag_view,
            simple_value, bool, null_value, undefined_value, float_value, eof_value>;

        item(value_type &&val, const buffer raw={}):
            _val { std::move(val) }, _raw { raw }
        {
        }

        item_kind kind() const noexcept
        {
            return static_cast<item_kind>(_val.index());
        }

        bool is_eof() const noexcept
        {
            return std::holds_alternative<eof_value>(_val);
        }

        major_type type() const;

        // the bytes of the whole encoded item
        buffer raw() const noexcept
        {
            return _raw;
        }

        const value_type &value() const noexcept
        {
            return _val;
        }

        uint64_t uint() const
        {
            return _get<uint_value>().val;
        }

        // the raw argument: the represented value is -1 - nint()
        uint64_t nint() const
        {
            return _get<nint_value>().arg;
        }

        buffer bytes() const
        {
            return _get<bytes_value>().data;
        }

        std::string_view text() const
        {
            return _get<text_value>().data;
        }

        const array_view &array() const
        {
            return _get<array_view>();
        }

        const map_view &map() const
        {
            return _get<map_view>();
        }

        const tag_view &tag() const
        {
            return _get<tag_view>();
        }

        uint8_t simple() const
        {
            return _get<simple_value>().val;
        }

        bool boolean() const
        {
            return _get<bool>();
        }

        double float64() const
        {
            return _get<float_value>().val;
        }

        template<typename T>
        T to() const
        {
            if constexpr (std::is_same_v<T, bool>) {
                return boolean();
            } else if constexpr (std::is_integral_v<T>) {
                if (const auto *u = std::get_if<uint_value>(&_val); u) {
                    if (u->val > static_cast<uint64_t>(std::numeric_limits<T>::max())) [[unlikely]]
                        throw error(error_kind::out_of_range, fmt::format("{} does not fit into a {}-byte {} integer",
                            u->val, sizeof(T), std::is_signed_v<T> ? "signed" : "unsigned"));
                    return static_cast<T>(u->val);
                }
                if (const auto *n = std::get_if<nint_value>(&_val); n) {
                    if constexpr (std::is_unsigned_v<T>) {
                        throw error(error_kind::out_of_range, fmt::format("-1 - {} does not fit into an unsigned integer", n->arg));
                    } else {
                        if (n->arg > static_cast<uint64_t>(std::numeric_limits<T>::max())) [[unlikely]]
                            throw error(error_kind::out_of_range, fmt::format("-1 - {} does not fit into a {}-byte signed integer", n->arg, sizeof(T)));
                        return static_cast<T>(-1 - static_cast<int64_t>(n->arg));
                    }
                }
                throw error::expected("int", fmt::format("{}", kind()));
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(float64());
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return text();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return std::string { text() };
            } else if constexpr (std::is_same_v<T, buffer>) {
                return bytes();
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                return uint8_vector { bytes() };
            } else if constexpr (std::is_same_v<T, item>) {
                return *this;
            } else {
                static_assert(sizeof(T) == 0, "unsupported conversion target");
            }
        }

        bool operator==(const item &o) const;
    private:
        value_type _val;
        buffer _raw {};

        template<typename T>
        const T &_get() const
        {
            if (const auto *v = std::get_if<T>(&_val); v) [[likely]]
                return *v;
            throw error::expected(fmt::format("{}", static_cast<item_kind>(value_type { std::in_place_type<T> }.index())), fmt::format("{}", kind()));
        }
    };

    template<typename T, typename K>
    T map_view::lookup(const K &key) const
    {
        if (const auto val = get(key); val)
            return val->template to<T>();
        if constexpr (std::is_same_v<K, item>)
            throw error::expected("a present map key", "no such key");
        else
            throw error::expected(fmt::format("a map key {}", key), "no such key");
    }
}

#endif // !TPS_CBOR_ITEM_HPP
