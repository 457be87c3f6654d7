/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_ENCODER_HPP
#define TPS_CBOR_ENCODER_HPP

#include <array>
#include <bit>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include "cursor.hpp"
#include "float16.hpp"
#include "item.hpp"

namespace tps::cbor {
    // Writes the preferred serialization of items into a caller-supplied region.
    // Every primitive either writes completely or throws and leaves the cursor unchanged.
    // Containers are always emitted with a definite length computed after their closure returns.
    struct encoder {
        explicit encoder(const write_buffer bytes):
            _own { bytes }, _cur { _own }
        {
        }

        encoder(const encoder &) =delete;
        encoder &operator=(const encoder &) =delete;

        encoder &uint(const uint64_t val)
        {
            _put(_head(major_type::uint, val));
            return *this;
        }

        // the negative value must be already converted to the -1 - v representation
        encoder &nint(const uint64_t arg)
        {
            _put(_head(major_type::nint, arg));
            return *this;
        }

        encoder &integer(const int64_t val)
        {
            if (val >= 0)
                return uint(static_cast<uint64_t>(val));
            return nint(static_cast<uint64_t>(-1 - val));
        }

        encoder &bytes(const buffer data)
        {
            _put(_head(major_type::bytes, data.size()), data);
            return *this;
        }

        encoder &text(const std::string_view data)
        {
            _put(_head(major_type::text, data.size()), buffer { data });
            return *this;
        }

        // copies an already encoded item
        encoder &raw_cbor(const buffer data)
        {
            _put({}, data);
            return *this;
        }

        encoder &boolean(const bool val)
        {
            return val ? s_true() : s_false();
        }

        encoder &s_true()
        {
            _put(_short(major_type::simple, static_cast<uint8_t>(special_val::s_true)));
            return *this;
        }

        encoder &s_false()
        {
            _put(_short(major_type::simple, static_cast<uint8_t>(special_val::s_false)));
            return *this;
        }

        encoder &s_null()
        {
            _put(_short(major_type::simple, static_cast<uint8_t>(special_val::s_null)));
            return *this;
        }

        encoder &s_undefined()
        {
            _put(_short(major_type::simple, static_cast<uint8_t>(special_val::s_undefined)));
            return *this;
        }

        encoder &simple(const uint8_t val)
        {
            if (val >= 20 && val < 32) [[unlikely]]
                throw error(error_kind::malformed_encoding, fmt::format("simple value {} is reserved or has a dedicated encoder", val));
            _put(_head(major_type::simple, val));
            return *this;
        }

        encoder &float64(const double val)
        {
            if (std::isnan(val)) {
                _put(_fixed(special_val::two_bytes, 0x7E00, 2));
            } else if (const auto half = float16::from_double(val); half) {
                _put(_fixed(special_val::two_bytes, *half, 2));
            } else if (std::fabs(val) <= std::numeric_limits<float>::max() && static_cast<double>(static_cast<float>(val)) == val) {
                _put(_fixed(special_val::four_bytes, std::bit_cast<uint32_t>(static_cast<float>(val)), 4));
            } else {
                _put(_fixed(special_val::eight_bytes, std::bit_cast<uint64_t>(val), 8));
            }
            return *this;
        }

        // prefixes the next item; the pair counts as one item of the enclosing container
        encoder &tag(const uint64_t id)
        {
            _cur.write(_head(major_type::tag, id).bytes());
            if (!_tag_pending) {
                ++_items;
                _tag_pending = true;
            }
            return *this;
        }

        encoder &date_time(const std::string_view val)
        {
            return _tagged(tag_id::date_time, [&] { text(val); });
        }

        encoder &epoch(const int64_t val)
        {
            return _tagged(tag_id::epoch, [&] { integer(val); });
        }

        template<typename F>
        encoder &array(const F &fill)
        {
            _container(major_type::array, fill);
            return *this;
        }

        // the closure must write keys and values alternately
        template<typename F>
        encoder &map(const F &fill)
        {
            _container(major_type::map, fill);
            return *this;
        }

        template<typename K, typename V>
        encoder &insert_key_value(const K &key, const V &val)
        {
            const auto start = _cur.position();
            const auto items = _items;
            try {
                insert(key);
                insert(val);
            } catch (...) {
                _cur.rewind(start);
                _items = items;
                throw;
            }
            return *this;
        }

        template<typename T>
        encoder &insert(const T &val)
        {
            if constexpr (std::is_same_v<T, bool>) {
                return boolean(val);
            } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
                return uint(val);
            } else if constexpr (std::is_integral_v<T>) {
                return integer(val);
            } else if constexpr (std::is_floating_point_v<T>) {
                return float64(val);
            } else if constexpr (std::is_same_v<T, buffer> || std::is_same_v<T, uint8_vector>) {
                return bytes(val);
            } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
                return text(val);
            } else if constexpr (std::is_same_v<T, null_value>) {
                return s_null();
            } else if constexpr (std::is_same_v<T, undefined_value>) {
                return s_undefined();
            } else if constexpr (std::is_same_v<T, item>) {
                return raw_cbor(val.raw());
            } else {
                static_assert(sizeof(T) == 0, "unsupported item type");
            }
        }

        buffer encoded() const noexcept
        {
            return _cur.written();
        }

        // the number of top-level items written so far
        size_t count() const noexcept
        {
            return _items;
        }
    private:
        struct head {
            std::array<uint8_t, 9> data {};
            size_t size = 0;

            buffer bytes() const noexcept
            {
                return { data.data(), size };
            }
        };

        write_cursor _own {};
        write_cursor &_cur;
        size_t _items = 0;
        bool _tag_pending = false;

        explicit encoder(write_cursor &cur):
            _cur { cur }
        {
        }

        static head _short(const major_type type, const uint8_t ai)
        {
            head h {};
            h.data[h.size++] = initial_byte(type, ai);
            return h;
        }

        static head _fixed(const special_val ai, const uint64_t val, const size_t num_bytes)
        {
            return _widen(major_type::simple, ai, val, num_bytes);
        }

        // the shortest head for the argument
        static head _head(const major_type type, const uint64_t val)
        {
            if (val < 24)
                return _short(type, static_cast<uint8_t>(val));
            if (val <= std::numeric_limits<uint8_t>::max()) {
                auto h = _short(type, static_cast<uint8_t>(special_val::one_byte));
                h.data[h.size++] = static_cast<uint8_t>(val);
                return h;
            }
            if (val <= std::numeric_limits<uint16_t>::max())
                return _widen(type, special_val::two_bytes, val, 2);
            if (val <= std::numeric_limits<uint32_t>::max())
                return _widen(type, special_val::four_bytes, val, 4);
            return _widen(type, special_val::eight_bytes, val, 8);
        }

        static head _widen(const major_type type, const special_val ai, const uint64_t val, const size_t num_bytes)
        {
            auto h = _short(type, static_cast<uint8_t>(ai));
            for (size_t i = num_bytes; i > 0; --i)
                h.data[h.size++] = static_cast<uint8_t>(val >> ((i - 1) * 8));
            return h;
        }

        void _count_item() noexcept
        {
            if (_tag_pending)
                _tag_pending = false;
            else
                ++_items;
        }

        void _put(const head &h, const buffer payload={})
        {
            if (h.size + payload.size() > _cur.remaining()) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("an item of {} bytes does not fit into the remaining {} bytes",
                    h.size + payload.size(), _cur.remaining()));
            _cur.write(h.bytes());
            _cur.write(payload);
            _count_item();
        }

        template<typename F>
        encoder &_tagged(const tag_id id, const F &write_item)
        {
            const auto start = _cur.position();
            const auto items = _items;
            const auto tag_pending = _tag_pending;
            try {
                tag(static_cast<uint64_t>(id));
                write_item();
            } catch (...) {
                _cur.rewind(start);
                _items = items;
                _tag_pending = tag_pending;
                throw;
            }
            return *this;
        }

        template<typename F>
        void _container(const major_type type, const F &fill)
        {
            const auto start = _cur.position();
            _cur.write(initial_byte(type, 0));
            try {
                encoder nested { _cur };
                fill(nested);
                if (nested._tag_pending) [[unlikely]]
                    throw error(error_kind::malformed_encoding, fmt::format("a tag at the end of {} has no item", type));
                uint64_t size = nested._items;
                if (type == major_type::map) {
                    if (size % 2 != 0) [[unlikely]]
                        throw error(error_kind::malformed_encoding, fmt::format("a map closure wrote an odd number of items: {}", size));
                    size /= 2;
                }
                const auto h = _head(type, size);
                if (h.size > 1)
                    _cur.insert_gap(start + 1, h.size - 1);
                _cur.overwrite(start, h.bytes());
            } catch (...) {
                _cur.rewind(start);
                throw;
            }
            _count_item();
        }
    };
}

#endif // !TPS_CBOR_ENCODER_HPP
