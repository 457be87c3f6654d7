/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <cstring>
#include <utfcpp/utf8.h>
#include "decoder.hpp"
#include "float16.hpp"

namespace tps::cbor {
    namespace {
        struct head {
            major_type type;
            uint8_t ai;
            uint64_t arg = 0;

            bool indefinite() const noexcept
            {
                return ai == ai_indefinite;
            }
        };

        head read_head(read_cursor &rc)
        {
            const auto pos = rc.position();
            const uint8_t ib = rc.take_byte();
            head h { static_cast<major_type>(ib >> 5), static_cast<uint8_t>(ib & 0x1F) };
            if (h.ai < 24) {
                h.arg = h.ai;
            } else if (h.ai <= 27) {
                for (const auto b: rc.take(size_t { 1 } << (h.ai - 24)))
                    h.arg = (h.arg << 8) | b;
            } else if (h.ai < ai_indefinite) [[unlikely]] {
                throw error(error_kind::malformed_encoding, fmt::format("reserved additional info {} at position {}", h.ai, pos));
            } else if (h.type == major_type::uint || h.type == major_type::nint || h.type == major_type::tag) [[unlikely]] {
                throw error(error_kind::malformed_encoding, fmt::format("{} cannot have an indefinite length at position {}", h.type, pos));
            }
            return h;
        }

        void check_depth(const size_t depth, const size_t pos)
        {
            if (depth > decoder::max_depth) [[unlikely]]
                throw error(error_kind::not_well_formed, fmt::format("nesting deeper than {} levels at position {}", decoder::max_depth, pos));
        }

        void check_utf8(const buffer text, const size_t pos)
        {
            if (const auto it = utf8::find_invalid(text.begin(), text.end()); it != text.end()) [[unlikely]]
                throw error(error_kind::invalid_utf8, fmt::format("invalid utf-8 byte at position {}", pos + (it - text.begin())));
        }

        bool at_break(const read_cursor &rc)
        {
            return rc.peek_byte() == break_byte;
        }

        // Calls observer for every chunk of an indefinite string and consumes the final break.
        template<typename T>
        void read_chunks(read_cursor &rc, const major_type type, const T &observer)
        {
            while (!at_break(rc)) {
                const auto pos = rc.position();
                const auto h = read_head(rc);
                if (h.type != type || h.indefinite()) [[unlikely]]
                    throw error(error_kind::malformed_encoding, fmt::format("a chunk of an indefinite {} must be a definite {} at position {}", type, type, pos));
                const auto data_pos = rc.position();
                const auto data = rc.take(h.arg);
                if (type == major_type::text)
                    check_utf8(data, data_pos);
                observer(data);
            }
            rc.take_byte();
        }

        item::value_type read_simple(const head &h, const size_t pos)
        {
            switch (h.ai) {
                case static_cast<uint8_t>(special_val::s_false): return false;
                case static_cast<uint8_t>(special_val::s_true): return true;
                case static_cast<uint8_t>(special_val::s_null): return null_value {};
                case static_cast<uint8_t>(special_val::s_undefined): return undefined_value {};
                case static_cast<uint8_t>(special_val::one_byte):
                    if (h.arg < 32) [[unlikely]]
                        throw error(error_kind::malformed_encoding, fmt::format("simple value {} must use the short form at position {}", h.arg, pos));
                    return simple_value { static_cast<uint8_t>(h.arg) };
                case static_cast<uint8_t>(special_val::two_bytes):
                    return float_value { float16::to_double(static_cast<uint16_t>(h.arg)), 2 };
                case static_cast<uint8_t>(special_val::four_bytes):
                    return float_value { static_cast<double>(std::bit_cast<float>(static_cast<uint32_t>(h.arg))), 4 };
                case static_cast<uint8_t>(special_val::eight_bytes):
                    return float_value { std::bit_cast<double>(h.arg), 8 };
                case static_cast<uint8_t>(special_val::s_break):
                    throw error(error_kind::unexpected_break, fmt::format("a break outside of an indefinite-length item at position {}", pos));
                default:
                    return simple_value { h.ai };
            }
        }

        void skip_item(read_cursor &rc, size_t depth);

        // Skips the children of a container and returns their count
        uint64_t skip_children(read_cursor &rc, const head &h, const uint64_t per_entry, const size_t depth)
        {
            if (!h.indefinite()) {
                for (uint64_t i = 0; i < h.arg; ++i) {
                    for (uint64_t j = 0; j < per_entry; ++j)
                        skip_item(rc, depth + 1);
                }
                return h.arg;
            }
            uint64_t num_items = 0;
            while (!at_break(rc)) {
                skip_item(rc, depth + 1);
                ++num_items;
            }
            if (num_items % per_entry != 0) [[unlikely]]
                throw error(error_kind::malformed_encoding, fmt::format("an indefinite map ending at position {} has a key without a value", rc.position()));
            return num_items / per_entry;
        }

        void skip_item(read_cursor &rc, const size_t depth)
        {
            const auto pos = rc.position();
            check_depth(depth, pos);
            const auto h = read_head(rc);
            switch (h.type) {
                case major_type::uint:
                case major_type::nint:
                    break;
                case major_type::bytes:
                case major_type::text:
                    if (h.indefinite()) {
                        read_chunks(rc, h.type, [](const buffer) {});
                    } else {
                        const auto data_pos = rc.position();
                        const auto data = rc.take(h.arg);
                        if (h.type == major_type::text)
                            check_utf8(data, data_pos);
                    }
                    break;
                case major_type::array:
                    skip_children(rc, h, 1, depth);
                    if (h.indefinite())
                        rc.take_byte();
                    break;
                case major_type::map:
                    skip_children(rc, h, 2, depth);
                    if (h.indefinite())
                        rc.take_byte();
                    break;
                case major_type::tag:
                    skip_item(rc, depth + 1);
                    break;
                case major_type::simple:
                    read_simple(h, pos);
                    break;
                default:
                    throw error(error_kind::not_well_formed, fmt::format("unsupported major type {} at position {}", static_cast<int>(h.type), pos));
            }
        }

        item read_item(read_cursor &rc, const size_t depth)
        {
            const auto start = rc.position();
            check_depth(depth, start);
            const auto h = read_head(rc);
            const auto raw = [&] { return rc.data().subbuf(start, rc.position() - start); };
            switch (h.type) {
                case major_type::uint:
                    return { uint_value { h.arg }, raw() };
                case major_type::nint:
                    return { nint_value { h.arg }, raw() };
                case major_type::bytes: {
                    if (!h.indefinite()) {
                        const auto data = rc.take(h.arg);
                        return { bytes_value { data }, raw() };
                    }
                    auto storage = std::make_shared<uint8_vector>();
                    read_chunks(rc, h.type, [&](const buffer chunk) { *storage << chunk; });
                    const buffer data { *storage };
                    return { bytes_value { data, std::move(storage), true }, raw() };
                }
                case major_type::text: {
                    if (!h.indefinite()) {
                        const auto data_pos = rc.position();
                        const auto data = rc.take(h.arg);
                        check_utf8(data, data_pos);
                        return { text_value { static_cast<std::string_view>(data) }, raw() };
                    }
                    auto storage = std::make_shared<std::string>();
                    read_chunks(rc, h.type, [&](const buffer chunk) { *storage += static_cast<std::string_view>(chunk); });
                    const std::string_view data { *storage };
                    return { text_value { data, std::move(storage), true }, raw() };
                }
                case major_type::array: {
                    const auto body_start = rc.position();
                    const auto size = skip_children(rc, h, 1, depth);
                    const auto body = rc.data().subbuf(body_start, rc.position() - body_start);
                    if (h.indefinite())
                        rc.take_byte();
                    return { array_view { body, size, h.indefinite() }, raw() };
                }
                case major_type::map: {
                    const auto body_start = rc.position();
                    const auto size = skip_children(rc, h, 2, depth);
                    const auto body = rc.data().subbuf(body_start, rc.position() - body_start);
                    if (h.indefinite())
                        rc.take_byte();
                    return { map_view { body, size, h.indefinite() }, raw() };
                }
                case major_type::tag: {
                    const auto body_start = rc.position();
                    skip_item(rc, depth + 1);
                    return { tag_view { h.arg, rc.data().subbuf(body_start, rc.position() - body_start) }, raw() };
                }
                case major_type::simple:
                    return { read_simple(h, start), raw() };
                default:
                    throw error(error_kind::not_well_formed, fmt::format("unsupported major type {} at position {}", static_cast<int>(h.type), start));
            }
        }
    }

    item decoder::next()
    {
        if (done())
            return { eof_value {} };
        read_cursor rc { _rc };
        auto res = read_item(rc, 0);
        _rc = rc;
        return res;
    }

    item decoder::peek() const
    {
        if (done())
            return { eof_value {} };
        read_cursor rc { _rc };
        return read_item(rc, 0);
    }

    void decoder::finish() const
    {
        if (!done()) [[unlikely]]
            throw error(error_kind::not_well_formed, fmt::format("{} bytes remain after the last item at position {}", _rc.remaining(), _rc.position()));
    }

    item parse(const buffer bytes)
    {
        decoder dec { bytes };
        if (dec.done()) [[unlikely]]
            throw error(error_kind::end_of_buffer, "cannot parse an item from an empty buffer");
        auto res = dec.next();
        dec.finish();
        return res;
    }
}
