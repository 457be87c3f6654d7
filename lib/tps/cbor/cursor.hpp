/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_CURSOR_HPP
#define TPS_CBOR_CURSOR_HPP

#include <cstring>
#include <tps/common/bytes.hpp>
#include "error.hpp"

namespace tps::cbor {
    // A bounded read position over caller-owned bytes. Never allocates.
    struct read_cursor {
        read_cursor() =default;

        explicit read_cursor(const buffer bytes, const size_t pos=0):
            _bytes { bytes }, _pos { pos }
        {
            if (_pos > _bytes.size()) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("position {} is beyond the end of a {}-byte buffer", _pos, _bytes.size()));
        }

        buffer peek(const size_t n) const
        {
            if (n > remaining()) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("requested {} bytes at position {} but only {} remain", n, _pos, remaining()));
            return _bytes.subbuf(_pos, n);
        }

        uint8_t peek_byte() const
        {
            return peek(1)[0];
        }

        buffer take(const size_t n)
        {
            const auto res = peek(n);
            _pos += n;
            return res;
        }

        uint8_t take_byte()
        {
            return take(1)[0];
        }

        void seek(const size_t pos)
        {
            if (pos > _bytes.size()) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("cannot seek to {} in a {}-byte buffer", pos, _bytes.size()));
            _pos = pos;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _pos;
        }

        bool empty() const noexcept
        {
            return _pos == _bytes.size();
        }

        buffer data() const noexcept
        {
            return _bytes;
        }
    private:
        buffer _bytes {};
        size_t _pos = 0;
    };

    // A bounded write position over a caller-owned region.
    // A failed write throws end_of_buffer and leaves the position unchanged.
    struct write_cursor {
        write_cursor() =default;

        explicit write_cursor(const write_buffer bytes):
            _bytes { bytes }
        {
        }

        void write(const buffer bytes)
        {
            _require(bytes.size());
            if (!bytes.empty())
                memcpy(_bytes.data() + _pos, bytes.data(), bytes.size());
            _pos += bytes.size();
        }

        void write(const uint8_t byte)
        {
            _require(1);
            _bytes[_pos++] = byte;
        }

        // Replaces already written bytes starting at pos
        void overwrite(const size_t pos, const buffer bytes)
        {
            if (pos + bytes.size() > _pos) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("cannot overwrite {} bytes at {}: only {} bytes are written", bytes.size(), pos, _pos));
            if (!bytes.empty())
                memcpy(_bytes.data() + pos, bytes.data(), bytes.size());
        }

        // Shifts the bytes written after pos forward by n, opening a gap of n bytes at pos.
        void insert_gap(const size_t pos, const size_t n)
        {
            if (pos > _pos) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("gap position {} is beyond the written size {}", pos, _pos));
            _require(n);
            memmove(_bytes.data() + pos + n, _bytes.data() + pos, _pos - pos);
            _pos += n;
        }

        void rewind(const size_t pos)
        {
            if (pos > _pos) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("cannot rewind forward from {} to {}", _pos, pos));
            _pos = pos;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _pos;
        }

        buffer written() const noexcept
        {
            return buffer { _bytes.data(), _pos };
        }
    private:
        write_buffer _bytes {};
        size_t _pos = 0;

        void _require(const size_t n) const
        {
            if (n > remaining()) [[unlikely]]
                throw error(error_kind::end_of_buffer, fmt::format("a write of {} bytes at position {} does not fit into the remaining {} bytes", n, _pos, remaining()));
        }
    };
}

#endif // !TPS_CBOR_CURSOR_HPP
