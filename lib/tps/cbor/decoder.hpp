/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_DECODER_HPP
#define TPS_CBOR_DECODER_HPP

#include <iterator>
#include <optional>
#include "cursor.hpp"
#include "item.hpp"

namespace tps::cbor {
    // A lazy sequence of items over borrowed bytes.
    // The bytes must outlive the decoder and every item or sub-decoder obtained from it.
    struct decoder {
        static constexpr size_t max_depth = 64;

        struct iterator {
            using iterator_category = std::input_iterator_tag;
            using value_type = item;
            using difference_type = std::ptrdiff_t;
            using pointer = const item *;
            using reference = const item &;

            iterator() =default;

            explicit iterator(decoder &dec):
                _dec { &dec }
            {
                _advance();
            }

            const item &operator*() const
            {
                return *_cur;
            }

            const item *operator->() const
            {
                return &*_cur;
            }

            iterator &operator++()
            {
                _advance();
                return *this;
            }

            // iterators compare equal only when both are exhausted
            bool operator==(const iterator &o) const noexcept
            {
                return !_cur && !o._cur;
            }
        private:
            decoder *_dec = nullptr;
            std::optional<item> _cur {};

            void _advance()
            {
                if (_dec && !_dec->done())
                    _cur.emplace(_dec->next());
                else
                    _cur.reset();
            }
        };

        explicit decoder(const buffer bytes):
            _rc { bytes }
        {
        }

        // Decodes the next item and advances past it including all of its children.
        // Returns an eof item without advancing once all bytes are consumed.
        // On failure throws and leaves the position unchanged.
        item next();

        // Same as next() but never advances
        item peek() const;

        bool done() const noexcept
        {
            return _rc.empty();
        }

        size_t position() const noexcept
        {
            return _rc.position();
        }

        void seek(const size_t pos)
        {
            _rc.seek(pos);
        }

        buffer data() const noexcept
        {
            return _rc.data();
        }

        // fails with not_well_formed unless every byte has been consumed
        void finish() const;

        iterator begin()
        {
            return iterator { *this };
        }

        iterator end()
        {
            return {};
        }
    private:
        read_cursor _rc;
    };

    // decodes a buffer that must contain exactly one item
    extern item parse(buffer bytes);
}

#endif // !TPS_CBOR_DECODER_HPP
