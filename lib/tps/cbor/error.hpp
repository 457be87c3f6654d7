/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_ERROR_HPP
#define TPS_CBOR_ERROR_HPP

#include <string>
#include <string_view>
#include <tps/common/error.hpp>
#include <tps/common/format.hpp>

namespace tps::cbor {
    enum class error_kind {
        end_of_buffer,
        malformed_encoding,
        unexpected_break,
        invalid_utf8,
        out_of_range,
        expected,
        not_well_formed
    };
}

namespace fmt {
    template<>
    struct formatter<tps::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tps::cbor::error_kind;
            switch (v) {
                case error_kind::end_of_buffer: return fmt::format_to(ctx.out(), "end of buffer");
                case error_kind::malformed_encoding: return fmt::format_to(ctx.out(), "malformed encoding");
                case error_kind::unexpected_break: return fmt::format_to(ctx.out(), "unexpected break");
                case error_kind::invalid_utf8: return fmt::format_to(ctx.out(), "invalid utf-8");
                case error_kind::out_of_range: return fmt::format_to(ctx.out(), "out of range");
                case error_kind::expected: return fmt::format_to(ctx.out(), "expected");
                case error_kind::not_well_formed: return fmt::format_to(ctx.out(), "not well formed");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace tps::cbor {
    struct error: tps::error {
        static error expected(std::string_view what, std::string_view got)
        {
            return error { error_kind::expected, std::string { what }, fmt::format("expected {} but got {}", what, got) };
        }

        error(const error_kind kind, const std::string_view detail):
            error { kind, {}, detail }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        // the description of what was expected; empty unless kind() is error_kind::expected
        const std::string &expectation() const noexcept
        {
            return _expectation;
        }
    private:
        error_kind _kind;
        std::string _expectation;

        error(const error_kind kind, std::string expectation, const std::string_view detail):
            tps::error { fmt::format("cbor {}: {}", kind, detail) },
            _kind { kind },
            _expectation { std::move(expectation) }
        {
        }
    };

    inline bool is_mismatch(const error &err) noexcept
    {
        return err.kind() == error_kind::expected;
    }
}

#endif // !TPS_CBOR_ERROR_HPP
