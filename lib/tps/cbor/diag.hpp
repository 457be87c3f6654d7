/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CBOR_DIAG_HPP
#define TPS_CBOR_DIAG_HPP

#include <string>
#include "item.hpp"

namespace tps::cbor {
    // RFC 8949 diagnostic notation
    extern std::string diag(const item &it);
}

namespace fmt {
    template<>
    struct formatter<tps::cbor::item>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", tps::cbor::diag(v));
        }
    };
}

#endif // !TPS_CBOR_DIAG_HPP
