/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/test.hpp>
#include "decoder.hpp"
#include "diag.hpp"

using namespace tps;
using namespace tps::cbor;

namespace {
    std::string diag_hex(const std::string_view hex)
    {
        const auto data = uint8_vector::from_hex(hex);
        return diag(parse(data));
    }
}

suite cbor_diag_suite = [] {
    "cbor::diag"_test = [] {
        "scalars"_test = [] {
            test_same(diag_hex("1903E8"), std::string { "1000" });
            test_same(diag_hex("3903E7"), std::string { "-1000" });
            test_same(diag_hex("3BFFFFFFFFFFFFFFFF"), std::string { "-18446744073709551616" });
            test_same(diag_hex("4401020304"), std::string { "h'01020304'" });
            test_same(diag_hex("62225C"), std::string { R"("\"\\")" });
            test_same(diag_hex("F4"), std::string { "false" });
            test_same(diag_hex("F6"), std::string { "null" });
            test_same(diag_hex("F7"), std::string { "undefined" });
            test_same(diag_hex("F0"), std::string { "simple(16)" });
        };
        "floats"_test = [] {
            test_same(diag_hex("F93E00"), std::string { "1.5" });
            test_same(diag_hex("F93C00"), std::string { "1.0" });
            test_same(diag_hex("FA47C35000"), std::string { "100000.0" });
            test_same(diag_hex("F97C00"), std::string { "Infinity" });
            test_same(diag_hex("F9FC00"), std::string { "-Infinity" });
            test_same(diag_hex("F97E00"), std::string { "NaN" });
        };
        "containers"_test = [] {
            test_same(diag_hex("8201A1616142" "0102"), std::string { R"([1, {"a": h'0102'}])" });
            test_same(diag_hex("D81824"), std::string { "24(-5)" });
            test_same(diag_hex("9F018202039F0405FFFF"), std::string { "[_ 1, [2, 3], [_ 4, 5]]" });
            test_same(diag_hex("BF61610161629F02FFFF"), std::string { R"({_ "a": 1, "b": [_ 2]})" });
            test_same(diag_hex("5F42010243030405FF"), std::string { "_ h'0102030405'" });
            test_same(diag_hex("80"), std::string { "[]" });
            test_same(diag_hex("A0"), std::string { "{}" });
        };
        "formatter"_test = [] {
            const auto data = uint8_vector::from_hex("8801A1616142" "0102D82424F0F93E00F5F6F7");
            test_same(fmt::format("{}", parse(data)), std::string { R"([1, {"a": h'0102'}, 24(-5), simple(16), 1.5, true, null, undefined])" });
        };
    };
};
