/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/test.hpp>
#include "combinators.hpp"

using namespace tps;
using namespace tps::cbor;

namespace {
    template<typename F>
    void expect_mismatch(decoder &dec, const F &action, const std::source_location &loc=std::source_location::current())
    {
        const auto start = dec.position();
        try {
            action();
            expect(false, loc) << "no exception while expecting a mismatch";
        } catch (const cbor::error &ex) {
            expect(is_mismatch(ex), loc) << ex.what();
        }
        expect(dec.position() == start, loc) << fmt::format("position moved from {} to {}", start, dec.position());
    }
}

suite cbor_combinators_suite = [] {
    "cbor::combinators"_test = [] {
        "opt and apply"_test = [] {
            const auto data = uint8_vector::from_hex("1903E81903E9");
            decoder dec { data };
            std::vector<uint64_t> observed {};
            const auto first = opt(apply(is_uint, [&](const uint64_t v) { observed.emplace_back(v); }))(dec);
            expect(first.has_value());
            test_same(*first, 1000);
            test_same(observed, std::vector<uint64_t> { 1000 });
            test_same(is_uint(dec), 1001);
            is_eof(dec);
        };
        "mismatch leaves the position unchanged"_test = [] {
            const auto data = uint8_vector::from_hex("6161" "20" "8101" "A0" "C1181A" "F5" "F6");
            decoder dec { data };
            expect_mismatch(dec, [&] { is_uint(dec); });
            expect_mismatch(dec, [&] { is_bstr(dec); });
            expect_mismatch(dec, [&] { is_array(dec); });
            expect_mismatch(dec, [&] { is_eof(dec); });
            test_same(is_tstr(dec), std::string_view { "a" });
            expect_mismatch(dec, [&] { is_uint(dec); });
            test_same(is_nint(dec), 0);
            expect_mismatch(dec, [&] { is_map(dec); });
            test_same(is_array(dec).size, 1);
            test_same(is_map(dec).size, 0);
            expect_mismatch(dec, [&] { is_tag(2)(dec); });
            expect_mismatch(dec, [&] { is_date_time(dec); });
            test_same(is_epoch(dec), 26);
            expect_mismatch(dec, [&] { is_false(dec); });
            expect(is_true(dec));
            is_null(dec);
            is_eof(dec);
        };
        "opt propagates structural errors"_test = [] {
            const auto data = uint8_vector::from_hex("FF");
            decoder dec { data };
            try {
                opt(is_uint)(dec);
                expect(false);
            } catch (const cbor::error &ex) {
                test_same(ex.kind(), error_kind::unexpected_break);
            }
            test_same(dec.position(), 0);
        };
        "opt returns nullopt on mismatch"_test = [] {
            const auto data = uint8_vector::from_hex("6161");
            decoder dec { data };
            expect(!opt(is_uint)(dec));
            test_same(dec.position(), 0);
            test_same(*opt(is_tstr)(dec), std::string_view { "a" });
        };
        "cond"_test = [] {
            const auto data = uint8_vector::from_hex("07");
            decoder dec { data };
            expect(!cond(false, is_uint)(dec));
            test_same(dec.position(), 0);
            test_same(*cond(true, is_uint)(dec), 7);
        };
        "either"_test = [] {
            const auto data = uint8_vector::from_hex("F4" "0A" "6161");
            decoder dec { data };
            const auto to_str = [](auto p) {
                return [p](decoder &d) { return fmt::format("{}", p(d)); };
            };
            const auto p = either(to_str(is_bool), to_str(is_uint));
            test_same(p(dec), std::string { "false" });
            test_same(p(dec), std::string { "10" });
            expect_mismatch(dec, [&] { p(dec); });
        };
        "with_pred and with_value"_test = [] {
            const auto data = uint8_vector::from_hex("0518FF");
            decoder dec { data };
            const auto small = with_pred(is_uint, [](const uint64_t v) { return v < 10; }, "a small uint");
            test_same(small(dec), 5);
            expect_mismatch(dec, [&] { small(dec); });
            expect_mismatch(dec, [&] { with_value(is_uint, uint64_t { 254 })(dec); });
            test_same(with_value(is_uint, uint64_t { 255 })(dec), 255);
        };
        "many"_test = [] {
            const auto data = uint8_vector::from_hex("010203F6");
            decoder dec { data };
            test_same(many(is_uint)(dec), std::vector<uint64_t> { 1, 2, 3 });
            test_same(many(is_uint)(dec), std::vector<uint64_t> {});
            is_null(dec);
            is_eof(dec);
        };
        "many stops when the position does not advance"_test = [] {
            const auto data = uint8_vector::from_hex("01");
            decoder dec { data };
            const auto res = many(opt(is_tstr))(dec);
            test_same(res.size(), 1);
            expect(!res[0]);
            test_same(dec.position(), 0);
        };
        "range"_test = [] {
            const auto data = uint8_vector::from_hex("01020304");
            decoder dec { data };
            test_same(range(1, 2, is_uint)(dec), std::vector<uint64_t> { 1, 2 });
            expect_mismatch(dec, [&] { range(3, 5, is_uint)(dec); });
            test_same(range(2, 2, is_uint)(dec), std::vector<uint64_t> { 3, 4 });
        };
        "is_int"_test = [] {
            const auto data = uint8_vector::from_hex("20" "0C" "3BFFFFFFFFFFFFFFFF");
            decoder dec { data };
            test_same(is_int(dec), -1);
            test_same(is_int(dec), 12);
            try {
                is_int(dec);
                expect(false);
            } catch (const cbor::error &ex) {
                test_same(ex.kind(), error_kind::out_of_range);
            }
            test_same(dec.position(), 2);
        };
        "date_time and tagged array"_test = [] {
            const auto data = uint8_vector::from_hex("C074323031332D30332D32315432303A30343A30305A" "D8188101");
            decoder dec { data };
            test_same(is_date_time(dec), std::string_view { "2013-03-21T20:04:00Z" });
            const auto t = is_tag(24)(dec);
            auto sub = t.items();
            test_same(is_array(sub).size, 1);
        };
        "is_any and simple"_test = [] {
            const auto data = uint8_vector::from_hex("F0" "F7" "F93C00");
            decoder dec { data };
            test_same(is_simple(dec), 16);
            expect_mismatch(dec, [&] { is_null(dec); });
            is_undefined(dec);
            test_same(is_any(dec).kind(), item_kind::floating);
            expect_mismatch(dec, [&] { is_any(dec); });
            expect_mismatch(dec, [&] { is_float(dec); });
        };
    };
};
