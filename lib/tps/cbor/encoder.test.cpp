/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <tps/common/test.hpp>
#include "decoder.hpp"
#include "encoder.hpp"

using namespace tps;
using namespace tps::cbor;

namespace {
    template<typename F>
    uint8_vector encode(const F &write, const size_t capacity=64)
    {
        uint8_vector storage(capacity);
        encoder enc { storage };
        write(enc);
        return uint8_vector { enc.encoded() };
    }

    template<typename F>
    void expect_error(const F &action, const error_kind kind, const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
            expect(false, loc) << fmt::format("no exception while expecting {}", kind);
        } catch (const cbor::error &ex) {
            expect(ex.kind() == kind, loc) << fmt::format("expected {} but got {}: {}", kind, ex.kind(), ex.what());
        }
    }
}

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "preferred integer widths"_test = [] {
            test_same(encode([](auto &e) { e.uint(0); }), uint8_vector::from_hex("00"));
            test_same(encode([](auto &e) { e.uint(23); }), uint8_vector::from_hex("17"));
            test_same(encode([](auto &e) { e.uint(24); }), uint8_vector::from_hex("1818"));
            test_same(encode([](auto &e) { e.uint(255); }), uint8_vector::from_hex("18FF"));
            test_same(encode([](auto &e) { e.uint(256); }), uint8_vector::from_hex("190100"));
            test_same(encode([](auto &e) { e.uint(65535); }), uint8_vector::from_hex("19FFFF"));
            test_same(encode([](auto &e) { e.uint(65536); }), uint8_vector::from_hex("1A00010000"));
            test_same(encode([](auto &e) { e.uint(0xFFFFFFFFULL); }), uint8_vector::from_hex("1AFFFFFFFF"));
            test_same(encode([](auto &e) { e.uint(0x100000000ULL); }), uint8_vector::from_hex("1B0000000100000000"));
            test_same(encode([](auto &e) { e.uint(std::numeric_limits<uint64_t>::max()); }), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
        };
        "negative integers"_test = [] {
            test_same(encode([](auto &e) { e.integer(-1); }), uint8_vector::from_hex("20"));
            test_same(encode([](auto &e) { e.integer(-24); }), uint8_vector::from_hex("37"));
            test_same(encode([](auto &e) { e.integer(-25); }), uint8_vector::from_hex("3818"));
            test_same(encode([](auto &e) { e.integer(-1000); }), uint8_vector::from_hex("3903E7"));
            test_same(encode([](auto &e) { e.integer(std::numeric_limits<int64_t>::min()); }), uint8_vector::from_hex("3B7FFFFFFFFFFFFFFF"));
            test_same(encode([](auto &e) { e.integer(1000); }), uint8_vector::from_hex("1903E8"));
        };
        "integers decode back"_test = [] {
            for (const int64_t v: { int64_t { 0 }, int64_t { -1 }, int64_t { 100 }, int64_t { -500 }, std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::min() }) {
                const auto data = encode([v](auto &e) { e.integer(v); });
                test_same(parse(data).to<int64_t>(), v);
            }
        };
        "strings"_test = [] {
            test_same(encode([](auto &e) { e.text("IETF"); }), uint8_vector::from_hex("6449455446"));
            test_same(encode([](auto &e) { e.bytes(uint8_vector::from_hex("01020304")); }), uint8_vector::from_hex("4401020304"));
            test_same(encode([](auto &e) { e.text(""); }), uint8_vector::from_hex("60"));
        };
        "nested arrays"_test = [] {
            const auto data = encode([](auto &e) {
                e.array([](auto &outer) {
                    outer.array([](auto &a) { a.uint(1).uint(2); });
                    outer.array([](auto &a) { a.uint(3).uint(4); });
                });
            });
            test_same(data, uint8_vector::from_hex("82820102820304"));
        };
        "array header widening"_test = [] {
            const auto data = encode([](auto &e) {
                e.array([](auto &a) {
                    a.array([](auto &inner) { inner.uint(7); });
                    for (uint64_t i = 1; i < 24; ++i)
                        a.uint(i);
                });
            }, 128);
            test_same(data.size(), 27);
            test_same(data[0], 0x98);
            test_same(data[1], 24);
            test_same(data[2], 0x81);
            test_same(data[3], 7);
            const auto it = parse(data);
            test_same(it.array().size, 24);
            test_same(it.array().at(0)->array().at(0)->uint(), 7);
            test_same(it.array().at(23)->uint(), 23);
        };
        "map"_test = [] {
            const auto data = encode([](auto &e) {
                e.map([](auto &m) {
                    m.insert_key_value(1, "a");
                    m.insert_key_value("b", uint8_vector::from_hex("0102"));
                });
            });
            test_same(data, uint8_vector::from_hex("A2016161616242" "0102"));
        };
        "map with an odd item count"_test = [] {
            uint8_vector storage(16);
            encoder enc { storage };
            enc.uint(1);
            expect_error([&] { enc.map([](auto &m) { m.uint(1).uint(2).uint(3); }); }, error_kind::malformed_encoding);
            test_same(enc.encoded(), uint8_vector::from_hex("01"));
            test_same(enc.count(), 1);
        };
        "tags count as one item"_test = [] {
            const auto data = encode([](auto &e) {
                e.array([](auto &a) {
                    a.tag(24).bytes(uint8_vector::from_hex("01"));
                    a.epoch(1363896240);
                    a.date_time("2013-03-21T20:04:00Z");
                });
            });
            const auto it = parse(data);
            test_same(it.array().size, 3);
            test_same(it.array().at(1)->tag().id, 1);
            test_same(it.array().at(1)->tag().value().uint(), 1363896240);
            test_same(it.array().at(2)->tag().value().text(), std::string_view { "2013-03-21T20:04:00Z" });
        };
        "a dangling tag"_test = [] {
            uint8_vector storage(16);
            encoder enc { storage };
            expect_error([&] { enc.array([](auto &a) { a.uint(1).tag(5); }); }, error_kind::malformed_encoding);
            test_same(enc.encoded().size(), 0);
        };
        "simple values"_test = [] {
            test_same(encode([](auto &e) { e.boolean(false).boolean(true).s_null().s_undefined(); }), uint8_vector::from_hex("F4F5F6F7"));
            test_same(encode([](auto &e) { e.simple(16).simple(255); }), uint8_vector::from_hex("F0F8FF"));
            expect_error([] { encode([](auto &e) { e.simple(21); }); }, error_kind::malformed_encoding);
            expect_error([] { encode([](auto &e) { e.simple(24); }); }, error_kind::malformed_encoding);
        };
        "shortest floats"_test = [] {
            test_same(encode([](auto &e) { e.float64(0.0); }), uint8_vector::from_hex("F90000"));
            test_same(encode([](auto &e) { e.float64(-0.0); }), uint8_vector::from_hex("F98000"));
            test_same(encode([](auto &e) { e.float64(1.5); }), uint8_vector::from_hex("F93E00"));
            test_same(encode([](auto &e) { e.float64(65504.0); }), uint8_vector::from_hex("F97BFF"));
            test_same(encode([](auto &e) { e.float64(100000.0); }), uint8_vector::from_hex("FA47C35000"));
            test_same(encode([](auto &e) { e.float64(1.1); }), uint8_vector::from_hex("FB3FF199999999999A"));
            test_same(encode([](auto &e) { e.float64(std::numeric_limits<double>::infinity()); }), uint8_vector::from_hex("F97C00"));
            test_same(encode([](auto &e) { e.float64(std::numeric_limits<double>::quiet_NaN()); }), uint8_vector::from_hex("F97E00"));
            test_same(encode([](auto &e) { e.float64(std::ldexp(1.0, -24)); }), uint8_vector::from_hex("F90001"));
            test_same(encode([](auto &e) { e.float64(std::numeric_limits<float>::max()); }), uint8_vector::from_hex("FA7F7FFFFF"));
            test_same(encode([](auto &e) { e.float64(1e300); }), uint8_vector::from_hex("FB7E37E43C8800759C"));
            test_same(encode([](auto &e) { e.float64(-1e39); }), uint8_vector::from_hex("FBC8078287F49C4A1D"));
        };
        "insert dispatch"_test = [] {
            const auto data = encode([](auto &e) {
                e.insert(true).insert(uint64_t { 5 }).insert(-2).insert(0.5).insert(std::string_view { "x" }).insert(null_value {});
            });
            test_same(data, uint8_vector::from_hex("F50521F938006178F6"));
        };
        "raw_cbor"_test = [] {
            const auto item_data = uint8_vector::from_hex("820102");
            const auto it = parse(item_data);
            const auto data = encode([&](auto &e) { e.array([&](auto &a) { a.insert(it).raw_cbor(item_data); }); });
            test_same(data, uint8_vector::from_hex("82820102820102"));
        };
        "end of buffer rewinds"_test = [] {
            uint8_vector storage(4);
            encoder enc { storage };
            enc.uint(1);
            expect_error([&] { enc.text("long text"); }, error_kind::end_of_buffer);
            test_same(enc.encoded().size(), 1);
            expect_error([&] { enc.uint(0x100000000ULL); }, error_kind::end_of_buffer);
            test_same(enc.encoded().size(), 1);
            expect_error([&] { enc.array([](auto &a) { a.uint(1).uint(2).uint(3); }); }, error_kind::end_of_buffer);
            test_same(enc.encoded().size(), 1);
            test_same(enc.count(), 1);
            enc.array([](auto &a) { a.uint(2).uint(3); });
            test_same(enc.encoded(), uint8_vector::from_hex("01820203"));
        };
        "widening past the end rewinds"_test = [] {
            uint8_vector storage(25);
            encoder enc { storage };
            expect_error([&] {
                enc.array([](auto &a) {
                    for (uint64_t i = 0; i < 24; ++i)
                        a.uint(i);
                });
            }, error_kind::end_of_buffer);
            test_same(enc.encoded().size(), 0);
        };
    };
};
