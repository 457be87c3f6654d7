/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include "file.hpp"
#include "test.hpp"

using namespace tps;

suite common_file_suite = [] {
    "common::file"_test = [] {
        "read"_test = [] {
            const auto buf = file::read("data/cddl/bad.cddl");
            test_same(buf.str(), std::string_view { "a = uint\nb = [ int\n" });
        };
        "missing"_test = [] {
            expect_throws_msg<error_sys>([] { file::read("data/cddl/missing.cddl"); }, "failed to open file data/cddl/missing.cddl");
        };
    };
};
