/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/test.hpp>
#include <tps/logger.hpp>

using namespace tps;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::warn("OK - {}", "warn");
            logger::error("OK - {}", 1);
            expect(true);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            size_t cleanups = 0;
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); }, [&] { ++cleanups; });
            expect(static_cast<bool>(ex2));
            test_same(cleanups, 1ULL);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<error>([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
