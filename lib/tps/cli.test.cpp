/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/common/test.hpp>
#include <tps/cli.hpp>

using namespace tps;
using namespace tps::cli;

namespace {
    struct recorder {
        arguments args {};
        options opts {};
        size_t runs = 0;
    };

    struct test_cmd: command {
        explicit test_cmd(recorder &rec, const bool fail=false):
            _rec { rec }, _fail { fail }
        {
        }

        void configure(config &cmd) const override
        {
            cmd.name = "test-cmd";
            cmd.desc = "a command for testing";
            cmd.args.expect({ "[<path>]" });
            cmd.opts.try_emplace("cddl", option_config { "an input file", true, true });
            cmd.opts.try_emplace("prelude", option_config { "a flag" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            if (_fail)
                throw error("the command failed");
            _rec.args = args;
            _rec.opts = opts;
            ++_rec.runs;
        }
    private:
        recorder &_rec;
        bool _fail;
    };

    int run_with(recorder &rec, const std::vector<const char *> &argv, const bool fail=false)
    {
        const command::command_list cmds { std::make_shared<test_cmd>(rec, fail) };
        return cli::run(static_cast<int>(argv.size()), const_cast<const char **>(argv.data()), cmds);
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "option forms"_test = [] {
            recorder rec {};
            test_same(run_with(rec, { "test-cmd", "--cddl", "a.cddl" }), 0);
            test_same(*rec.opts.at("cddl"), std::string { "a.cddl" });
            expect(!rec.opts.contains("prelude"));
            test_same(run_with(rec, { "test-cmd", "--cddl=b.cddl", "--prelude", "extra" }), 0);
            test_same(*rec.opts.at("cddl"), std::string { "b.cddl" });
            expect(rec.opts.contains("prelude"));
            expect(!rec.opts.at("prelude"));
            test_same(rec.args, arguments { "extra" });
            test_same(rec.runs, 2ULL);
        };
        "usage errors"_test = [] {
            recorder rec {};
            test_same(run_with(rec, { "test-cmd" }), 1);
            test_same(run_with(rec, { "test-cmd", "--cddl" }), 1);
            test_same(run_with(rec, { "test-cmd", "--cddl=a", "--unknown" }), 1);
            test_same(run_with(rec, { "test-cmd", "--cddl=a", "--cddl=b" }), 1);
            test_same(run_with(rec, { "test-cmd", "--cddl=a", "--prelude=yes" }), 1);
            test_same(run_with(rec, { "test-cmd", "--cddl=a", "x", "y" }), 1);
            test_same(rec.runs, 0ULL);
        };
        "command failures"_test = [] {
            recorder rec {};
            test_same(run_with(rec, { "test-cmd", "--cddl=a" }, true), 1);
        };
        "usage text"_test = [] {
            recorder rec {};
            const test_cmd cmd { rec };
            config cfg {};
            cmd.configure(cfg);
            test_same(cfg.make_usage(), std::string { "test-cmd --cddl <cddl> [--prelude] [<path>] - a command for testing" });
            expect_throws_msg<error>([&] { cmd.parse(cfg, { "--prelude" }); }, "option '--cddl' is required");
        };
    };
};
