/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/cli.hpp>
#include <tps/cddl/ir.hpp>
#include <tps/cddl/reader.hpp>

namespace tps::cli::cddlgen {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "cddlgen";
            cmd.desc = "parse a cddl file and print the type definitions collected by pass 1";
            cmd.opts.try_emplace("cddl", option_config { "the cddl file to process", true, true });
            cmd.opts.try_emplace("prelude", option_config { "prepend the standard prelude of RFC 8610" });
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto &path = *opts.at("cddl");
            const auto st = cddl::ir::pass1(cddl::read(path, opts.contains("prelude")));
            logger::info("{} type definitions in {}", st.size(), path);
            std::cout << fmt::format("{}", st);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
