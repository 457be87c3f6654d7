/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tps/cli.hpp>

namespace tps::cli {
    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::map<std::string, command_meta> commands {};
        try {
            for (const auto &cmd: command_list) {
                command_meta meta { cmd };
                cmd->configure(meta.cfg);
                const auto name = meta.cfg.name;
                if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                    throw error(fmt::format("multiple definitions for {}", name));
            }
        } catch (const std::exception &ex) {
            logger::error("{}", ex.what());
            return 1;
        }
        if (commands.empty()) {
            logger::error("no commands are registered");
            return 1;
        }

        int first_arg = 1;
        auto cmd_it = commands.begin();
        if (commands.size() > 1) {
            if (argc < 2) {
                std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
                for (const auto &[name, cmd]: commands)
                    std::cerr << fmt::format("    {}\n", cmd.cfg.make_usage());
                return 1;
            }
            const std::string cmd { argv[1] };
            cmd_it = commands.find(cmd);
            if (cmd_it == commands.end()) {
                logger::error("Unknown command {}", cmd);
                return 1;
            }
            first_arg = 2;
        }

        const auto &meta = cmd_it->second;
        logger::debug("run {}", meta.cfg.name);
        arguments args {};
        for (int i = first_arg; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
        } catch (const std::exception &ex) {
            logger::error("{}: {}", meta.cfg.name, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
