/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPS_CLI_HPP
#define TPS_CLI_HPP

#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <tps/common/error.hpp>
#include <tps/common/format.hpp>
#include <tps/logger.hpp>

namespace tps::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        // the option takes a value given as --name=value or --name value
        bool with_value = false;
        bool required = false;
    };
    using option_config_map = std::map<std::string, option_config>;

    struct argument_config {
        size_t min = 0;
        size_t max = 0;
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            min = 0;
            max = 0;
            for (const auto &a: args) {
                if (a.at(0) == '[') {
                    if (a.ends_with("...]"))
                        max = std::numeric_limits<size_t>::max();
                    else if (max < std::numeric_limits<size_t>::max())
                        ++max;
                } else {
                    ++min;
                    if (max < std::numeric_limits<size_t>::max())
                        ++max;
                }
            }
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string info {};
            for (const auto &[name, cfg]: opts) {
                const auto opt = cfg.with_value ? fmt::format("--{} <{}>", name, name) : fmt::format("--{}", name);
                info += cfg.required ? fmt::format(" {}", opt) : fmt::format(" [{}]", opt);
            }
            for (const auto &name: args.names)
                info += fmt::format(" {}", name);
            return fmt::format("{}{} - {}", name, info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cfg) const =0;
        virtual void run(const arguments &args, const options &opts) const =0;

        parse_result parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (auto it = args.begin(); it != args.end(); ++it) {
                const auto &arg = *it;
                if (!arg.starts_with("--")) {
                    pr.args.emplace_back(arg);
                    continue;
                }
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                const auto cfg_it = cfg.opts.find(name);
                if (cfg_it == cfg.opts.end())
                    _throw_usage(cfg, fmt::format("unknown option '--{}'", name));
                if (cfg_it->second.with_value) {
                    if (!val) {
                        if (std::next(it) == args.end())
                            _throw_usage(cfg, fmt::format("option '--{}' requires a value", name));
                        val = *++it;
                    }
                } else if (val) {
                    _throw_usage(cfg, fmt::format("option '--{}' does not take a value", name));
                }
                if (const auto [opt_it, created] = pr.opts.try_emplace(name, std::move(val)); !created)
                    _throw_usage(cfg, fmt::format("duplicate option specification '{}'", arg));
            }
            for (const auto &[name, opt_cfg]: cfg.opts) {
                if (opt_cfg.required && !pr.opts.contains(name))
                    _throw_usage(cfg, fmt::format("option '--{}' is required", name));
            }
            if (pr.args.size() < cfg.args.min || pr.args.size() > cfg.args.max)
                _throw_usage(cfg, fmt::format("expected between {} and {} arguments but got {}", cfg.args.min, cfg.args.max, pr.args.size()));
            return pr;
        }
    protected:
        [[noreturn]] static void _throw_usage(const config &cmd, const std::string_view reason)
        {
            std::string usage = fmt::format("{}; usage: {}", reason, cmd.make_usage());
            for (const auto &[name, cfg]: cmd.opts)
                usage += fmt::format("; --{} - {}", name, cfg.desc);
            throw error(usage);
        }
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    // With a single registered command the executable is the command and all arguments belong to it.
    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !TPS_CLI_HPP
