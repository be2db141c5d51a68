/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <iostream>
#include <gd/cli.hpp>

namespace gumdrop::cli {
    std::optional<std::string> validate_uint(const std::optional<std::string> &val)
    {
        if (!val)
            return "a value is required";
        uint64_t num = 0;
        const auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), num);
        if (val->empty() || ec != std::errc {} || ptr != val->data() + val->size())
            return "must be an unsigned decimal number";
        return {};
    }

    std::optional<uint64_t> option_uint(const options &opts, const std::string &name)
    {
        if (const auto it = opts.find(name); it != opts.end() && it->second)
            return std::stoull(*it->second);
        return {};
    }

    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (arg.substr(0, 2) == "--") {
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                if (!cfg.opts.contains(name))
                    throw error(fmt::format("unknown option '--{}'", name));
                const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val));
                if (!opt_created)
                    throw error(fmt::format("duplicate option specification '{}'", arg));
            } else {
                pr.args.emplace_back(arg);
            }
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            if (opt_cfg.default_value && !pr.opts.contains(name))
                pr.opts.emplace(name, *opt_cfg.default_value);
            if (const auto val_it = pr.opts.find(name); opt_cfg.validator && val_it != pr.opts.end()) {
                if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                    throw error(fmt::format("value {} is invalid for '--{}': {}", val_it->second, name, *val_err));
            }
        }
        if (cfg.args.min && pr.args.size() < *cfg.args.min)
            _throw_usage(cfg);
        if (cfg.args.max && pr.args.size() > *cfg.args.max)
            _throw_usage(cfg);
        if (const auto opt_it = pr.opts.find("config"); opt_it != pr.opts.end() && opt_it->second)
            gumdrop::config::set_default_path(*opt_it->second);
        return pr;
    }

    void command::_throw_usage(const config &cmd)
    {
        std::string usage = fmt::format("usage: {}", cmd.make_usage());
        if (!cmd.opts.empty()) {
            usage += fmt::format("\n{} supports the following options:", cmd.name);
            for (const auto &[name, opt_cfg]: cmd.opts) {
                if (opt_cfg.default_value)
                    usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt_cfg.default_value, opt_cfg.desc);
                else
                    usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
            }
        }
        throw error(usage);
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        std::ios_base::sync_with_stdio(false);
        map<std::string, std::pair<std::shared_ptr<command>, config>> commands {};
        for (const auto &cmd: command_list) {
            config cfg {};
            cmd->configure(cfg);
            cfg.opts.try_emplace("config", option_config { "a path to the JSON configuration file" });
            const auto name = cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, cmd, std::move(cfg)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {}\n", cmd.second.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &[cmd_ptr, cmd_cfg] = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::info };
            const auto pr = cmd_ptr->parse(cmd_cfg, args);
            cmd_ptr->run(pr.args, pr.opts);
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
