/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/cli.hpp>
#include <gd/test.hpp>

using namespace gumdrop;
using namespace gumdrop::cli;

namespace {
    struct echo_command: command {
        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "prints its arguments";
            cmd.args.expect({ "<db-path>", "[<tree-id>]" });
            cmd.opts.try_emplace("start-seq", option_config { "the exclusive lower bound", {}, validate_uint });
            cmd.opts.try_emplace("min-seq", option_config { "the first seq to check", "0", validate_uint });
        }

        void run(const arguments &args, const options &opts) const override
        {
            logger::info("echo: {} {}", args, opts);
        }
    };
}

suite cli_suite = [] {
    "cli"_test = [] {
        const echo_command cmd {};
        cli::config cfg {};
        cmd.configure(cfg);
        "expect"_test = [&] {
            test_same(1, *cfg.args.min);
            test_same(2, *cfg.args.max);
            argument_config var {};
            var.expect({ "<a>", "[<b>...]" });
            test_same(1, *var.min);
            test_same(std::numeric_limits<size_t>::max(), *var.max);
        };
        "usage"_test = [&] {
            test_same(std::string { "echo [options] <db-path> [<tree-id>] - prints its arguments" }, cfg.make_usage());
        };
        "parse"_test = [&] {
            const auto pr = cmd.parse(cfg, { "db.sqlite", "--start-seq=10" });
            test_same(1, pr.args.size());
            test_same(std::string { "db.sqlite" }, pr.args.at(0));
            test_same(10, *option_uint(pr.opts, "start-seq"));
            test_same(0, *option_uint(pr.opts, "min-seq"));
            expect(!option_uint(pr.opts, "end-seq"));
        };
        "parse errors"_test = [&] {
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, {})); }));
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, { "a", "b", "c" })); }));
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, { "a", "--end-seq=1" })); }));
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, { "a", "--start-seq=x1" })); }));
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, { "a", "--start-seq" })); }));
            expect(throws([&] { static_cast<void>(cmd.parse(cfg, { "a", "--min-seq=1", "--min-seq=2" })); }));
        };
        "validate_uint"_test = [] {
            expect(!validate_uint("0"));
            expect(!validate_uint("18446744073709551615"));
            expect(validate_uint("18446744073709551616").has_value());
            expect(validate_uint("-1").has_value());
            expect(validate_uint("").has_value());
            expect(validate_uint(std::optional<std::string> {}).has_value());
        };
    };
};
