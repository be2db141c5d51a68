/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <gd/cli.hpp>
#include <gd/indexer/transaction.hpp>
#include <gd/indexer/log-tree.hpp>

namespace gumdrop::cli::parse_logs {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parse-logs";
            cmd.desc = "print the program invocation tree of each transaction in <txs-json>";
            cmd.args.expect({ "<txs-json>" });
        }

        void run(const arguments &args) const override
        {
            const auto txs = indexer::load_transactions(args.at(0));
            for (const auto &tx: txs) {
                std::cout << fmt::format("tx {} slot {}", tx.signature, tx.slot);
                if (tx.failed()) {
                    std::cout << fmt::format(": failed: {}\n", *tx.err);
                    continue;
                }
                if (indexer::is_truncated(tx.logs)) {
                    std::cout << ": truncated logs\n";
                    continue;
                }
                try {
                    const auto tree = indexer::parse_logs(tx.logs);
                    std::cout << fmt::format(": {} invocations\n{}", indexer::node_count(tree), indexer::describe(tree));
                } catch (const indexer::parse_error &ex) {
                    std::cout << fmt::format(": malformed logs: {}\n", ex.what());
                }
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
