/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <gd/cli.hpp>
#include <gd/storage/sqlite.hpp>

namespace gumdrop::cli::gaps {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "gaps";
            cmd.desc = "list the sequence numbers of <tree-id> missing from the database at <db-path>";
            cmd.args.expect({ "<db-path>", "<tree-id>" });
            cmd.opts.try_emplace("min-seq", option_config { "the first seq to consider", "0", validate_uint });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const storage::sqlite db { args.at(0) };
            const auto tree_id = pubkey::from_base58(args.at(1));
            const auto min_seq = option_uint(opts, "min-seq").value_or(0);
            const auto gaps = db.missing_seqs(tree_id, min_seq);
            for (const auto &g: gaps)
                std::cout << fmt::format("{}\n", g);
            logger::info("tree {}: max seq: {} gaps: {}", tree_id, db.max_seq(tree_id), gaps.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
