/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/cli.hpp>
#include <gd/indexer/reconciler.hpp>
#include <gd/storage/sqlite.hpp>

namespace gumdrop::cli::index {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "index";
            cmd.desc = "index the logs of the transactions in <txs-json> into the database at <db-path>";
            cmd.args.expect({ "<db-path>", "<txs-json>" });
            cmd.opts.try_emplace("start-seq", option_config { "ignore changes with seq less than or equal to this", {}, validate_uint });
            cmd.opts.try_emplace("end-seq", option_config { "ignore changes with seq greater than or equal to this", {}, validate_uint });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &db_path = args.at(0);
            const auto txs = indexer::load_transactions(args.at(1));
            const indexer::seq_window window { option_uint(opts, "start-seq"), option_uint(opts, "end-seq") };
            const auto programs = indexer::static_program_registry::from_config(*load_config());
            storage::sqlite db { db_path };
            indexer::reconciler rec { db, programs };
            const auto results = rec.index_batch(txs, window);
            map<indexer::parse_result, size_t> stats {};
            for (const auto r: results)
                ++stats[r];
            logger::info("indexed {} transactions into {}: {}", txs.size(), db_path, stats);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
