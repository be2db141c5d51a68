/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_RECONCILER_HPP
#define GUMDROP_INDEXER_RECONCILER_HPP

#include <gd/indexer/handlers.hpp>
#include <gd/indexer/transaction.hpp>
#include <gd/storage/storage.hpp>

namespace gumdrop::indexer {
    enum class parse_result {
        success, transaction_error, log_truncated
    };

    struct collect_stats {
        size_t instructions = 0;
        map<handler_result, size_t> results {};
    };

    /*
     * Turns the logs of executed transactions into storage writes.
     * The caller feeds transactions touching the same tree in commitment order.
     */
    struct reconciler {
        reconciler(storage::storage &store, const program_registry &programs);

        // Parses and dispatches a transaction without touching storage, throws parse_error
        storage::mutation_batch collect(const transaction_logs &tx, const seq_window &window={}, collect_stats *stats=nullptr) const;

        // All writes of the transaction are applied within a single storage transaction
        parse_result handle_logs_atomic(const transaction_logs &tx, const seq_window &window={});
        // Best effort: errors are logged and each instruction's writes are applied as they come
        void handle_logs(const transaction_logs &tx, const seq_window &window={});
        // One status per transaction, a transaction with malformed logs is logged and reported as a success with no writes
        vector<parse_result> index_batch(const vector<transaction_logs> &txs, const seq_window &window={});
    private:
        storage::storage &_store;
        const program_registry &_programs;
    };
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::parse_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            switch (v) {
                case parse_result::success: return fmt::format_to(ctx.out(), "success");
                case parse_result::transaction_error: return fmt::format_to(ctx.out(), "transaction_error");
                case parse_result::log_truncated: return fmt::format_to(ctx.out(), "log_truncated");
                default: throw gumdrop::error(fmt::format("unsupported parse_result value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GUMDROP_INDEXER_RECONCILER_HPP
