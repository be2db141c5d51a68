/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/reconciler.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    reconciler::reconciler(storage::storage &store, const program_registry &programs):
        _store { store }, _programs { programs }
    {
    }

    storage::mutation_batch reconciler::collect(const transaction_logs &tx, const seq_window &window, collect_stats *stats) const
    {
        const auto tree = parse_logs(tx.logs);
        const tx_info info { tx.signature, tx.slot, window };
        changelog_extractor changelogs { tree, _programs };
        storage::mutation_batch batch {};
        dispatch(tree, _programs.program_id(program_role::token), [&](const log_node &node, const instruction_kind kind) {
            const auto res = handle_instruction({ node, kind, info, _programs, changelogs }, batch);
            logger::trace("tx {}: {} instruction: {}", tx.signature, kind, res);
            if (stats) {
                ++stats->instructions;
                ++stats->results[res];
            }
        });
        return batch;
    }

    parse_result reconciler::handle_logs_atomic(const transaction_logs &tx, const seq_window &window)
    {
        if (tx.failed()) {
            logger::debug("tx {}: skipping a failed transaction: {}", tx.signature, *tx.err);
            return parse_result::transaction_error;
        }
        if (is_truncated(tx.logs)) {
            logger::warn("tx {}: the logs are truncated", tx.signature);
            return parse_result::log_truncated;
        }
        storage::mutation_batch batch {};
        try {
            batch = collect(tx, window);
        } catch (const parse_error &ex) {
            logger::error("tx {}: failed to parse the logs: {}", tx.signature, ex.what());
            throw;
        }
        if (batch.empty())
            return parse_result::success;
        _store.begin();
        try {
            _store.apply(batch);
            _store.commit();
        } catch (const std::exception &ex) {
            logger::error("tx {}: rolling back {} writes: {}", tx.signature, batch.size(), ex.what());
            try {
                _store.rollback();
            } catch (const std::exception &rb_ex) {
                logger::error("tx {}: rollback failed: {}", tx.signature, rb_ex.what());
            }
            throw storage::storage_error(fmt::format("tx {}: failed to apply {} writes: {}", tx.signature, batch.size(), ex.what()));
        }
        logger::debug("tx {}: applied {} writes", tx.signature, batch.size());
        return parse_result::success;
    }

    void reconciler::handle_logs(const transaction_logs &tx, const seq_window &window)
    {
        if (tx.failed())
            return;
        storage::mutation_batch batch {};
        try {
            batch = collect(tx, window);
        } catch (const parse_error &ex) {
            logger::error("tx {}: failed to parse the logs: {}", tx.signature, ex.what());
            return;
        }
        for (const auto &m: batch) {
            try {
                _store.apply(m);
            } catch (const std::exception &ex) {
                logger::error("tx {}: failed to apply {}: {}", tx.signature, m, ex.what());
            }
        }
    }

    vector<parse_result> reconciler::index_batch(const vector<transaction_logs> &txs, const seq_window &window)
    {
        vector<parse_result> res {};
        res.reserve(txs.size());
        for (const auto &tx: txs) {
            try {
                res.emplace_back(handle_logs_atomic(tx, window));
            } catch (const parse_error &ex) {
                logger::debug("tx {}: malformed logs are reported without writes: {}", tx.signature, ex.what());
                res.emplace_back(parse_result::success);
            }
        }
        return res;
    }
}
