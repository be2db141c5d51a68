/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/transaction.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    transaction_logs transaction_from_json(const json::value &j)
    {
        const auto &obj = j.as_object();
        transaction_logs tx {};
        tx.signature = json::value_to<std::string>(obj.at("signature"));
        tx.slot = json::optional_uint64(obj, "slot").value_or(0);
        if (const auto *err = obj.if_contains("err"); err && !err->is_null())
            tx.err = err->is_string() ? std::string { err->as_string() } : json::serialize(*err);
        for (const auto &l: obj.at("logs").as_array())
            tx.logs.emplace_back(json::value_to<std::string>(l));
        return tx;
    }

    transaction_list load_transactions(const std::string &path)
    {
        const auto j = json::load(path);
        transaction_list txs {};
        for (const auto &tx_j: j.as_array()) {
            try {
                txs.emplace_back(transaction_from_json(tx_j));
            } catch (const std::exception &ex) {
                throw error(fmt::format("{}: invalid transaction #{}", path, txs.size()), ex);
            }
        }
        logger::info("loaded {} transactions from {}", txs.size(), path);
        return txs;
    }
}
