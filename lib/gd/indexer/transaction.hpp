/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_TRANSACTION_HPP
#define GUMDROP_INDEXER_TRANSACTION_HPP

#include <optional>
#include <string>
#include <gd/container.hpp>
#include <gd/json.hpp>

namespace gumdrop::indexer {
    // the log output of one executed transaction as reported by a node
    struct transaction_logs {
        std::string signature {};
        uint64_t slot = 0;
        // the execution error when the transaction failed
        std::optional<std::string> err {};
        vector<std::string> logs {};

        bool failed() const noexcept
        {
            return err.has_value();
        }
    };
    using transaction_list = vector<transaction_logs>;

    // { "signature": "...", "slot": N, "err": null | any, "logs": [ "...", ... ] }
    extern transaction_logs transaction_from_json(const json::value &j);
    // a JSON array of transactions
    extern transaction_list load_transactions(const std::string &path);
}

#endif // !GUMDROP_INDEXER_TRANSACTION_HPP
