/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/storage/storage.hpp>

namespace gumdrop::storage {
    void storage::apply(const mutation &m)
    {
        std::visit([&](const auto &row) {
            using T = std::decay_t<decltype(row)>;
            if constexpr (std::is_same_v<T, changelog_row>)
                upsert_changelog(row);
            else if constexpr (std::is_same_v<T, leaf_schema_row>)
                upsert_leaf_schema(row);
            else if constexpr (std::is_same_v<T, nft_metadata_row>)
                upsert_nft_metadata(row);
            else
                set_decompressed(row.asset_id);
        }, m);
    }

    void storage::apply(const mutation_batch &batch)
    {
        for (const auto &m: batch)
            apply(m);
    }
}
