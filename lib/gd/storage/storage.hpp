/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_STORAGE_STORAGE_HPP
#define GUMDROP_STORAGE_STORAGE_HPP

#include <optional>
#include <gd/storage/types.hpp>

namespace gumdrop::storage {
    struct storage_error: error {
        using error::error;
    };

    /*
     * All upserts are idempotent per key.
     * A leaf schema with a lower seq than the stored one for the same (tree_id, nonce) is ignored.
     */
    struct storage {
        virtual ~storage() =default;

        virtual void begin() =0;
        virtual void commit() =0;
        virtual void rollback() =0;

        virtual void upsert_changelog(const changelog_row &row) =0;
        virtual void upsert_leaf_schema(const leaf_schema_row &row) =0;
        virtual void upsert_nft_metadata(const nft_metadata_row &row) =0;
        virtual void set_decompressed(const pubkey &asset_id) =0;

        [[nodiscard]] virtual std::optional<uint64_t> max_seq(const pubkey &tree_id) const =0;
        [[nodiscard]] virtual seq_gap_list missing_seqs(const pubkey &tree_id, uint64_t min_seq=0) const =0;
        [[nodiscard]] virtual std::optional<changelog_row> changelog(const pubkey &tree_id, uint64_t seq) const =0;

        void apply(const mutation &m);
        void apply(const mutation_batch &batch);
    };
}

#endif // !GUMDROP_STORAGE_STORAGE_HPP
