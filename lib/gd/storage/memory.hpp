/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_STORAGE_MEMORY_HPP
#define GUMDROP_STORAGE_MEMORY_HPP

#include <gd/storage/storage.hpp>

namespace gumdrop::storage {
    // Ordered in-memory tables, begin() takes a snapshot that rollback() restores
    struct memory: storage {
        struct call_stats {
            size_t begins = 0;
            size_t commits = 0;
            size_t rollbacks = 0;
            size_t writes = 0;

            size_t total() const noexcept
            {
                return begins + commits + rollbacks + writes;
            }
        };

        void begin() override;
        void commit() override;
        void rollback() override;

        void upsert_changelog(const changelog_row &row) override;
        void upsert_leaf_schema(const leaf_schema_row &row) override;
        void upsert_nft_metadata(const nft_metadata_row &row) override;
        void set_decompressed(const pubkey &asset_id) override;

        std::optional<uint64_t> max_seq(const pubkey &tree_id) const override;
        seq_gap_list missing_seqs(const pubkey &tree_id, uint64_t min_seq=0) const override;
        std::optional<changelog_row> changelog(const pubkey &tree_id, uint64_t seq) const override;

        std::optional<leaf_schema_row> leaf_schema(const pubkey &tree_id, uint64_t nonce) const;
        std::optional<nft_metadata_row> nft_metadata(const pubkey &asset_id) const;
        bool decompressed(const pubkey &asset_id) const;

        size_t changelog_count() const noexcept
        {
            return _state.changelogs.size();
        }

        size_t leaf_schema_count() const noexcept
        {
            return _state.leaf_schemas.size();
        }

        size_t nft_metadata_count() const noexcept
        {
            return _state.nfts.size();
        }

        bool in_transaction() const noexcept
        {
            return _snapshot.has_value();
        }

        const call_stats &stats() const noexcept
        {
            return _stats;
        }
    private:
        struct state {
            map<std::pair<pubkey, uint64_t>, changelog_row> changelogs {};
            map<std::pair<pubkey, uint64_t>, leaf_schema_row> leaf_schemas {};
            map<pubkey, nft_metadata_row> nfts {};
            set<pubkey> decompressed {};
        };

        state _state {};
        std::optional<state> _snapshot {};
        call_stats _stats {};
    };
}

#endif // !GUMDROP_STORAGE_MEMORY_HPP
