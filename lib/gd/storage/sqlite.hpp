/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_STORAGE_SQLITE_HPP
#define GUMDROP_STORAGE_SQLITE_HPP

#include <gd/storage/storage.hpp>

struct sqlite3;

namespace gumdrop::storage {
    /*
     * A SQLite database in WAL mode. Changelog paths are stored one row per node,
     * keys and hashes are stored in base58. The schema is created on open when missing.
     */
    struct sqlite: storage {
        // ":memory:" opens a private in-memory database
        explicit sqlite(const std::string &path);
        ~sqlite() override;

        sqlite(const sqlite &) =delete;
        sqlite &operator=(const sqlite &) =delete;

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

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        sqlite3 *_db = nullptr;
        bool _in_tx = false;

        void _exec(const char *sql);
    };
}

#endif // !GUMDROP_STORAGE_SQLITE_HPP
