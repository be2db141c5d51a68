/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sqlite3.h>
#include <gd/logger.hpp>
#include <gd/storage/sqlite.hpp>

namespace gumdrop::storage {
    namespace {
        static constexpr size_t nft_creator_slots = 5;

        const char *schema_sql = R"(
            CREATE TABLE IF NOT EXISTS merkle (
                tree_id TEXT NOT NULL,
                seq INTEGER NOT NULL,
                node_idx INTEGER NOT NULL,
                level INTEGER NOT NULL,
                hash TEXT NOT NULL,
                leaf_index INTEGER NOT NULL,
                transaction_id TEXT NOT NULL,
                slot INTEGER NOT NULL,
                PRIMARY KEY (tree_id, seq, node_idx)
            );
            CREATE INDEX IF NOT EXISTS merkle_tree_level ON merkle (tree_id, seq, level);
            CREATE TABLE IF NOT EXISTS leaf_schema (
                asset_id TEXT NOT NULL,
                tree_id TEXT NOT NULL,
                nonce INTEGER NOT NULL,
                seq INTEGER NOT NULL,
                transaction_id TEXT NOT NULL,
                slot INTEGER NOT NULL,
                owner TEXT NOT NULL,
                delegate TEXT NOT NULL,
                data_hash TEXT NOT NULL,
                creator_hash TEXT NOT NULL,
                leaf_hash TEXT NOT NULL,
                compressed BOOLEAN NOT NULL,
                redeemed BOOLEAN NOT NULL,
                PRIMARY KEY (tree_id, nonce)
            );
            CREATE TABLE IF NOT EXISTS nft (
                asset_id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                symbol TEXT NOT NULL,
                uri TEXT NOT NULL,
                seller_fee_basis_points INTEGER NOT NULL,
                primary_sale_happened BOOLEAN NOT NULL,
                is_mutable BOOLEAN NOT NULL,
                creator0 TEXT, share0 INTEGER, verified0 BOOLEAN,
                creator1 TEXT, share1 INTEGER, verified1 BOOLEAN,
                creator2 TEXT, share2 INTEGER, verified2 BOOLEAN,
                creator3 TEXT, share3 INTEGER, verified3 BOOLEAN,
                creator4 TEXT, share4 INTEGER, verified4 BOOLEAN
            );
            CREATE TABLE IF NOT EXISTS decompressed (
                asset_id TEXT PRIMARY KEY
            );
        )";

        struct statement {
            statement(sqlite3 *db, const char *sql): _db { db }
            {
                if (sqlite3_prepare_v2(_db, sql, -1, &_stmt, nullptr) != SQLITE_OK) [[unlikely]]
                    throw storage_error(fmt::format("failed to prepare an SQL statement: {}", sqlite3_errmsg(_db)));
            }

            ~statement()
            {
                if (_stmt)
                    sqlite3_finalize(_stmt);
            }

            statement(const statement &) =delete;
            statement &operator=(const statement &) =delete;

            statement &bind(const int idx, const uint64_t val)
            {
                return _check_bind(sqlite3_bind_int64(_stmt, idx, static_cast<sqlite3_int64>(val)));
            }

            statement &bind(const int idx, const bool val)
            {
                return _check_bind(sqlite3_bind_int(_stmt, idx, val ? 1 : 0));
            }

            statement &bind(const int idx, const std::string &val)
            {
                return _check_bind(sqlite3_bind_text(_stmt, idx, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT));
            }

            statement &bind(const int idx, const buffer val)
            {
                return bind(idx, base58::encode(val));
            }

            // true while rows are available
            bool step()
            {
                switch (const auto rc = sqlite3_step(_stmt); rc) {
                    case SQLITE_ROW: return true;
                    case SQLITE_DONE: return false;
                    default: throw storage_error(fmt::format("SQL statement failed: {}", sqlite3_errmsg(_db)));
                }
            }

            void reset()
            {
                sqlite3_reset(_stmt);
                sqlite3_clear_bindings(_stmt);
            }

            void step_done()
            {
                if (step()) [[unlikely]]
                    throw storage_error("an SQL statement returned rows when none were expected");
            }

            bool column_null(const int idx) const
            {
                return sqlite3_column_type(_stmt, idx) == SQLITE_NULL;
            }

            uint64_t column_uint(const int idx) const
            {
                return static_cast<uint64_t>(sqlite3_column_int64(_stmt, idx));
            }

            bool column_bool(const int idx) const
            {
                return sqlite3_column_int(_stmt, idx) != 0;
            }

            std::string column_text(const int idx) const
            {
                const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(_stmt, idx));
                if (!text)
                    return {};
                return { text, static_cast<size_t>(sqlite3_column_bytes(_stmt, idx)) };
            }

            pubkey column_pubkey(const int idx) const
            {
                return pubkey::from_base58(column_text(idx));
            }

            hash_32 column_hash(const int idx) const
            {
                return hash_32 { static_cast<buffer>(base58::decode(column_text(idx))) };
            }
        private:
            sqlite3 *_db;
            sqlite3_stmt *_stmt = nullptr;

            statement &_check_bind(const int rc)
            {
                if (rc != SQLITE_OK) [[unlikely]]
                    throw storage_error(fmt::format("failed to bind an SQL parameter: {}", sqlite3_errmsg(_db)));
                return *this;
            }
        };
    }

    sqlite::sqlite(const std::string &path): _path { path }
    {
        if (sqlite3_open(_path.c_str(), &_db) != SQLITE_OK) [[unlikely]] {
            const std::string msg { _db ? sqlite3_errmsg(_db) : "out of memory" };
            sqlite3_close(_db);
            _db = nullptr;
            throw storage_error(fmt::format("failed to open the database {}: {}", _path, msg));
        }
        try {
            _exec("PRAGMA journal_mode=WAL");
            _exec(schema_sql);
        } catch (...) {
            sqlite3_close(_db);
            _db = nullptr;
            throw;
        }
        logger::debug("opened the database {}", _path);
    }

    sqlite::~sqlite()
    {
        if (_in_tx) {
            logger::warn("the database {} is closed with an open transaction, rolling back", _path);
            if (sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
                logger::error("rollback of {} failed: {}", _path, sqlite3_errmsg(_db));
        }
        sqlite3_close(_db);
    }

    void sqlite::_exec(const char *sql)
    {
        char *err = nullptr;
        if (sqlite3_exec(_db, sql, nullptr, nullptr, &err) != SQLITE_OK) [[unlikely]] {
            const std::string msg { err ? err : sqlite3_errmsg(_db) };
            sqlite3_free(err);
            throw storage_error(fmt::format("SQL execution failed on {}: {}", _path, msg));
        }
    }

    void sqlite::begin()
    {
        if (_in_tx) [[unlikely]]
            throw storage_error("nested transactions are not supported");
        _exec("BEGIN TRANSACTION");
        _in_tx = true;
    }

    void sqlite::commit()
    {
        if (!_in_tx) [[unlikely]]
            throw storage_error("commit without an active transaction");
        _exec("COMMIT");
        _in_tx = false;
    }

    void sqlite::rollback()
    {
        if (!_in_tx) [[unlikely]]
            throw storage_error("rollback without an active transaction");
        _in_tx = false;
        _exec("ROLLBACK");
    }

    void sqlite::upsert_changelog(const changelog_row &row)
    {
        if (row.path.empty())
            logger::warn("the changelog of tree {} seq {} has an empty path and leaves no rows", row.tree_id, row.seq);
        const auto tree_id = row.tree_id.to_base58();
        // a repeated write replaces the whole path
        _exec("SAVEPOINT upsert_changelog");
        try {
            statement del { _db, "DELETE FROM merkle WHERE tree_id = ? AND seq = ?" };
            del.bind(1, tree_id).bind(2, row.seq);
            del.step_done();
            statement stmt { _db, R"(
                INSERT INTO merkle (tree_id, seq, node_idx, level, hash, leaf_index, transaction_id, slot)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?)
            )" };
            for (size_t level = 0; level < row.path.size(); ++level) {
                const auto &node = row.path[level];
                stmt.bind(1, tree_id).bind(2, row.seq).bind(3, uint64_t { node.index }).bind(4, uint64_t { level })
                    .bind(5, static_cast<buffer>(node.hash)).bind(6, uint64_t { row.leaf_index })
                    .bind(7, row.tx_id).bind(8, row.slot);
                stmt.step_done();
                stmt.reset();
            }
        } catch (const std::exception &ex) {
            logger::error("changelog of tree {} seq {}: reverting a partial write: {}", row.tree_id, row.seq, ex.what());
            _exec("ROLLBACK TO upsert_changelog");
            _exec("RELEASE upsert_changelog");
            throw;
        }
        _exec("RELEASE upsert_changelog");
    }

    void sqlite::upsert_leaf_schema(const leaf_schema_row &row)
    {
        // an older replay never overwrites newer state
        statement stmt { _db, R"(
            INSERT INTO leaf_schema (asset_id, tree_id, nonce, seq, transaction_id, slot, owner, delegate,
                data_hash, creator_hash, leaf_hash, compressed, redeemed)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT (tree_id, nonce) DO UPDATE SET
                asset_id = excluded.asset_id,
                seq = excluded.seq,
                transaction_id = excluded.transaction_id,
                slot = excluded.slot,
                owner = excluded.owner,
                delegate = excluded.delegate,
                data_hash = excluded.data_hash,
                creator_hash = excluded.creator_hash,
                leaf_hash = excluded.leaf_hash,
                compressed = excluded.compressed,
                redeemed = excluded.redeemed
            WHERE excluded.seq >= leaf_schema.seq
        )" };
        stmt.bind(1, row.asset_id.to_base58()).bind(2, row.tree_id.to_base58()).bind(3, row.nonce).bind(4, row.seq)
            .bind(5, row.tx_id).bind(6, row.slot).bind(7, row.owner.to_base58()).bind(8, row.delegate.to_base58())
            .bind(9, static_cast<buffer>(row.data_hash)).bind(10, static_cast<buffer>(row.creator_hash))
            .bind(11, static_cast<buffer>(row.leaf_hash)).bind(12, row.compressed).bind(13, row.redeemed);
        stmt.step_done();
    }

    void sqlite::upsert_nft_metadata(const nft_metadata_row &row)
    {
        statement stmt { _db, R"(
            INSERT INTO nft (asset_id, name, symbol, uri, seller_fee_basis_points, primary_sale_happened, is_mutable,
                creator0, share0, verified0, creator1, share1, verified1, creator2, share2, verified2,
                creator3, share3, verified3, creator4, share4, verified4)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT (asset_id) DO UPDATE SET
                name = excluded.name, symbol = excluded.symbol, uri = excluded.uri,
                seller_fee_basis_points = excluded.seller_fee_basis_points,
                primary_sale_happened = excluded.primary_sale_happened, is_mutable = excluded.is_mutable,
                creator0 = excluded.creator0, share0 = excluded.share0, verified0 = excluded.verified0,
                creator1 = excluded.creator1, share1 = excluded.share1, verified1 = excluded.verified1,
                creator2 = excluded.creator2, share2 = excluded.share2, verified2 = excluded.verified2,
                creator3 = excluded.creator3, share3 = excluded.share3, verified3 = excluded.verified3,
                creator4 = excluded.creator4, share4 = excluded.share4, verified4 = excluded.verified4
        )" };
        stmt.bind(1, row.asset_id.to_base58()).bind(2, row.name).bind(3, row.symbol).bind(4, row.uri)
            .bind(5, uint64_t { row.seller_fee_basis_points }).bind(6, row.primary_sale_happened).bind(7, row.is_mutable);
        if (row.creators.size() > nft_creator_slots)
            logger::warn("asset {} has {} creators, only the first {} are stored", row.asset_id, row.creators.size(), nft_creator_slots);
        // unused creator slots hold the system program address
        static const creator empty_creator {};
        for (size_t i = 0; i < nft_creator_slots; ++i) {
            const auto &c = i < row.creators.size() ? row.creators[i] : empty_creator;
            const auto base = static_cast<int>(8 + i * 3);
            stmt.bind(base, c.address.to_base58()).bind(base + 1, uint64_t { c.share }).bind(base + 2, c.verified);
        }
        stmt.step_done();
    }

    void sqlite::set_decompressed(const pubkey &asset_id)
    {
        statement stmt { _db, "INSERT INTO decompressed (asset_id) VALUES (?) ON CONFLICT (asset_id) DO NOTHING" };
        stmt.bind(1, asset_id.to_base58());
        stmt.step_done();
    }

    std::optional<uint64_t> sqlite::max_seq(const pubkey &tree_id) const
    {
        statement stmt { _db, "SELECT max(seq) FROM merkle WHERE tree_id = ?" };
        stmt.bind(1, tree_id.to_base58());
        if (stmt.step() && !stmt.column_null(0))
            return stmt.column_uint(0);
        return {};
    }

    seq_gap_list sqlite::missing_seqs(const pubkey &tree_id, const uint64_t min_seq) const
    {
        statement stmt { _db, "SELECT DISTINCT seq, slot FROM merkle WHERE tree_id = ? AND seq >= ? ORDER BY seq" };
        stmt.bind(1, tree_id.to_base58()).bind(2, min_seq);
        seq_gap_list gaps {};
        std::optional<std::pair<uint64_t, uint64_t>> prev {};
        while (stmt.step()) {
            const auto seq = stmt.column_uint(0);
            const auto slot = stmt.column_uint(1);
            if (prev) {
                if (seq == prev->first) [[unlikely]]
                    throw storage_error(fmt::format("tree {} has seq {} recorded with different slots: {} and {}",
                        tree_id, seq, prev->second, slot));
                if (seq - prev->first > 1)
                    gaps.emplace_back(seq_gap { prev->first, seq, prev->second, slot });
            }
            prev.emplace(seq, slot);
        }
        return gaps;
    }

    std::optional<changelog_row> sqlite::changelog(const pubkey &tree_id, const uint64_t seq) const
    {
        statement stmt { _db, R"(
            SELECT node_idx, hash, leaf_index, transaction_id, slot FROM merkle
            WHERE tree_id = ? AND seq = ? ORDER BY level
        )" };
        stmt.bind(1, tree_id.to_base58()).bind(2, seq);
        std::optional<changelog_row> row {};
        while (stmt.step()) {
            if (!row) {
                row.emplace();
                row->tree_id = tree_id;
                row->seq = seq;
                row->leaf_index = static_cast<uint32_t>(stmt.column_uint(2));
                row->tx_id = stmt.column_text(3);
                row->slot = stmt.column_uint(4);
            }
            row->path.emplace_back(path_node { stmt.column_hash(1), static_cast<uint32_t>(stmt.column_uint(0)) });
        }
        return row;
    }

    std::optional<leaf_schema_row> sqlite::leaf_schema(const pubkey &tree_id, const uint64_t nonce) const
    {
        statement stmt { _db, R"(
            SELECT asset_id, seq, transaction_id, slot, owner, delegate, data_hash, creator_hash, leaf_hash, compressed, redeemed
            FROM leaf_schema WHERE tree_id = ? AND nonce = ?
        )" };
        stmt.bind(1, tree_id.to_base58()).bind(2, nonce);
        if (!stmt.step())
            return {};
        leaf_schema_row row {};
        row.tree_id = tree_id;
        row.nonce = nonce;
        row.asset_id = stmt.column_pubkey(0);
        row.seq = stmt.column_uint(1);
        row.tx_id = stmt.column_text(2);
        row.slot = stmt.column_uint(3);
        row.owner = stmt.column_pubkey(4);
        row.delegate = stmt.column_pubkey(5);
        row.data_hash = stmt.column_hash(6);
        row.creator_hash = stmt.column_hash(7);
        row.leaf_hash = stmt.column_hash(8);
        row.compressed = stmt.column_bool(9);
        row.redeemed = stmt.column_bool(10);
        return row;
    }

    std::optional<nft_metadata_row> sqlite::nft_metadata(const pubkey &asset_id) const
    {
        statement stmt { _db, R"(
            SELECT name, symbol, uri, seller_fee_basis_points, primary_sale_happened, is_mutable,
                creator0, share0, verified0, creator1, share1, verified1, creator2, share2, verified2,
                creator3, share3, verified3, creator4, share4, verified4
            FROM nft WHERE asset_id = ?
        )" };
        stmt.bind(1, asset_id.to_base58());
        if (!stmt.step())
            return {};
        nft_metadata_row row {};
        row.asset_id = asset_id;
        row.name = stmt.column_text(0);
        row.symbol = stmt.column_text(1);
        row.uri = stmt.column_text(2);
        row.seller_fee_basis_points = static_cast<uint16_t>(stmt.column_uint(3));
        row.primary_sale_happened = stmt.column_bool(4);
        row.is_mutable = stmt.column_bool(5);
        static const creator empty_creator {};
        for (size_t i = 0; i < nft_creator_slots; ++i) {
            const auto base = static_cast<int>(6 + i * 3);
            creator c { stmt.column_pubkey(base), stmt.column_bool(base + 2), static_cast<uint8_t>(stmt.column_uint(base + 1)) };
            // padding slots are not reported back
            if (c != empty_creator)
                row.creators.emplace_back(std::move(c));
        }
        return row;
    }

    bool sqlite::decompressed(const pubkey &asset_id) const
    {
        statement stmt { _db, "SELECT 1 FROM decompressed WHERE asset_id = ?" };
        stmt.bind(1, asset_id.to_base58());
        return stmt.step();
    }
}
