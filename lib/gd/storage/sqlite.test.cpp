/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sqlite3.h>
#include <gd/file.hpp>
#include <gd/indexer/test.hpp>
#include <gd/storage/sqlite.hpp>

using namespace gumdrop;
using namespace gumdrop::storage;

namespace {
    changelog_row make_changelog(const pubkey &tree_id, const uint64_t seq, const uint64_t slot)
    {
        const auto cl = indexer::test::changelog(tree_id, seq, static_cast<uint32_t>(seq % 8));
        return { tree_id, seq, cl.index, cl.path, fmt::format("sig-{}", seq), slot };
    }
}

suite storage_sqlite_suite = [] {
    "storage::sqlite"_test = [] {
        const auto tree_id = indexer::test::key(0x11);
        const auto asset_id = indexer::test::key(0x21);
        "changelog round trip"_test = [=] {
            sqlite store { ":memory:" };
            const auto row = make_changelog(tree_id, 3, 42);
            store.upsert_changelog(row);
            store.upsert_changelog(row);
            const auto stored = store.changelog(tree_id, 3);
            expect(stored.has_value());
            if (stored)
                expect(row == *stored);
            expect(!store.changelog(tree_id, 4));
        };
        "seq zero is stored"_test = [=] {
            sqlite store { ":memory:" };
            store.upsert_changelog(make_changelog(tree_id, 0, 1));
            expect(store.max_seq(tree_id) == std::optional<uint64_t> { 0 });
        };
        "max_seq and missing_seqs"_test = [=] {
            sqlite store { ":memory:" };
            expect(!store.max_seq(tree_id));
            for (const uint64_t seq: { 1, 2, 4, 9 })
                store.upsert_changelog(make_changelog(tree_id, seq, 10 * seq));
            store.upsert_changelog(make_changelog(indexer::test::key(0x12), 30, 1));
            test_same(9, *store.max_seq(tree_id));
            const auto gaps = store.missing_seqs(tree_id);
            test_same(2, gaps.size());
            test_same(seq_gap { 2, 4, 20, 40 }, gaps.at(0));
            test_same(seq_gap { 4, 9, 40, 90 }, gaps.at(1));
            test_same(1, store.missing_seqs(tree_id, 3).size());
        };
        "rewriting a changelog replaces its path"_test = [=] {
            sqlite store { ":memory:" };
            auto row = make_changelog(tree_id, 1, 10);
            store.upsert_changelog(row);
            row.path.resize(1);
            row.path.at(0).index = 999;
            row.slot = 11;
            store.upsert_changelog(row);
            const auto stored = store.changelog(tree_id, 1);
            expect(stored.has_value());
            if (stored) {
                test_same(1, stored->path.size());
                expect(row == *stored);
            }
            expect(store.missing_seqs(tree_id).empty());
        };
        "conflicting slots"_test = [=] {
            const auto path = fmt::format("{}/gumdrop-sqlite-slots-test.db", std::filesystem::temp_directory_path().string());
            for (const auto suffix: { "", "-wal", "-shm" })
                std::filesystem::remove(path + suffix);
            sqlite store { path };
            store.upsert_changelog(make_changelog(tree_id, 1, 10));
            {
                // another writer records the same seq at a different slot
                sqlite3 *raw = nullptr;
                expect(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
                const auto sql = fmt::format("INSERT INTO merkle (tree_id, seq, node_idx, level, hash, leaf_index, transaction_id, slot)"
                    " VALUES ('{}', 1, 999, 0, '{}', 1, 'sig-other', 11)", tree_id, base58::encode(indexer::test::hash(0x55)));
                expect(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
                sqlite3_close(raw);
            }
            expect(throws<storage_error>([&] { static_cast<void>(store.missing_seqs(tree_id)); }));
        };
        "leaf schema replay guard"_test = [=] {
            sqlite store { ":memory:" };
            leaf_schema_row row {};
            row.asset_id = asset_id;
            row.tree_id = tree_id;
            row.nonce = 7;
            row.seq = 10;
            row.tx_id = "sig-10";
            row.slot = 5;
            row.owner = indexer::test::key(0x31);
            row.delegate = indexer::test::key(0x32);
            row.data_hash = indexer::test::hash(0xDA);
            row.creator_hash = indexer::test::hash(0xC4);
            row.leaf_hash = indexer::test::hash(0x1F);
            store.upsert_leaf_schema(row);
            expect(store.leaf_schema(tree_id, 7) == row);
            auto older = row;
            older.seq = 9;
            older.owner = indexer::test::key(0x33);
            store.upsert_leaf_schema(older);
            expect(store.leaf_schema(tree_id, 7) == row);
            auto newer = row;
            newer.seq = 11;
            newer.redeemed = true;
            store.upsert_leaf_schema(newer);
            expect(store.leaf_schema(tree_id, 7) == newer);
            expect(!store.leaf_schema(tree_id, 8));
        };
        "nft metadata with creators"_test = [=] {
            sqlite store { ":memory:" };
            const nft_metadata_row nft { asset_id, "Gum #1", "GUM", "https://example.com/1.json", 500, true, false, {
                creator { indexer::test::key(0x77), true, 60 },
                creator { indexer::test::key(0x78), false, 40 }
            } };
            store.upsert_nft_metadata(nft);
            const auto stored = store.nft_metadata(asset_id);
            expect(stored.has_value());
            if (stored)
                expect(nft == *stored);
            expect(!store.nft_metadata(indexer::test::key(0x22)));
        };
        "decompressed"_test = [=] {
            sqlite store { ":memory:" };
            expect(!store.decompressed(asset_id));
            store.set_decompressed(asset_id);
            store.set_decompressed(asset_id);
            expect(store.decompressed(asset_id));
        };
        "transactions"_test = [=] {
            sqlite store { ":memory:" };
            store.begin();
            store.upsert_changelog(make_changelog(tree_id, 1, 1));
            store.rollback();
            expect(!store.changelog(tree_id, 1));
            store.begin();
            store.apply(mutation_batch { make_changelog(tree_id, 1, 1), decompressed_row { asset_id } });
            store.commit();
            expect(store.changelog(tree_id, 1).has_value());
            expect(store.decompressed(asset_id));
            expect(throws<storage_error>([&] { store.commit(); }));
        };
        "reconcile into a database file"_test = [=] {
            const auto path = fmt::format("{}/gumdrop-sqlite-test.db", std::filesystem::temp_directory_path().string());
            for (const auto suffix: { "", "-wal", "-shm" })
                std::filesystem::remove(path + suffix);
            {
                sqlite store { path };
                indexer::reconciler r { store, indexer::test::programs() };
                test_same(indexer::parse_result::success, r.handle_logs_atomic(indexer::test::tx("sig-create", indexer::test::create_tree_logs(tree_id, 0))));
                test_same(indexer::parse_result::success, r.handle_logs_atomic(indexer::test::tx("sig-mint",
                    indexer::test::mint_logs(tree_id, 1, asset_id, 0, indexer::test::key(0x31)))));
            }
            sqlite store { path };
            test_same(1, *store.max_seq(tree_id));
            expect(store.missing_seqs(tree_id).empty());
            const auto nft = store.nft_metadata(asset_id);
            expect(nft.has_value() && nft->name == "Gum #1" && nft->creators.size() == 1);
            const auto ls = store.leaf_schema(tree_id, 0);
            expect(ls.has_value() && ls->owner == indexer::test::key(0x31) && ls->seq == 1);
        };
    };
};
