/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/test.hpp>
#include <gd/storage/memory.hpp>

using namespace gumdrop;
using namespace gumdrop::storage;

namespace {
    changelog_row make_changelog(const pubkey &tree_id, const uint64_t seq, const uint64_t slot)
    {
        const auto cl = indexer::test::changelog(tree_id, seq);
        return { tree_id, seq, cl.index, cl.path, fmt::format("sig-{}", seq), slot };
    }

    leaf_schema_row make_leaf_schema(const pubkey &tree_id, const uint64_t nonce, const uint64_t seq, const pubkey &owner)
    {
        leaf_schema_row row {};
        row.asset_id = indexer::test::key(0x21);
        row.tree_id = tree_id;
        row.nonce = nonce;
        row.seq = seq;
        row.owner = owner;
        row.delegate = owner;
        return row;
    }
}

suite storage_memory_suite = [] {
    "storage::memory"_test = [] {
        const auto tree_id = indexer::test::key(0x11);
        "changelog upserts are idempotent"_test = [=] {
            memory store {};
            const auto row = make_changelog(tree_id, 0, 10);
            store.upsert_changelog(row);
            store.upsert_changelog(row);
            test_same(1, store.changelog_count());
            expect(store.changelog(tree_id, 0) == row);
            expect(!store.changelog(tree_id, 1));
            expect(!store.changelog(indexer::test::key(0x12), 0));
        };
        "max_seq"_test = [=] {
            memory store {};
            expect(!store.max_seq(tree_id));
            store.upsert_changelog(make_changelog(indexer::test::key(0x10), 50, 1));
            store.upsert_changelog(make_changelog(indexer::test::key(0x12), 70, 1));
            expect(!store.max_seq(tree_id));
            store.upsert_changelog(make_changelog(tree_id, 3, 1));
            store.upsert_changelog(make_changelog(tree_id, 0, 1));
            test_same(3, *store.max_seq(tree_id));
            test_same(50, *store.max_seq(indexer::test::key(0x10)));
            test_same(70, *store.max_seq(indexer::test::key(0x12)));
        };
        "missing_seqs"_test = [=] {
            memory store {};
            for (const uint64_t seq: { 0, 1, 2, 5, 6, 10 })
                store.upsert_changelog(make_changelog(tree_id, seq, 100 + seq));
            store.upsert_changelog(make_changelog(indexer::test::key(0x12), 20, 1));
            const auto gaps = store.missing_seqs(tree_id);
            test_same(2, gaps.size());
            test_same(seq_gap { 2, 5, 102, 105 }, gaps.at(0));
            test_same(seq_gap { 6, 10, 106, 110 }, gaps.at(1));
            const auto late = store.missing_seqs(tree_id, 5);
            test_same(1, late.size());
            test_same(seq_gap { 6, 10, 106, 110 }, late.at(0));
            expect(store.missing_seqs(indexer::test::key(0x13)).empty());
        };
        "stale leaf schemas are ignored"_test = [=] {
            memory store {};
            store.upsert_leaf_schema(make_leaf_schema(tree_id, 0, 5, indexer::test::key(0x31)));
            store.upsert_leaf_schema(make_leaf_schema(tree_id, 0, 4, indexer::test::key(0x32)));
            test_same(indexer::test::key(0x31), store.leaf_schema(tree_id, 0)->owner);
            store.upsert_leaf_schema(make_leaf_schema(tree_id, 0, 6, indexer::test::key(0x33)));
            test_same(indexer::test::key(0x33), store.leaf_schema(tree_id, 0)->owner);
            test_same(1, store.leaf_schema_count());
        };
        "metadata and decompression"_test = [=] {
            memory store {};
            const auto asset_id = indexer::test::key(0x21);
            nft_metadata_row nft { asset_id, "Gum", "GUM", "https://example.com", 250, false, true,
                { creator { indexer::test::key(0x77), true, 100 } } };
            store.upsert_nft_metadata(nft);
            nft.name = "Gum v2";
            store.upsert_nft_metadata(nft);
            test_same(1, store.nft_metadata_count());
            expect(store.nft_metadata(asset_id) == nft);
            expect(!store.decompressed(asset_id));
            store.set_decompressed(asset_id);
            store.set_decompressed(asset_id);
            expect(store.decompressed(asset_id));
        };
        "transactions"_test = [=] {
            memory store {};
            store.upsert_changelog(make_changelog(tree_id, 0, 1));
            store.begin();
            expect(store.in_transaction());
            expect(throws<storage_error>([&] { store.begin(); }));
            store.apply(mutation_batch { make_changelog(tree_id, 1, 2), decompressed_row { indexer::test::key(0x21) } });
            test_same(2, store.changelog_count());
            store.rollback();
            expect(!store.in_transaction());
            test_same(1, store.changelog_count());
            expect(!store.decompressed(indexer::test::key(0x21)));
            store.begin();
            store.apply(make_changelog(tree_id, 1, 2));
            store.commit();
            test_same(2, store.changelog_count());
            expect(throws<storage_error>([&] { store.commit(); }));
            expect(throws<storage_error>([&] { store.rollback(); }));
        };
    };
};
