/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <gd/logger.hpp>
#include <gd/storage/memory.hpp>

namespace gumdrop::storage {
    void memory::begin()
    {
        ++_stats.begins;
        if (_snapshot) [[unlikely]]
            throw storage_error("nested transactions are not supported");
        _snapshot.emplace(_state);
    }

    void memory::commit()
    {
        ++_stats.commits;
        if (!_snapshot) [[unlikely]]
            throw storage_error("commit without an active transaction");
        _snapshot.reset();
    }

    void memory::rollback()
    {
        ++_stats.rollbacks;
        if (!_snapshot) [[unlikely]]
            throw storage_error("rollback without an active transaction");
        _state = std::move(*_snapshot);
        _snapshot.reset();
    }

    void memory::upsert_changelog(const changelog_row &row)
    {
        ++_stats.writes;
        _state.changelogs.insert_or_assign(std::make_pair(row.tree_id, row.seq), row);
    }

    void memory::upsert_leaf_schema(const leaf_schema_row &row)
    {
        ++_stats.writes;
        const auto key = std::make_pair(row.tree_id, row.nonce);
        if (const auto it = _state.leaf_schemas.find(key); it != _state.leaf_schemas.end() && it->second.seq > row.seq) {
            logger::debug("ignoring a leaf schema of tree {} nonce {} with seq {} older than the stored seq {}",
                row.tree_id, row.nonce, row.seq, it->second.seq);
            return;
        }
        _state.leaf_schemas.insert_or_assign(key, row);
    }

    void memory::upsert_nft_metadata(const nft_metadata_row &row)
    {
        ++_stats.writes;
        _state.nfts.insert_or_assign(row.asset_id, row);
    }

    void memory::set_decompressed(const pubkey &asset_id)
    {
        ++_stats.writes;
        _state.decompressed.emplace(asset_id);
    }

    std::optional<uint64_t> memory::max_seq(const pubkey &tree_id) const
    {
        auto it = _state.changelogs.lower_bound(std::make_pair(tree_id, std::numeric_limits<uint64_t>::max()));
        if (it != _state.changelogs.end() && it->first.first == tree_id)
            return it->first.second;
        if (it == _state.changelogs.begin())
            return {};
        --it;
        if (it->first.first == tree_id)
            return it->first.second;
        return {};
    }

    seq_gap_list memory::missing_seqs(const pubkey &tree_id, const uint64_t min_seq) const
    {
        seq_gap_list gaps {};
        const changelog_row *prev = nullptr;
        for (auto it = _state.changelogs.lower_bound(std::make_pair(tree_id, min_seq));
                it != _state.changelogs.end() && it->first.first == tree_id; ++it) {
            const auto &curr = it->second;
            if (prev && curr.seq - prev->seq > 1)
                gaps.emplace_back(seq_gap { prev->seq, curr.seq, prev->slot, curr.slot });
            prev = &curr;
        }
        return gaps;
    }

    std::optional<changelog_row> memory::changelog(const pubkey &tree_id, const uint64_t seq) const
    {
        if (const auto it = _state.changelogs.find(std::make_pair(tree_id, seq)); it != _state.changelogs.end())
            return it->second;
        return {};
    }

    std::optional<leaf_schema_row> memory::leaf_schema(const pubkey &tree_id, const uint64_t nonce) const
    {
        if (const auto it = _state.leaf_schemas.find(std::make_pair(tree_id, nonce)); it != _state.leaf_schemas.end())
            return it->second;
        return {};
    }

    std::optional<nft_metadata_row> memory::nft_metadata(const pubkey &asset_id) const
    {
        if (const auto it = _state.nfts.find(asset_id); it != _state.nfts.end())
            return it->second;
        return {};
    }

    bool memory::decompressed(const pubkey &asset_id) const
    {
        return _state.decompressed.contains(asset_id);
    }
}
