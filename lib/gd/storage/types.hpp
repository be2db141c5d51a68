/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_STORAGE_TYPES_HPP
#define GUMDROP_STORAGE_TYPES_HPP

#include <string>
#include <variant>
#include <gd/types.hpp>

namespace gumdrop::storage {
    // keyed by (tree_id, seq)
    struct changelog_row {
        pubkey tree_id {};
        uint64_t seq = 0;
        uint32_t leaf_index = 0;
        path_node_list path {};
        std::string tx_id {};
        uint64_t slot = 0;

        bool operator==(const changelog_row &o) const =default;
    };

    // keyed by (tree_id, nonce)
    struct leaf_schema_row {
        pubkey asset_id {};
        pubkey tree_id {};
        uint64_t nonce = 0;
        uint64_t seq = 0;
        std::string tx_id {};
        uint64_t slot = 0;
        pubkey owner {};
        pubkey delegate {};
        hash_32 data_hash {};
        hash_32 creator_hash {};
        hash_32 leaf_hash {};
        bool compressed = true;
        bool redeemed = false;

        bool operator==(const leaf_schema_row &o) const =default;
    };

    // keyed by asset_id
    struct nft_metadata_row {
        pubkey asset_id {};
        std::string name {};
        std::string symbol {};
        std::string uri {};
        uint16_t seller_fee_basis_points = 0;
        bool primary_sale_happened = false;
        bool is_mutable = false;
        creator_list creators {};

        bool operator==(const nft_metadata_row &o) const =default;
    };

    struct decompressed_row {
        pubkey asset_id {};

        bool operator==(const decompressed_row &o) const =default;
    };

    using mutation = std::variant<changelog_row, leaf_schema_row, nft_metadata_row, decompressed_row>;
    using mutation_batch = vector<mutation>;

    // two consecutive stored sequence numbers of a tree that are more than one apart
    struct seq_gap {
        uint64_t prev_seq = 0;
        uint64_t curr_seq = 0;
        uint64_t prev_slot = 0;
        uint64_t curr_slot = 0;

        bool operator==(const seq_gap &o) const =default;
    };
    using seq_gap_list = vector<seq_gap>;
}

namespace fmt {
    template<>
    struct formatter<gumdrop::storage::seq_gap>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "seq {}..{} slot {}..{}", v.prev_seq, v.curr_seq, v.prev_slot, v.curr_slot);
        }
    };

    template<>
    struct formatter<gumdrop::storage::mutation>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::storage;
            return std::visit([&](const auto &r) {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, changelog_row>)
                    return fmt::format_to(ctx.out(), "changelog tree: {} seq: {}", r.tree_id, r.seq);
                else if constexpr (std::is_same_v<T, leaf_schema_row>)
                    return fmt::format_to(ctx.out(), "leaf_schema tree: {} nonce: {} seq: {}", r.tree_id, r.nonce, r.seq);
                else if constexpr (std::is_same_v<T, nft_metadata_row>)
                    return fmt::format_to(ctx.out(), "nft_metadata asset: {}", r.asset_id);
                else
                    return fmt::format_to(ctx.out(), "decompressed asset: {}", r.asset_id);
            }, v);
        }
    };
}

#endif // !GUMDROP_STORAGE_TYPES_HPP
