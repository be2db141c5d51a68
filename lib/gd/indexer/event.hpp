/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_EVENT_HPP
#define GUMDROP_INDEXER_EVENT_HPP

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <gd/borsh.hpp>
#include <gd/types.hpp>

namespace gumdrop::indexer {
    struct unsupported_version_error: error {
        using error::error;
    };

    struct change_log_event {
        static constexpr std::string_view name { "ChangeLogEvent" };

        pubkey tree_id {};
        // leaf to root, path[0] is the hash of the modified leaf
        path_node_list path {};
        uint64_t seq = 0;
        uint32_t index = 0;

        bool operator==(const change_log_event &o) const =default;
    };

    struct leaf_schema_v1 {
        pubkey id {};
        pubkey owner {};
        pubkey delegate {};
        uint64_t nonce = 0;
        hash_32 data_hash {};
        hash_32 creator_hash {};

        bool operator==(const leaf_schema_v1 &o) const =default;
    };

    struct leaf_schema_event {
        static constexpr std::string_view name { "LeafSchemaEvent" };

        // the only layout known so far, other version tags are rejected at decoding time
        leaf_schema_v1 v1 {};

        bool operator==(const leaf_schema_event &o) const =default;
    };

    struct collection_info {
        bool verified = false;
        pubkey key {};

        bool operator==(const collection_info &o) const =default;
    };

    struct uses_info {
        uint8_t use_method = 0;
        uint64_t remaining = 0;
        uint64_t total = 0;

        bool operator==(const uses_info &o) const =default;
    };

    struct metadata_args {
        std::string name {};
        std::string symbol {};
        std::string uri {};
        uint16_t seller_fee_basis_points = 0;
        bool primary_sale_happened = false;
        bool is_mutable = false;
        std::optional<uint8_t> edition_nonce {};
        std::optional<uint8_t> token_standard {};
        std::optional<collection_info> collection {};
        std::optional<uses_info> uses {};
        uint8_t token_program_version = 0;
        creator_list creators {};

        bool operator==(const metadata_args &o) const =default;
    };

    struct new_leaf_event {
        static constexpr std::string_view name { "NewNFTEvent" };

        uint8_t version = 0;
        metadata_args metadata {};
        uint64_t nonce = 0;

        bool operator==(const new_leaf_event &o) const =default;
    };

    struct decompression_event {
        static constexpr std::string_view name { "NFTDecompressionEvent" };

        uint8_t version = 0;
        pubkey id {};
        pubkey tree_id {};
        uint64_t nonce = 0;

        bool operator==(const decompression_event &o) const =default;
    };

    using event_data = std::variant<change_log_event, leaf_schema_event, new_leaf_event, decompression_event>;

    struct event {
        std::string name {};
        event_data data;

        template<typename T>
        const T *get() const noexcept
        {
            return std::get_if<T>(&data);
        }
    };
    using event_list = vector<event>;

    using discriminator = byte_array<8>;
    // the first eight bytes of sha256("event:" + name)
    extern discriminator event_discriminator(std::string_view event_name);

    // An immutable table of the events a program emits keyed by their discriminators
    struct event_schema {
        using decode_func = std::function<event_data(borsh::decoder &)>;

        event_schema(std::string program_name, std::initializer_list<std::pair<std::string_view, decode_func>> events);

        const std::string &program_name() const noexcept
        {
            return _program_name;
        }

        size_t size() const noexcept
        {
            return _decoders.size();
        }

        // No event for undecodable input, unsupported_version_error for a known event in an unknown layout
        std::optional<event> decode(buffer payload) const;
        std::optional<event> decode_base64(std::string_view text) const;
    private:
        struct entry {
            std::string name;
            decode_func decode;
        };

        std::string _program_name;
        flat_map<discriminator, entry> _decoders {};
    };

    // the changelog schema of the concurrent merkle tree program
    extern const event_schema &tree_program_schema();
    // the leaf, mint and decompression schema of the compressed token program
    extern const event_schema &token_program_schema();

    // The discriminator followed by the Borsh payload, the inverse of event_schema::decode
    extern uint8_vector encode_event(const event_data &ev);
    extern std::string encode_event_base64(const event_data &ev);
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::event>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            return std::visit([&](const auto &e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, change_log_event>)
                    return fmt::format_to(ctx.out(), "{} tree: {} seq: {} index: {} path: {}", v.name, e.tree_id, e.seq, e.index, e.path.size());
                else if constexpr (std::is_same_v<T, leaf_schema_event>)
                    return fmt::format_to(ctx.out(), "{} id: {} owner: {} nonce: {}", v.name, e.v1.id, e.v1.owner, e.v1.nonce);
                else if constexpr (std::is_same_v<T, new_leaf_event>)
                    return fmt::format_to(ctx.out(), "{} name: {} nonce: {}", v.name, e.metadata.name, e.nonce);
                else
                    return fmt::format_to(ctx.out(), "{} id: {} tree: {} nonce: {}", v.name, e.id, e.tree_id, e.nonce);
            }, v.data);
        }
    };
}

#endif // !GUMDROP_INDEXER_EVENT_HPP
