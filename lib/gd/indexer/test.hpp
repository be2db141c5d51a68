/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_TEST_HPP
#define GUMDROP_INDEXER_TEST_HPP

#include <gd/indexer/reconciler.hpp>
#include <gd/test.hpp>

// Builders of synthetic transaction logs shared by the indexer tests
namespace gumdrop::indexer::test {
    inline pubkey key(const uint8_t b)
    {
        pubkey k {};
        k.fill(b);
        return k;
    }

    inline hash_32 hash(const uint8_t b)
    {
        hash_32 h {};
        h.fill(b);
        return h;
    }

    inline const static_program_registry &programs()
    {
        static const static_program_registry r {};
        return r;
    }

    inline const pubkey &tree_program()
    {
        return programs().program_id(program_role::tree);
    }

    inline const pubkey &token_program()
    {
        return programs().program_id(program_role::token);
    }

    inline std::string invoke(const pubkey &id, const uint32_t level)
    {
        return fmt::format("Program {} invoke [{}]", id, level);
    }

    inline std::string success(const pubkey &id)
    {
        return fmt::format("Program {} success", id);
    }

    inline std::string consumed(const pubkey &id)
    {
        return fmt::format("Program {} consumed 2000 of 200000 compute units", id);
    }

    inline std::string instruction(const std::string_view name)
    {
        return fmt::format("Program log: Instruction: {}", name);
    }

    inline std::string data(const event_data &ev)
    {
        return fmt::format("Program data: {}", encode_event_base64(ev));
    }

    inline change_log_event changelog(const pubkey &tree_id, const uint64_t seq, const uint32_t leaf_index=0, const size_t depth=3)
    {
        change_log_event cl { tree_id, {}, seq, leaf_index };
        uint32_t node_idx = (1U << depth) + leaf_index;
        for (size_t level = 0; level <= depth; ++level, node_idx >>= 1)
            cl.path.emplace_back(path_node { hash(static_cast<uint8_t>(seq * 16 + level)), node_idx });
        return cl;
    }

    inline leaf_schema_event leaf_schema(const pubkey &asset_id, const uint64_t nonce, const pubkey &owner)
    {
        return { leaf_schema_v1 { asset_id, owner, owner, nonce, hash(0xDA), hash(0xC4) } };
    }

    inline new_leaf_event new_leaf(const std::string &name, const uint64_t nonce)
    {
        new_leaf_event ev {};
        ev.version = 0;
        ev.nonce = nonce;
        ev.metadata.name = name;
        ev.metadata.symbol = "GUM";
        ev.metadata.uri = "https://example.com/gum.json";
        ev.metadata.seller_fee_basis_points = 500;
        ev.metadata.is_mutable = true;
        ev.metadata.creators.emplace_back(creator { key(0x77), true, 100 });
        return ev;
    }

    // a nested call of the tree program reporting the changelog on its second-to-last line
    inline vector<std::string> tree_call(const change_log_event &cl, const uint32_t level)
    {
        return {
            invoke(tree_program(), level),
            instruction("Append"),
            data(cl),
            consumed(tree_program()),
            success(tree_program())
        };
    }

    inline void append(vector<std::string> &logs, const vector<std::string> &more)
    {
        logs.insert(logs.end(), more.begin(), more.end());
    }

    inline vector<std::string> create_tree_logs(const pubkey &tree_id, const uint64_t seq, const uint32_t level=1)
    {
        vector<std::string> logs { invoke(token_program(), level), instruction("CreateTree") };
        append(logs, tree_call(changelog(tree_id, seq), level + 1));
        append(logs, { consumed(token_program()), success(token_program()) });
        return logs;
    }

    inline vector<std::string> mint_logs(const pubkey &tree_id, const uint64_t seq, const pubkey &asset_id, const uint64_t nonce,
        const pubkey &owner, const uint32_t level=1)
    {
        vector<std::string> logs {
            invoke(token_program(), level),
            instruction("MintV1"),
            "Program log: minting a compressed asset",
            data(new_leaf("Gum #1", nonce)),
            data(leaf_schema(asset_id, nonce, owner))
        };
        append(logs, tree_call(changelog(tree_id, seq, static_cast<uint32_t>(nonce)), level + 1));
        append(logs, { consumed(token_program()), success(token_program()) });
        return logs;
    }

    inline vector<std::string> replace_leaf_logs(const std::string_view name, const pubkey &tree_id, const uint64_t seq,
        const pubkey &asset_id, const uint64_t nonce, const pubkey &owner, const uint32_t level=1)
    {
        vector<std::string> logs { invoke(token_program(), level), instruction(name), data(leaf_schema(asset_id, nonce, owner)) };
        append(logs, tree_call(changelog(tree_id, seq, static_cast<uint32_t>(nonce)), level + 1));
        append(logs, { consumed(token_program()), success(token_program()) });
        return logs;
    }

    inline transaction_logs tx(const std::string &signature, vector<std::string> logs, const uint64_t slot=100)
    {
        return { signature, slot, {}, std::move(logs) };
    }
}

#endif // !GUMDROP_INDEXER_TEST_HPP
