/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/dispatcher.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    instruction_kind classify(const std::string_view name)
    {
        static const map<std::string_view, instruction_kind> kinds {
            { "CreateTree", instruction_kind::create_tree },
            { "Mint", instruction_kind::mint },
            { "MintV1", instruction_kind::mint },
            { "Transfer", instruction_kind::transfer },
            { "Delegate", instruction_kind::delegate },
            { "Burn", instruction_kind::burn },
            { "Redeem", instruction_kind::redeem },
            { "CancelRedeem", instruction_kind::cancel_redeem },
            { "Decompress", instruction_kind::decompress },
            { "DecompressV1", instruction_kind::decompress },
            { "Compress", instruction_kind::compress }
        };
        if (const auto it = kinds.find(name); it != kinds.end())
            return it->second;
        return instruction_kind::unknown;
    }

    instruction_kind classify(const log_node &node)
    {
        if (const auto name = node.instruction_name(); name)
            return classify(*name);
        return instruction_kind::unknown;
    }

    static void dispatch_node(const log_node &node, const pubkey &token_program_id, const instruction_observer &observer, size_t &cnt)
    {
        if (node.program_id == token_program_id) {
            const auto kind = classify(node);
            if (kind == instruction_kind::unknown) {
                logger::warn("an unrecognized instruction {} of {} at depth {}", node.instruction_name(), node.program_id, node.depth);
                return;
            }
            logger::trace("instruction {} of {} at depth {}", kind, node.program_id, node.depth);
            ++cnt;
            observer(node, kind);
            return;
        }
        for (const auto &c: node.children) {
            if (const auto *child = c.node(); child)
                dispatch_node(*child, token_program_id, observer, cnt);
        }
    }

    size_t dispatch(const log_tree &tree, const pubkey &token_program_id, const instruction_observer &observer)
    {
        size_t cnt = 0;
        for (const auto &n: tree)
            dispatch_node(n, token_program_id, observer, cnt);
        return cnt;
    }
}
