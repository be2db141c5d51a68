/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/handlers.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    namespace {
        storage::changelog_row make_changelog_row(const change_log_event &cl, const tx_info &info)
        {
            return { cl.tree_id, cl.seq, cl.index, cl.path, info.tx_id, info.slot };
        }

        storage::leaf_schema_row make_leaf_schema_row(const change_log_event &cl, const leaf_schema_event &ls,
            const tx_info &info, const bool compressed, const bool redeemed)
        {
            storage::leaf_schema_row row {};
            row.asset_id = ls.v1.id;
            row.tree_id = cl.tree_id;
            row.nonce = ls.v1.nonce;
            row.seq = cl.seq;
            row.tx_id = info.tx_id;
            row.slot = info.slot;
            row.owner = ls.v1.owner;
            row.delegate = ls.v1.delegate;
            row.data_hash = ls.v1.data_hash;
            row.creator_hash = ls.v1.creator_hash;
            if (!cl.path.empty())
                row.leaf_hash = cl.path.front().hash;
            else
                logger::warn("changelog of tree {} seq {} has an empty path, the leaf hash is unknown", cl.tree_id, cl.seq);
            row.compressed = compressed;
            row.redeemed = redeemed;
            return row;
        }

        storage::nft_metadata_row make_nft_metadata_row(const pubkey &asset_id, const new_leaf_event &nl)
        {
            const auto &m = nl.metadata;
            return { asset_id, m.name, m.symbol, m.uri, m.seller_fee_basis_points, m.primary_sale_happened, m.is_mutable, m.creators };
        }

        handler_result handle_mint(const instruction_context &ctx, const change_log_event &cl, const event_list &events, storage::mutation_batch &out)
        {
            if (events.size() != 2) {
                logger::warn("tx {}: a mint requires 2 token events but got {}", ctx.info.tx_id, events.size());
                return handler_result::missing_events;
            }
            const auto *nl = events[0].get<new_leaf_event>();
            const auto *ls = events[1].get<leaf_schema_event>();
            if (!nl || !ls) {
                logger::warn("tx {}: a mint requires {} and {} events but got {} and {}", ctx.info.tx_id,
                    new_leaf_event::name, leaf_schema_event::name, events[0].name, events[1].name);
                return handler_result::missing_events;
            }
            out.emplace_back(make_changelog_row(cl, ctx.info));
            out.emplace_back(make_leaf_schema_row(cl, *ls, ctx.info, true, false));
            out.emplace_back(make_nft_metadata_row(ls->v1.id, *nl));
            return handler_result::applied;
        }

        handler_result handle_replace_leaf(const instruction_context &ctx, const change_log_event &cl, const event_list &events,
            storage::mutation_batch &out, const bool compressed, const bool redeemed)
        {
            const auto *ls = events.size() == 1 ? events[0].get<leaf_schema_event>() : nullptr;
            if (!ls) {
                logger::warn("tx {}: a {} instruction requires exactly one {} but got {} events",
                    ctx.info.tx_id, ctx.kind, leaf_schema_event::name, events.size());
                return handler_result::missing_events;
            }
            out.emplace_back(make_changelog_row(cl, ctx.info));
            out.emplace_back(make_leaf_schema_row(cl, *ls, ctx.info, compressed, redeemed));
            return handler_result::applied;
        }

        handler_result handle_decompress(const instruction_context &ctx, const event_list &events, storage::mutation_batch &out)
        {
            const auto *de = events.size() == 1 ? events[0].get<decompression_event>() : nullptr;
            if (!de) {
                logger::warn("tx {}: a decompression requires exactly one {} but got {} events",
                    ctx.info.tx_id, decompression_event::name, events.size());
                return handler_result::missing_events;
            }
            out.emplace_back(storage::decompressed_row { de->id });
            return handler_result::applied;
        }
    }

    event_list domain_events(const log_node &node, const program_registry &programs)
    {
        event_list events {};
        for (const auto &c: node.children) {
            const auto *l = c.line();
            if (!l)
                continue;
            if (const auto *data = std::get_if<data_token>(l); data) {
                if (auto ev = programs.decode_event(node.program_id, *data); ev)
                    events.emplace_back(std::move(*ev));
            }
        }
        return events;
    }

    handler_result handle_instruction(const instruction_context &ctx, storage::mutation_batch &out)
    {
        try {
            if (ctx.kind == instruction_kind::decompress)
                return handle_decompress(ctx, domain_events(ctx.node, ctx.programs), out);
            if (!carries_changelog(ctx.kind)) {
                logger::warn("tx {}: {} instructions are not indexed", ctx.info.tx_id, ctx.kind);
                return handler_result::not_supported;
            }
            const auto cl = ctx.changelogs.find(ctx.node, ctx.kind);
            if (!cl)
                return handler_result::no_changelog;
            if (!ctx.info.window.contains(cl->seq)) {
                logger::debug("tx {}: seq {} of tree {} is outside of the window", ctx.info.tx_id, cl->seq, cl->tree_id);
                return handler_result::outside_window;
            }
            switch (ctx.kind) {
                case instruction_kind::create_tree:
                    out.emplace_back(make_changelog_row(*cl, ctx.info));
                    return handler_result::applied;
                case instruction_kind::mint:
                    return handle_mint(ctx, *cl, domain_events(ctx.node, ctx.programs), out);
                case instruction_kind::redeem:
                    return handle_replace_leaf(ctx, *cl, domain_events(ctx.node, ctx.programs), out, true, true);
                case instruction_kind::transfer:
                case instruction_kind::delegate:
                case instruction_kind::burn:
                case instruction_kind::cancel_redeem:
                    return handle_replace_leaf(ctx, *cl, domain_events(ctx.node, ctx.programs), out, true, false);
                default:
                    throw error(fmt::format("unsupported instruction kind: {}", ctx.kind));
            }
        } catch (const unsupported_version_error &ex) {
            logger::error("tx {}: skipping the {} instruction: {}", ctx.info.tx_id, ctx.kind, ex.what());
            return handler_result::unsupported_version;
        }
    }
}
