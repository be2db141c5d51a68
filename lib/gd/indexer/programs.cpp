/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/programs.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    static_program_registry static_program_registry::from_config(const config &cfg)
    {
        const auto tree_id = pubkey::from_base58(cfg.get("treeProgramId", default_tree_program_id));
        const auto token_id = pubkey::from_base58(cfg.get("tokenProgramId", default_token_program_id));
        logger::debug("tree program: {} token program: {}", tree_id, token_id);
        return { tree_id, token_id };
    }

    static_program_registry::static_program_registry():
        static_program_registry { pubkey::from_base58(default_tree_program_id), pubkey::from_base58(default_token_program_id) }
    {
    }

    static_program_registry::static_program_registry(const pubkey &tree_program_id, const pubkey &token_program_id):
        _tree_program_id { tree_program_id }, _token_program_id { token_program_id }
    {
        if (_tree_program_id == _token_program_id) [[unlikely]]
            throw error(fmt::format("the tree and token programs must differ but both are {}", _tree_program_id));
    }

    const pubkey &static_program_registry::program_id(const program_role role) const
    {
        switch (role) {
            case program_role::tree: return _tree_program_id;
            case program_role::token: return _token_program_id;
            default: throw error(fmt::format("unsupported program role: {}", role));
        }
    }

    const event_schema *static_program_registry::schema(const pubkey &program_id) const
    {
        if (program_id == _tree_program_id)
            return &tree_program_schema();
        if (program_id == _token_program_id)
            return &token_program_schema();
        return nullptr;
    }
}
