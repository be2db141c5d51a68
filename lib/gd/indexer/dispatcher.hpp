/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_DISPATCHER_HPP
#define GUMDROP_INDEXER_DISPATCHER_HPP

#include <functional>
#include <gd/indexer/log-tree.hpp>

namespace gumdrop::indexer {
    enum class instruction_kind {
        unknown, create_tree, mint, transfer, delegate, burn, redeem, cancel_redeem, decompress, compress
    };

    extern instruction_kind classify(std::string_view instruction_name);
    // unknown when the first line of the node is not an instruction marker
    extern instruction_kind classify(const log_node &node);

    using instruction_observer = std::function<void(const log_node &, instruction_kind)>;

    // Visits every invocation of the token program, including those nested under unrelated programs.
    // The children of a token-program invocation are not searched further.
    extern size_t dispatch(const log_tree &tree, const pubkey &token_program_id, const instruction_observer &observer);
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::instruction_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            switch (v) {
                case instruction_kind::unknown: return fmt::format_to(ctx.out(), "unknown");
                case instruction_kind::create_tree: return fmt::format_to(ctx.out(), "create_tree");
                case instruction_kind::mint: return fmt::format_to(ctx.out(), "mint");
                case instruction_kind::transfer: return fmt::format_to(ctx.out(), "transfer");
                case instruction_kind::delegate: return fmt::format_to(ctx.out(), "delegate");
                case instruction_kind::burn: return fmt::format_to(ctx.out(), "burn");
                case instruction_kind::redeem: return fmt::format_to(ctx.out(), "redeem");
                case instruction_kind::cancel_redeem: return fmt::format_to(ctx.out(), "cancel_redeem");
                case instruction_kind::decompress: return fmt::format_to(ctx.out(), "decompress");
                case instruction_kind::compress: return fmt::format_to(ctx.out(), "compress");
                default: throw gumdrop::error(fmt::format("unsupported instruction_kind value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GUMDROP_INDEXER_DISPATCHER_HPP
