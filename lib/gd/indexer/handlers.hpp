/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_HANDLERS_HPP
#define GUMDROP_INDEXER_HANDLERS_HPP

#include <gd/indexer/changelog.hpp>
#include <gd/storage/types.hpp>

namespace gumdrop::indexer {
    // the backfill window is exclusive on both ends
    struct seq_window {
        std::optional<uint64_t> start_seq {};
        std::optional<uint64_t> end_seq {};

        bool contains(const uint64_t seq) const noexcept
        {
            return !(start_seq && seq <= *start_seq) && !(end_seq && seq >= *end_seq);
        }
    };

    struct tx_info {
        std::string tx_id {};
        uint64_t slot = 0;
        seq_window window {};
    };

    enum class handler_result {
        applied, outside_window, no_changelog, missing_events, unsupported_version, not_supported
    };

    struct instruction_context {
        const log_node &node;
        instruction_kind kind;
        const tx_info &info;
        const program_registry &programs;
        changelog_extractor &changelogs;
    };

    // Domain events emitted directly by the instruction's invocation, nested invocations are not searched
    extern event_list domain_events(const log_node &node, const program_registry &programs);

    // Appends the writes of one instruction to the batch, never throws for missing or unexpected events
    extern handler_result handle_instruction(const instruction_context &ctx, storage::mutation_batch &out);
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::handler_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            switch (v) {
                case handler_result::applied: return fmt::format_to(ctx.out(), "applied");
                case handler_result::outside_window: return fmt::format_to(ctx.out(), "outside_window");
                case handler_result::no_changelog: return fmt::format_to(ctx.out(), "no_changelog");
                case handler_result::missing_events: return fmt::format_to(ctx.out(), "missing_events");
                case handler_result::unsupported_version: return fmt::format_to(ctx.out(), "unsupported_version");
                case handler_result::not_supported: return fmt::format_to(ctx.out(), "not_supported");
                default: throw gumdrop::error(fmt::format("unsupported handler_result value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GUMDROP_INDEXER_HANDLERS_HPP
