/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_PROGRAMS_HPP
#define GUMDROP_INDEXER_PROGRAMS_HPP

#include <gd/config.hpp>
#include <gd/indexer/event.hpp>
#include <gd/indexer/log-token.hpp>

namespace gumdrop::indexer {
    enum class program_role {
        tree, token
    };

    struct program_registry {
        virtual ~program_registry() =default;

        [[nodiscard]] virtual const pubkey &program_id(program_role role) const =0;
        // nullptr for programs without a known event schema
        [[nodiscard]] virtual const event_schema *schema(const pubkey &program_id) const =0;

        std::optional<event> decode_event(const pubkey &program_id, const data_token &data) const
        {
            if (const auto *s = schema(program_id); s)
                return s->decode_base64(data.base64);
            return {};
        }

        std::optional<event> decode_event(const program_role role, const data_token &data) const
        {
            return decode_event(program_id(role), data);
        }
    };

    struct static_program_registry: program_registry {
        static constexpr std::string_view default_tree_program_id { "GRoLLMza82AiYN7W9S9KCCtCyyPRAQP2ifBy4v4D5RMD" };
        static constexpr std::string_view default_token_program_id { "BGUMzZr2wWfD2yzrXFEWTK2HbdYhqQCP2EZoPEkZBD6o" };

        // reads treeProgramId and tokenProgramId, the original deployment addresses are used when absent
        static static_program_registry from_config(const config &cfg);

        static_program_registry();
        static_program_registry(const pubkey &tree_program_id, const pubkey &token_program_id);

        const pubkey &program_id(program_role role) const override;
        const event_schema *schema(const pubkey &program_id) const override;
    private:
        pubkey _tree_program_id;
        pubkey _token_program_id;
    };
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::program_role>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            switch (v) {
                case program_role::tree: return fmt::format_to(ctx.out(), "tree");
                case program_role::token: return fmt::format_to(ctx.out(), "token");
                default: throw gumdrop::error(fmt::format("unsupported program_role value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !GUMDROP_INDEXER_PROGRAMS_HPP
