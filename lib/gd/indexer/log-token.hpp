/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_LOG_TOKEN_HPP
#define GUMDROP_INDEXER_LOG_TOKEN_HPP

#include <string>
#include <string_view>
#include <variant>
#include <gd/container.hpp>
#include <gd/pubkey.hpp>

namespace gumdrop::indexer {
    struct parse_error: error {
        using error::error;
    };

    // Program <id> invoke [<level>]
    struct invoke_token {
        pubkey program_id {};
        uint32_t level = 0;

        bool operator==(const invoke_token &o) const =default;
    };

    // Program <id> success
    struct success_token {
        pubkey program_id {};

        bool operator==(const success_token &o) const =default;
    };

    // Program data: <base64>
    struct data_token {
        std::string base64 {};

        bool operator==(const data_token &o) const =default;
    };

    // Program log: Instruction: <name>
    struct instruction_token {
        std::string name {};

        bool operator==(const instruction_token &o) const =default;
    };

    struct plain_token {
        std::string text {};

        bool operator==(const plain_token &o) const =default;
    };

    struct truncated_token {
        bool operator==(const truncated_token &o) const =default;
    };

    using log_token = std::variant<invoke_token, success_token, data_token, instruction_token, plain_token, truncated_token>;
    using log_token_list = vector<log_token>;

    static constexpr std::string_view truncated_prefix { "Log truncated" };

    extern log_token tokenize(std::string_view line);
    extern log_token_list tokenize(const vector<std::string> &lines);
    // true when the runtime cut the log output short, the remaining lines cannot be trusted
    extern bool is_truncated(const vector<std::string> &lines);
}

namespace fmt {
    template<>
    struct formatter<gumdrop::indexer::log_token>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace gumdrop::indexer;
            return std::visit([&](const auto &t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, invoke_token>)
                    return fmt::format_to(ctx.out(), "invoke {} [{}]", t.program_id, t.level);
                else if constexpr (std::is_same_v<T, success_token>)
                    return fmt::format_to(ctx.out(), "success {}", t.program_id);
                else if constexpr (std::is_same_v<T, data_token>)
                    return fmt::format_to(ctx.out(), "data {}", t.base64);
                else if constexpr (std::is_same_v<T, instruction_token>)
                    return fmt::format_to(ctx.out(), "instruction {}", t.name);
                else if constexpr (std::is_same_v<T, plain_token>)
                    return fmt::format_to(ctx.out(), "log {}", t.text);
                else
                    return fmt::format_to(ctx.out(), "truncated");
            }, v);
        }
    };
}

#endif // !GUMDROP_INDEXER_LOG_TOKEN_HPP
