/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_LOG_TREE_HPP
#define GUMDROP_INDEXER_LOG_TREE_HPP

#include <memory>
#include <gd/indexer/log-token.hpp>

namespace gumdrop::indexer {
    using log_line = std::variant<data_token, instruction_token, plain_token>;

    struct log_node;

    // a child of a program invocation: either a log line or a nested invocation
    struct log_item {
        explicit log_item(log_line &&l): _val { std::move(l) }
        {
        }

        explicit log_item(std::unique_ptr<log_node> &&n): _val { std::move(n) }
        {
        }

        const log_line *line() const noexcept
        {
            return std::get_if<log_line>(&_val);
        }

        const log_node *node() const noexcept
        {
            if (const auto *n = std::get_if<std::unique_ptr<log_node>>(&_val); n)
                return n->get();
            return nullptr;
        }
    private:
        std::variant<log_line, std::unique_ptr<log_node>> _val;
    };

    struct log_node {
        pubkey program_id {};
        // zero for top-level invocations, one less than the level reported by the runtime
        size_t depth = 0;
        vector<log_item> children {};

        // the name from the first child line when it is an instruction marker
        std::optional<std::string_view> instruction_name() const;
        size_t line_count() const;
    };
    using log_tree = vector<log_node>;

    // Builds the invocation tree of a transaction in a single pass, throws parse_error on malformed input
    extern log_tree parse_logs(const log_token_list &tokens);
    extern log_tree parse_logs(const vector<std::string> &lines);

    extern size_t node_count(const log_tree &tree);
    // Lines of all invocations in depth-first order, reproduces the order of non-marker lines of the source
    extern vector<const log_line *> flatten_lines(const log_tree &tree);
    extern std::string describe(const log_tree &tree);
}

#endif // !GUMDROP_INDEXER_LOG_TREE_HPP
