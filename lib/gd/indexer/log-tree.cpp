/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/log-tree.hpp>

namespace gumdrop::indexer {
    std::optional<std::string_view> log_node::instruction_name() const
    {
        if (!children.empty()) {
            if (const auto *l = children.front().line(); l) {
                if (const auto *ins = std::get_if<instruction_token>(l); ins)
                    return ins->name;
            }
        }
        return {};
    }

    size_t log_node::line_count() const
    {
        size_t cnt = 0;
        for (const auto &c: children) {
            if (c.line())
                ++cnt;
        }
        return cnt;
    }

    static log_line to_line(log_token &&t)
    {
        if (auto *d = std::get_if<data_token>(&t); d)
            return std::move(*d);
        if (auto *i = std::get_if<instruction_token>(&t); i)
            return std::move(*i);
        if (auto *p = std::get_if<plain_token>(&t); p)
            return std::move(*p);
        throw parse_error(fmt::format("not a log line token: {}", t));
    }

    log_tree parse_logs(const log_token_list &tokens)
    {
        log_tree roots {};
        vector<log_node> stack {};
        for (size_t i = 0; i < tokens.size(); ++i) {
            auto tok = tokens[i];
            if (const auto *inv = std::get_if<invoke_token>(&tok); inv) {
                if (inv->level != stack.size() + 1) [[unlikely]]
                    throw parse_error(fmt::format("line {}: invocation of {} at level {} while the current level is {}",
                        i, inv->program_id, inv->level, stack.size()));
                stack.emplace_back(log_node { inv->program_id, stack.size() });
            } else if (const auto *succ = std::get_if<success_token>(&tok); succ) {
                if (stack.empty()) [[unlikely]]
                    throw parse_error(fmt::format("line {}: success of {} without a matching invocation", i, succ->program_id));
                if (stack.back().program_id != succ->program_id) [[unlikely]]
                    throw parse_error(fmt::format("line {}: unexpected program id finished: expected {} but got {}",
                        i, stack.back().program_id, succ->program_id));
                auto node = std::move(stack.back());
                stack.pop_back();
                if (stack.empty())
                    roots.emplace_back(std::move(node));
                else
                    stack.back().children.emplace_back(std::make_unique<log_node>(std::move(node)));
            } else if (std::holds_alternative<truncated_token>(tok)) {
                throw parse_error(fmt::format("line {}: the log is truncated", i));
            } else {
                if (stack.empty()) [[unlikely]]
                    throw parse_error(fmt::format("line {}: log line outside of any program invocation: {}", i, tok));
                stack.back().children.emplace_back(to_line(std::move(tok)));
            }
        }
        if (!stack.empty()) [[unlikely]]
            throw parse_error(fmt::format("the invocation of {} at level {} is not terminated", stack.back().program_id, stack.back().depth + 1));
        return roots;
    }

    log_tree parse_logs(const vector<std::string> &lines)
    {
        return parse_logs(tokenize(lines));
    }

    static void count_nodes(const log_node &n, size_t &cnt)
    {
        ++cnt;
        for (const auto &c: n.children) {
            if (const auto *child = c.node(); child)
                count_nodes(*child, cnt);
        }
    }

    size_t node_count(const log_tree &tree)
    {
        size_t cnt = 0;
        for (const auto &n: tree)
            count_nodes(n, cnt);
        return cnt;
    }

    static void collect_lines(const log_node &n, vector<const log_line *> &out)
    {
        for (const auto &c: n.children) {
            if (const auto *l = c.line(); l)
                out.emplace_back(l);
            else
                collect_lines(*c.node(), out);
        }
    }

    vector<const log_line *> flatten_lines(const log_tree &tree)
    {
        vector<const log_line *> res {};
        for (const auto &n: tree)
            collect_lines(n, res);
        return res;
    }

    static void describe_node(const log_node &n, std::string &out)
    {
        const std::string indent(n.depth * 2, ' ');
        out += fmt::format("{}{}\n", indent, n.program_id);
        for (const auto &c: n.children) {
            if (const auto *l = c.line(); l)
                out += std::visit([&](const auto &t) { return fmt::format("{}  {}\n", indent, log_token { t }); }, *l);
            else
                describe_node(*c.node(), out);
        }
    }

    std::string describe(const log_tree &tree)
    {
        std::string res {};
        for (const auto &n: tree)
            describe_node(n, res);
        return res;
    }
}
