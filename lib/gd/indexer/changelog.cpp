/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/changelog.hpp>
#include <gd/logger.hpp>

namespace gumdrop::indexer {
    bool carries_changelog(const instruction_kind kind)
    {
        switch (kind) {
            case instruction_kind::decompress:
            case instruction_kind::compress:
            case instruction_kind::unknown:
                return false;
            default:
                return true;
        }
    }

    changelog_extractor::changelog_extractor(const log_tree &tree, const program_registry &programs):
        _programs { programs }, _tree_program_id { programs.program_id(program_role::tree) },
        _token_program_id { programs.program_id(program_role::token) }
    {
        size_t order = 0;
        for (const auto &n: tree)
            _index(n, order, nullptr);
    }

    void changelog_extractor::_index(const log_node &node, size_t &order, const log_node *owner)
    {
        const auto first = order++;
        if (node.program_id == _tree_program_id)
            _invocations.emplace_back(tree_invocation { &node, first, owner });
        const auto *child_owner = node.program_id == _token_program_id ? &node : owner;
        for (const auto &c: node.children) {
            if (const auto *child = c.node(); child)
                _index(*child, order, child_owner);
        }
        _spans.try_emplace(&node, node_span { first, order - 1 });
    }

    std::optional<change_log_event> changelog_extractor::_decode_line(const log_line &line) const
    {
        const auto *data = std::get_if<data_token>(&line);
        if (!data)
            return {};
        auto ev = _programs.decode_event(_tree_program_id, *data);
        if (!ev)
            return {};
        if (auto *cl = std::get_if<change_log_event>(&ev->data); cl)
            return std::move(*cl);
        return {};
    }

    std::optional<change_log_event> changelog_extractor::_claim_from(const log_node &node, const bool own_lines)
    {
        vector<const log_line *> lines {};
        for (const auto &c: node.children) {
            if (const auto *l = c.line(); l)
                lines.emplace_back(l);
        }
        // the canonical position first then any other payload line from the end
        if (!own_lines && lines.size() >= 2) {
            const auto *l = lines[lines.size() - 2];
            if (!_claimed.contains(l)) {
                if (auto cl = _decode_line(*l); cl) {
                    _claimed.emplace(l);
                    return cl;
                }
            }
        }
        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            if (_claimed.contains(*it))
                continue;
            if (auto cl = _decode_line(**it); cl) {
                _claimed.emplace(*it);
                return cl;
            }
        }
        return {};
    }

    std::optional<change_log_event> changelog_extractor::find(const log_node &instruction, const instruction_kind kind)
    {
        if (!carries_changelog(kind))
            return {};
        const auto span_it = _spans.find(&instruction);
        if (span_it == _spans.end()) [[unlikely]]
            throw error(fmt::format("the instruction node of {} does not belong to this transaction", instruction.program_id));
        const auto &span = span_it->second;
        for (const auto &inv: _invocations) {
            if (inv.order > span.first && inv.order <= span.last) {
                if (auto cl = _claim_from(*inv.node, false); cl)
                    return cl;
            }
        }
        if (auto cl = _claim_from(instruction, true); cl)
            return cl;
        for (const auto &inv: _invocations) {
            if (!inv.owner && inv.order > span.last) {
                if (auto cl = _claim_from(*inv.node, false); cl)
                    return cl;
            }
        }
        for (auto it = _invocations.rbegin(); it != _invocations.rend(); ++it) {
            if (!it->owner && it->order < span.first) {
                if (auto cl = _claim_from(*it->node, false); cl)
                    return cl;
            }
        }
        logger::warn("no changelog found for the {} instruction of {}", kind, instruction.program_id);
        return {};
    }
}
