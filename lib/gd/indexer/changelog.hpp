/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_INDEXER_CHANGELOG_HPP
#define GUMDROP_INDEXER_CHANGELOG_HPP

#include <gd/indexer/dispatcher.hpp>
#include <gd/indexer/programs.hpp>

namespace gumdrop::indexer {
    // decompression and compression leave the tree untouched
    extern bool carries_changelog(instruction_kind kind);

    /*
     * Locates the changelog emitted by the tree program on behalf of an instruction.
     * The tree program reports it on the second-to-last line of its invocation.
     * Candidates are considered in this order:
     * 1) tree-program invocations nested inside the instruction in depth-first order,
     * 2) the instruction's own lines,
     * 3) tree-program invocations that follow the instruction,
     * 4) tree-program invocations that precede it, nearest first.
     * Steps 3 and 4 consider only invocations outside of any token-program instruction.
     * A changelog is handed out at most once, so sibling instructions never share one.
     */
    struct changelog_extractor {
        changelog_extractor(const log_tree &tree, const program_registry &programs);

        std::optional<change_log_event> find(const log_node &instruction, instruction_kind kind);

        size_t claimed() const noexcept
        {
            return _claimed.size();
        }
    private:
        struct tree_invocation {
            const log_node *node;
            size_t order;
            // the nearest token-program invocation containing this one, if any
            const log_node *owner = nullptr;
        };
        struct node_span {
            size_t first;
            size_t last;
        };

        const program_registry &_programs;
        const pubkey &_tree_program_id;
        const pubkey &_token_program_id;
        vector<tree_invocation> _invocations {};
        map<const log_node *, node_span> _spans {};
        set<const log_line *> _claimed {};

        void _index(const log_node &node, size_t &order, const log_node *owner);
        std::optional<change_log_event> _decode_line(const log_line &line) const;
        std::optional<change_log_event> _claim_from(const log_node &node, bool own_lines);
    };
}

#endif // !GUMDROP_INDEXER_CHANGELOG_HPP
