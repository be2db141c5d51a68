/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/changelog.hpp>
#include <gd/indexer/test.hpp>

using namespace gumdrop;
using namespace gumdrop::indexer;

suite indexer_changelog_suite = [] {
    "indexer::changelog"_test = [] {
        const auto tree_id = test::key(0x11);
        "nested in the instruction"_test = [=] {
            const auto tree = parse_logs(test::mint_logs(tree_id, 5, test::key(0x21), 0, test::key(0x31)));
            changelog_extractor ext { tree, test::programs() };
            const auto cl = ext.find(tree.at(0), instruction_kind::mint);
            expect(cl.has_value());
            if (cl) {
                test_same(5, cl->seq);
                test_same(tree_id, cl->tree_id);
            }
            test_same(1, ext.claimed());
        };
        "deeply nested"_test = [=] {
            const auto helper = test::key(0x43);
            vector<std::string> logs {
                test::invoke(test::token_program(), 1),
                test::instruction("Transfer"),
                test::data(test::leaf_schema(test::key(0x21), 0, test::key(0x31))),
                "Program log: checking the proof",
                test::invoke(helper, 2)
            };
            test::append(logs, test::tree_call(test::changelog(tree_id, 8), 3));
            test::append(logs, { test::success(helper), test::success(test::token_program()) });
            const auto tree = parse_logs(logs);
            changelog_extractor ext { tree, test::programs() };
            const auto cl = ext.find(tree.at(0), instruction_kind::transfer);
            expect(cl.has_value() && cl->seq == 8);
        };
        "in the instruction's own lines"_test = [=] {
            const auto tree = parse_logs(vector<std::string> {
                test::invoke(test::token_program(), 1),
                test::instruction("CreateTree"),
                test::data(test::changelog(tree_id, 0)),
                test::success(test::token_program())
            });
            changelog_extractor ext { tree, test::programs() };
            const auto cl = ext.find(tree.at(0), instruction_kind::create_tree);
            expect(cl.has_value() && cl->seq == 0);
        };
        "after and before the instruction"_test = [=] {
            vector<std::string> logs {
                test::invoke(test::token_program(), 1), test::instruction("Transfer"), test::success(test::token_program())
            };
            test::append(logs, test::tree_call(test::changelog(tree_id, 3), 1));
            test::append(logs, { test::invoke(test::token_program(), 1), test::instruction("Delegate"), test::success(test::token_program()) });
            const auto tree = parse_logs(logs);
            changelog_extractor ext { tree, test::programs() };
            const auto first = ext.find(tree.at(0), instruction_kind::transfer);
            expect(first.has_value() && first->seq == 3);
            // the only changelog has been claimed already
            expect(!ext.find(tree.at(2), instruction_kind::delegate));
        };
        "preceding changelog"_test = [=] {
            auto logs = test::tree_call(test::changelog(tree_id, 4), 1);
            test::append(logs, { test::invoke(test::token_program(), 1), test::instruction("Burn"), test::success(test::token_program()) });
            const auto tree = parse_logs(logs);
            changelog_extractor ext { tree, test::programs() };
            const auto cl = ext.find(tree.at(1), instruction_kind::burn);
            expect(cl.has_value() && cl->seq == 4);
        };
        "siblings claim their own changelogs"_test = [=] {
            auto logs = test::replace_leaf_logs("Transfer", tree_id, 10, test::key(0x21), 0, test::key(0x31));
            test::append(logs, test::replace_leaf_logs("Transfer", tree_id, 11, test::key(0x22), 1, test::key(0x32)));
            const auto tree = parse_logs(logs);
            changelog_extractor ext { tree, test::programs() };
            const auto second = ext.find(tree.at(1), instruction_kind::transfer);
            const auto first = ext.find(tree.at(0), instruction_kind::transfer);
            expect(first.has_value() && first->seq == 10);
            expect(second.has_value() && second->seq == 11);
            test_same(2, ext.claimed());
        };
        "changelogs of sibling instructions are not taken"_test = [=] {
            vector<std::string> logs {
                test::invoke(test::token_program(), 1), test::instruction("Transfer"),
                test::data(test::leaf_schema(test::key(0x21), 0, test::key(0x31))), test::success(test::token_program())
            };
            test::append(logs, test::mint_logs(tree_id, 7, test::key(0x22), 1, test::key(0x32)));
            auto before = test::replace_leaf_logs("Burn", tree_id, 6, test::key(0x23), 2, test::key(0x33));
            test::append(before, logs);
            const auto tree = parse_logs(before);
            test_same(3, tree.size());
            changelog_extractor ext { tree, test::programs() };
            expect(!ext.find(tree.at(1), instruction_kind::transfer));
            const auto mint = ext.find(tree.at(2), instruction_kind::mint);
            expect(mint.has_value() && mint->seq == 7);
            const auto burn = ext.find(tree.at(0), instruction_kind::burn);
            expect(burn.has_value() && burn->seq == 6);
            test_same(2, ext.claimed());
        };
        "no changelog for decompression"_test = [=] {
            const auto tree = parse_logs(test::mint_logs(tree_id, 5, test::key(0x21), 0, test::key(0x31)));
            changelog_extractor ext { tree, test::programs() };
            expect(!carries_changelog(instruction_kind::decompress));
            expect(!carries_changelog(instruction_kind::compress));
            expect(carries_changelog(instruction_kind::create_tree));
            expect(!ext.find(tree.at(0), instruction_kind::decompress));
            test_same(0, ext.claimed());
        };
        "missing changelog"_test = [=] {
            const auto tree = parse_logs(vector<std::string> {
                test::invoke(test::token_program(), 1), test::instruction("Transfer"), test::success(test::token_program())
            });
            changelog_extractor ext { tree, test::programs() };
            expect(!ext.find(tree.at(0), instruction_kind::transfer));
        };
        "foreign node"_test = [=] {
            const auto tree = parse_logs(test::create_tree_logs(tree_id, 0));
            const auto other = parse_logs(test::create_tree_logs(tree_id, 1));
            changelog_extractor ext { tree, test::programs() };
            expect(throws([&] { static_cast<void>(ext.find(other.at(0), instruction_kind::create_tree)); }));
        };
    };
};
