/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/indexer/dispatcher.hpp>
#include <gd/indexer/test.hpp>

using namespace gumdrop;
using namespace gumdrop::indexer;

suite indexer_dispatcher_suite = [] {
    "indexer::dispatcher"_test = [] {
        "classify"_test = [] {
            test_same(instruction_kind::create_tree, classify("CreateTree"));
            test_same(instruction_kind::mint, classify("Mint"));
            test_same(instruction_kind::mint, classify("MintV1"));
            test_same(instruction_kind::transfer, classify("Transfer"));
            test_same(instruction_kind::delegate, classify("Delegate"));
            test_same(instruction_kind::burn, classify("Burn"));
            test_same(instruction_kind::redeem, classify("Redeem"));
            test_same(instruction_kind::cancel_redeem, classify("CancelRedeem"));
            test_same(instruction_kind::decompress, classify("Decompress"));
            test_same(instruction_kind::decompress, classify("DecompressV1"));
            test_same(instruction_kind::compress, classify("Compress"));
            test_same(instruction_kind::unknown, classify("transfer"));
            test_same(instruction_kind::unknown, classify(""));
        };
        "token program at the top level and as a CPI"_test = [] {
            const auto outer = test::key(0x42);
            vector<std::string> logs {};
            test::append(logs, test::create_tree_logs(test::key(0x11), 0));
            logs.emplace_back(test::invoke(outer, 1));
            logs.emplace_back("Program log: marketplace purchase");
            test::append(logs, test::replace_leaf_logs("Transfer", test::key(0x11), 2, test::key(0x21), 0, test::key(0x31), 2));
            logs.emplace_back(test::success(outer));
            const auto tree = parse_logs(logs);
            vector<std::pair<instruction_kind, size_t>> seen {};
            const auto cnt = dispatch(tree, test::token_program(), [&](const log_node &node, const instruction_kind kind) {
                seen.emplace_back(kind, node.depth);
            });
            test_same(2, cnt);
            test_same(2, seen.size());
            test_same(instruction_kind::create_tree, seen.at(0).first);
            test_same(0, seen.at(0).second);
            test_same(instruction_kind::transfer, seen.at(1).first);
            test_same(1, seen.at(1).second);
        };
        "unknown and missing instruction names are skipped"_test = [] {
            const auto tree = parse_logs(vector<std::string> {
                test::invoke(test::token_program(), 1), test::instruction("SetTreeDelegate"), test::success(test::token_program()),
                test::invoke(test::token_program(), 1), "Program log: no instruction", test::success(test::token_program()),
                test::invoke(test::token_program(), 1), test::success(test::token_program())
            });
            size_t calls = 0;
            test_same(0, dispatch(tree, test::token_program(), [&](const auto &, const auto) { ++calls; }));
            test_same(0, calls);
        };
        "other programs are ignored"_test = [] {
            const auto tree = parse_logs(test::create_tree_logs(test::key(0x11), 0));
            test_same(0, dispatch(tree, test::key(0x99), [](const auto &, const auto) {}));
        };
    };
};
