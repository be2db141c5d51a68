/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/base64.hpp>
#include <gd/indexer/event.hpp>
#include <gd/indexer/test.hpp>

using namespace gumdrop;
using namespace gumdrop::indexer;

suite indexer_event_suite = [] {
    "indexer::event"_test = [] {
        "discriminators"_test = [] {
            test_same(discriminator::from_hex("9541DA107E5775AF"), event_discriminator("ChangeLogEvent"));
            test_same(discriminator::from_hex("C4239DC28F32AAAB"), event_discriminator("NewNFTEvent"));
            test_same(discriminator::from_hex("388B9AA4CCAA4ECC"), event_discriminator("LeafSchemaEvent"));
            test_same(discriminator::from_hex("FFFE7B6AED50C66B"), event_discriminator("NFTDecompressionEvent"));
        };
        "schemas"_test = [] {
            test_same(1, tree_program_schema().size());
            test_same(3, token_program_schema().size());
            test_same(std::string { "tree-program" }, tree_program_schema().program_name());
            test_same(std::string { "token-program" }, token_program_schema().program_name());
        };
        "change log"_test = [] {
            const auto cl = test::changelog(test::key(0x11), 7, 2);
            const auto bytes = encode_event(cl);
            // discriminator + tree id + path length + 4 nodes of 36 bytes + seq + index
            test_same(8 + 32 + 4 + 4 * 36 + 8 + 4, bytes.size());
            const auto ev = tree_program_schema().decode(bytes);
            expect(ev.has_value());
            if (ev) {
                test_same(std::string { "ChangeLogEvent" }, ev->name);
                const auto *dec = ev->get<change_log_event>();
                expect(dec != nullptr);
                if (dec) {
                    expect(*dec == cl);
                    test_same(7, dec->seq);
                    test_same(2, dec->index);
                    test_same(10, dec->path.at(0).index);
                }
            }
        };
        "new leaf"_test = [] {
            auto nl = test::new_leaf("Gum #2", 3);
            nl.metadata.edition_nonce = 4;
            nl.metadata.collection = collection_info { true, test::key(0x55) };
            nl.metadata.uses = uses_info { 1, 5, 10 };
            const auto ev = token_program_schema().decode_base64(encode_event_base64(nl));
            expect(ev.has_value());
            if (ev) {
                const auto *dec = ev->get<new_leaf_event>();
                expect(dec != nullptr);
                if (dec) {
                    expect(*dec == nl);
                    test_same(std::string { "Gum #2" }, dec->metadata.name);
                    test_same(1, dec->metadata.creators.size());
                    expect(!dec->metadata.token_standard);
                }
            }
        };
        "leaf schema"_test = [] {
            const auto ls = test::leaf_schema(test::key(0x21), 9, test::key(0x31));
            const auto ev = token_program_schema().decode(encode_event(ls));
            expect(ev.has_value());
            if (ev) {
                const auto *dec = ev->get<leaf_schema_event>();
                expect(dec != nullptr);
                if (dec)
                    expect(*dec == ls);
            }
        };
        "decompression"_test = [] {
            const decompression_event de { 0, test::key(0x21), test::key(0x11), 9 };
            const auto ev = token_program_schema().decode(encode_event(de));
            expect(ev.has_value());
            if (ev)
                expect(ev->get<decompression_event>() != nullptr && *ev->get<decompression_event>() == de);
        };
        "unsupported leaf schema version"_test = [] {
            auto bytes = encode_event(test::leaf_schema(test::key(0x21), 9, test::key(0x31)));
            bytes[8] = 1;
            expect(throws<unsupported_version_error>([&] { static_cast<void>(token_program_schema().decode(bytes)); }));
        };
        "no event"_test = [] {
            // the event of another program
            expect(!tree_program_schema().decode(encode_event(test::leaf_schema(test::key(0x21), 9, test::key(0x31)))));
            expect(!token_program_schema().decode(encode_event(test::changelog(test::key(0x11), 1))));
            // shorter than a discriminator
            expect(!tree_program_schema().decode(uint8_vector::from_hex("9541DA107E5775")));
            // a known discriminator with a truncated body
            auto bytes = encode_event(test::changelog(test::key(0x11), 1));
            bytes.resize(bytes.size() - 3);
            expect(!tree_program_schema().decode(bytes));
            // invalid base64
            expect(!tree_program_schema().decode_base64("not base64!"));
            expect(!tree_program_schema().decode_base64(""));
        };
        "oversized vector"_test = [] {
            borsh::encoder enc {};
            enc.bytes(event_discriminator("ChangeLogEvent")).bytes(test::key(0x11)).u32(0xFFFFFFFFU);
            expect(!tree_program_schema().decode(enc.bytes()));
        };
    };
};
