/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/borsh.hpp>
#include <gd/test.hpp>

using namespace gumdrop;

suite borsh_suite = [] {
    "borsh"_test = [] {
        "integers"_test = [] {
            const auto bytes = uint8_vector::from_hex("0134120D0C0B0A080706050403");
            borsh::decoder dec { bytes };
            test_same(1, dec.read_u8());
            test_same(0x1234, dec.read_u16());
            test_same(0x0A0B0C0DU, dec.read_u32());
            expect(!dec.eof());
            test_same(6, dec.remaining());
            expect(throws<borsh::decode_error>([&] { dec.read_u64(); }));
        };
        "bool"_test = [] {
            const auto bytes = uint8_vector::from_hex("000102");
            borsh::decoder dec { bytes };
            expect(!dec.read_bool());
            expect(dec.read_bool());
            expect(throws<borsh::decode_error>([&] { dec.read_bool(); }));
        };
        "string"_test = [] {
            borsh::encoder enc {};
            enc.string("gum").string("");
            test_same(uint8_vector::from_hex("0300000067756D00000000"), enc.bytes());
            borsh::decoder dec { enc.bytes() };
            test_same(std::string { "gum" }, dec.read_string());
            test_same(std::string {}, dec.read_string());
            expect(dec.eof());
        };
        "option"_test = [] {
            borsh::encoder enc {};
            enc.none().boolean(true).u8(7);
            borsh::decoder dec { enc.bytes() };
            const auto read = [](borsh::decoder &d) { return d.read_u8(); };
            expect(!dec.read_option(read));
            test_same(std::optional<uint8_t> { 7 }, dec.read_option(read));
        };
        "vector"_test = [] {
            borsh::encoder enc {};
            enc.u32(3).u16(1).u16(2).u16(3);
            borsh::decoder dec { enc.bytes() };
            const auto items = dec.read_vector(2, [](borsh::decoder &d) { return d.read_u16(); });
            test_same(3, items.size());
            test_same(3, items.at(2));
        };
        "vector length beyond the input"_test = [] {
            borsh::encoder enc {};
            enc.u32(1000).u16(1);
            borsh::decoder dec { enc.bytes() };
            expect(throws<borsh::decode_error>([&] { dec.read_vector(2, [](borsh::decoder &d) { return d.read_u16(); }); }));
        };
        "arrays"_test = [] {
            const auto bytes = uint8_vector::from_hex("DEADBEEF");
            borsh::decoder dec { bytes };
            test_same(byte_array<4>::from_hex("DEADBEEF"), dec.read_array<4>());
            expect(throws<borsh::decode_error>([&] { dec.read_array<1>(); }));
        };
    };
};
