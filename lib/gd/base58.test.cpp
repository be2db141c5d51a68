/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/base58.hpp>
#include <gd/pubkey.hpp>
#include <gd/test.hpp>

using namespace gumdrop;

suite base58_suite = [] {
    "base58"_test = [] {
        "encode"_test = [] {
            test_same(std::string { "" }, base58::encode(uint8_vector {}));
            test_same(std::string { "2g" }, base58::encode(std::string_view { "a" }));
            test_same(std::string { "a3gV" }, base58::encode(std::string_view { "bbb" }));
            test_same(std::string { "aPEr" }, base58::encode(std::string_view { "ccc" }));
            test_same(std::string { "2cFupjhnEsSn59qHXstmK2ffpLv2" }, base58::encode(std::string_view { "simply a long string" }));
            test_same(std::string { "ABnLTmg" }, base58::encode(uint8_vector::from_hex("516b6fcd0f")));
            test_same(std::string { "3EFU7m" }, base58::encode(uint8_vector::from_hex("572e4794")));
            test_same(std::string { "Rt5zm" }, base58::encode(uint8_vector::from_hex("10c8511e")));
            test_same(std::string { "1111111111" }, base58::encode(uint8_vector::from_hex("00000000000000000000")));
            test_same(std::string { "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L" },
                base58::encode(uint8_vector::from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647")));
        };
        "decode"_test = [] {
            test_same(0, base58::decode("").size());
            test_same(uint8_vector::from_hex("516b6fcd0f"), base58::decode("ABnLTmg"));
            test_same(uint8_vector::from_hex("00000000000000000000"), base58::decode("1111111111"));
            test_same(uint8_vector::from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647"),
                base58::decode("1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L"));
        };
        "invalid characters"_test = [] {
            expect(throws([] { static_cast<void>(base58::decode("0OIl")); }));
            expect(throws([] { static_cast<void>(base58::decode("abc+")); }));
        };
        "pubkey"_test = [] {
            pubkey k {};
            k.fill(0x01);
            test_same(std::string { "4vJ9JU1bJJE96FWSJKvHsmmFADCg4gpZQff4P3bkLKi" }, k.to_base58());
            test_same(k, pubkey::from_base58("4vJ9JU1bJJE96FWSJKvHsmmFADCg4gpZQff4P3bkLKi"));
            k.fill(0x02);
            test_same(std::string { "8qbHbw2BbbTHBW1sbeqakYXVKRQM8Ne7pLK7m6CVfeR" }, fmt::format("{}", k));
            test_same(std::string { "11111111111111111111111111111111" }, pubkey {}.to_base58());
            expect(throws([] { static_cast<void>(pubkey::from_base58("ABnLTmg")); }));
        };
    };
};
