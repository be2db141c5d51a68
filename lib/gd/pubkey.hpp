/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_PUBKEY_HPP
#define GUMDROP_PUBKEY_HPP

#include <gd/array.hpp>
#include <gd/base58.hpp>

namespace gumdrop {
    using hash_32 = byte_array<32>;

    // account and program addresses are rendered and parsed in base58
    struct pubkey: byte_array<32> {
        using byte_array::byte_array;

        static pubkey from_base58(const std::string_view text)
        {
            const auto bytes = base58::decode(text);
            if (bytes.size() != 32) [[unlikely]]
                throw error(fmt::format("a base58 pubkey must decode to 32 bytes but '{}' decodes to {}", text, bytes.size()));
            return pubkey { static_cast<buffer>(bytes) };
        }

        pubkey() =default;

        pubkey(const byte_array<32> &bytes): byte_array { bytes }
        {
        }

        std::string to_base58() const
        {
            return base58::encode(*this);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<gumdrop::pubkey>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_base58());
        }
    };
}

#endif // !GUMDROP_PUBKEY_HPP
