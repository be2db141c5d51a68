/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_SHA2_HPP
#define GUMDROP_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <gd/array.hpp>

namespace gumdrop::sha2
{
    using hash_256 = byte_array<crypto_hash_sha256_BYTES>;

    inline void ensure_initialized()
    {
        static const int res = sodium_init();
        if (res < 0)
            throw error("failed to initialize libsodium!");
    }

    inline void digest(const std::span<uint8_t> &out, const buffer &in)
    {
        if (out.size() != sizeof(hash_256))
            throw error(fmt::format("output size must be {} but got {}", sizeof(hash_256), out.size()));
        ensure_initialized();
        if (crypto_hash_sha256(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
    }

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out;
        digest(out, in);
        return out;
    }
}

#endif // !GUMDROP_SHA2_HPP
