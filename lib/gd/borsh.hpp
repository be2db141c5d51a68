/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_BORSH_HPP
#define GUMDROP_BORSH_HPP

/*
 * Borsh is the little-endian binary layout used by on-chain programs for event payloads:
 * fixed-width integers, u32 length-prefixed strings and vectors, a single byte for
 * bool, Option tags and enum variant tags.
 */

#include <optional>
#include <string>
#include <gd/array.hpp>
#include <gd/common/bytes.hpp>

namespace gumdrop::borsh {
    struct decode_error: error {
        using error::error;
    };

    struct decoder {
        explicit decoder(const buffer bytes): _bytes { bytes }
        {
        }

        bool eof() const noexcept
        {
            return _pos >= _bytes.size();
        }

        size_t pos() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _pos;
        }

        buffer read_bytes(const size_t sz)
        {
            if (remaining() < sz) [[unlikely]]
                throw decode_error(fmt::format("need {} bytes at offset {} but only {} remain", sz, _pos, remaining()));
            const auto res = _bytes.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }

        template<typename T>
        T read_uint()
        {
            static_assert(std::is_unsigned_v<T>);
            const auto bytes = read_bytes(sizeof(T));
            T val = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                val |= static_cast<T>(bytes[i]) << (8 * i);
            return val;
        }

        uint8_t read_u8()
        {
            return read_uint<uint8_t>();
        }

        uint16_t read_u16()
        {
            return read_uint<uint16_t>();
        }

        uint32_t read_u32()
        {
            return read_uint<uint32_t>();
        }

        uint64_t read_u64()
        {
            return read_uint<uint64_t>();
        }

        bool read_bool()
        {
            switch (const auto b = read_u8(); b) {
                case 0: return false;
                case 1: return true;
                default: throw decode_error(fmt::format("invalid bool value {} at offset {}", b, _pos - 1));
            }
        }

        std::string read_string()
        {
            const auto sz = read_u32();
            return std::string { read_bytes(sz).string_view() };
        }

        template<size_t SZ>
        byte_array<SZ> read_array()
        {
            return byte_array<SZ> { read_bytes(SZ) };
        }

        // the vector length prefix is validated against the remaining bytes before any allocation
        template<typename F>
        auto read_vector(const size_t min_item_size, const F &read_item)
        {
            const auto sz = read_u32();
            if (min_item_size && sz > remaining() / min_item_size) [[unlikely]]
                throw decode_error(fmt::format("vector of {} items cannot fit into the remaining {} bytes", sz, remaining()));
            std::vector<decltype(read_item(*this))> items {};
            items.reserve(sz);
            for (uint32_t i = 0; i < sz; ++i)
                items.emplace_back(read_item(*this));
            return items;
        }

        template<typename F>
        auto read_option(const F &read_item) -> std::optional<decltype(read_item(*this))>
        {
            if (read_bool())
                return read_item(*this);
            return {};
        }
    private:
        buffer _bytes;
        size_t _pos = 0;
    };

    struct encoder {
        const uint8_vector &bytes() const noexcept
        {
            return _bytes;
        }

        template<typename T>
        encoder &uint(const T val)
        {
            static_assert(std::is_unsigned_v<T>);
            for (size_t i = 0; i < sizeof(T); ++i)
                _bytes << static_cast<uint8_t>((val >> (8 * i)) & 0xFF);
            return *this;
        }

        encoder &u8(const uint8_t val)
        {
            return uint(val);
        }

        encoder &u16(const uint16_t val)
        {
            return uint(val);
        }

        encoder &u32(const uint32_t val)
        {
            return uint(val);
        }

        encoder &u64(const uint64_t val)
        {
            return uint(val);
        }

        encoder &boolean(const bool val)
        {
            return u8(val ? 1 : 0);
        }

        encoder &bytes(const buffer data)
        {
            _bytes << data;
            return *this;
        }

        encoder &string(const std::string_view s)
        {
            u32(static_cast<uint32_t>(s.size()));
            return bytes(buffer { s });
        }

        encoder &none()
        {
            return boolean(false);
        }
    private:
        uint8_vector _bytes {};
    };
}

#endif // !GUMDROP_BORSH_HPP
