/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <gd/base64.hpp>
#include <gd/indexer/event.hpp>
#include <gd/logger.hpp>
#include <gd/sha2.hpp>

namespace gumdrop::indexer {
    namespace {
        pubkey read_pubkey(borsh::decoder &dec)
        {
            return pubkey { dec.read_array<32>() };
        }

        change_log_event read_change_log(borsh::decoder &dec)
        {
            change_log_event ev {};
            ev.tree_id = read_pubkey(dec);
            ev.path = dec.read_vector(32 + 4, [](borsh::decoder &d) {
                path_node n {};
                n.hash = d.read_array<32>();
                n.index = d.read_u32();
                return n;
            });
            ev.seq = dec.read_u64();
            ev.index = dec.read_u32();
            return ev;
        }

        leaf_schema_event read_leaf_schema(borsh::decoder &dec)
        {
            switch (const auto tag = dec.read_u8(); tag) {
                case 0: {
                    leaf_schema_event ev {};
                    ev.v1.id = read_pubkey(dec);
                    ev.v1.owner = read_pubkey(dec);
                    ev.v1.delegate = read_pubkey(dec);
                    ev.v1.nonce = dec.read_u64();
                    ev.v1.data_hash = dec.read_array<32>();
                    ev.v1.creator_hash = dec.read_array<32>();
                    return ev;
                }
                default:
                    throw unsupported_version_error(fmt::format("unsupported leaf schema version: {}", tag));
            }
        }

        metadata_args read_metadata(borsh::decoder &dec)
        {
            metadata_args m {};
            m.name = dec.read_string();
            m.symbol = dec.read_string();
            m.uri = dec.read_string();
            m.seller_fee_basis_points = dec.read_u16();
            m.primary_sale_happened = dec.read_bool();
            m.is_mutable = dec.read_bool();
            m.edition_nonce = dec.read_option([](borsh::decoder &d) { return d.read_u8(); });
            m.token_standard = dec.read_option([](borsh::decoder &d) { return d.read_u8(); });
            m.collection = dec.read_option([](borsh::decoder &d) {
                collection_info c {};
                c.verified = d.read_bool();
                c.key = read_pubkey(d);
                return c;
            });
            m.uses = dec.read_option([](borsh::decoder &d) {
                uses_info u {};
                u.use_method = d.read_u8();
                u.remaining = d.read_u64();
                u.total = d.read_u64();
                return u;
            });
            m.token_program_version = dec.read_u8();
            m.creators = dec.read_vector(32 + 1 + 1, [](borsh::decoder &d) {
                creator c {};
                c.address = read_pubkey(d);
                c.verified = d.read_bool();
                c.share = d.read_u8();
                return c;
            });
            return m;
        }

        new_leaf_event read_new_leaf(borsh::decoder &dec)
        {
            new_leaf_event ev {};
            ev.version = dec.read_u8();
            ev.metadata = read_metadata(dec);
            ev.nonce = dec.read_u64();
            return ev;
        }

        decompression_event read_decompression(borsh::decoder &dec)
        {
            decompression_event ev {};
            ev.version = dec.read_u8();
            ev.id = read_pubkey(dec);
            ev.tree_id = read_pubkey(dec);
            ev.nonce = dec.read_u64();
            return ev;
        }

        void write_pubkey(borsh::encoder &enc, const pubkey &k)
        {
            enc.bytes(k);
        }

        void write_event(borsh::encoder &enc, const change_log_event &ev)
        {
            write_pubkey(enc, ev.tree_id);
            enc.u32(static_cast<uint32_t>(ev.path.size()));
            for (const auto &n: ev.path)
                enc.bytes(n.hash).u32(n.index);
            enc.u64(ev.seq).u32(ev.index);
        }

        void write_event(borsh::encoder &enc, const leaf_schema_event &ev)
        {
            enc.u8(0);
            write_pubkey(enc, ev.v1.id);
            write_pubkey(enc, ev.v1.owner);
            write_pubkey(enc, ev.v1.delegate);
            enc.u64(ev.v1.nonce).bytes(ev.v1.data_hash).bytes(ev.v1.creator_hash);
        }

        void write_event(borsh::encoder &enc, const new_leaf_event &ev)
        {
            const auto &m = ev.metadata;
            enc.u8(ev.version).string(m.name).string(m.symbol).string(m.uri);
            enc.u16(m.seller_fee_basis_points).boolean(m.primary_sale_happened).boolean(m.is_mutable);
            for (const auto &opt: { m.edition_nonce, m.token_standard }) {
                if (opt)
                    enc.boolean(true).u8(*opt);
                else
                    enc.none();
            }
            if (m.collection) {
                enc.boolean(true).boolean(m.collection->verified);
                write_pubkey(enc, m.collection->key);
            } else {
                enc.none();
            }
            if (m.uses)
                enc.boolean(true).u8(m.uses->use_method).u64(m.uses->remaining).u64(m.uses->total);
            else
                enc.none();
            enc.u8(m.token_program_version);
            enc.u32(static_cast<uint32_t>(m.creators.size()));
            for (const auto &c: m.creators) {
                write_pubkey(enc, c.address);
                enc.boolean(c.verified).u8(c.share);
            }
            enc.u64(ev.nonce);
        }

        void write_event(borsh::encoder &enc, const decompression_event &ev)
        {
            enc.u8(ev.version);
            write_pubkey(enc, ev.id);
            write_pubkey(enc, ev.tree_id);
            enc.u64(ev.nonce);
        }
    }

    discriminator event_discriminator(const std::string_view event_name)
    {
        const auto hash = sha2::digest(buffer { fmt::format("event:{}", event_name) });
        return discriminator { static_cast<buffer>(hash).subbuf(0, sizeof(discriminator)) };
    }

    event_schema::event_schema(std::string program_name, const std::initializer_list<std::pair<std::string_view, decode_func>> events):
        _program_name { std::move(program_name) }
    {
        for (const auto &[name, decode]: events) {
            const auto [it, created] = _decoders.try_emplace(event_discriminator(name), entry { std::string { name }, decode });
            if (!created) [[unlikely]]
                throw error(fmt::format("duplicate event discriminator in the {} schema: {}", _program_name, name));
        }
    }

    std::optional<event> event_schema::decode(const buffer payload) const
    {
        if (payload.size() < sizeof(discriminator))
            return {};
        const auto it = _decoders.find(discriminator { payload.subbuf(0, sizeof(discriminator)) });
        if (it == _decoders.end())
            return {};
        borsh::decoder dec { payload.subbuf(sizeof(discriminator)) };
        try {
            event ev { it->second.name, it->second.decode(dec) };
            if (!dec.eof())
                logger::trace("{} event {} has {} trailing bytes", _program_name, ev.name, dec.remaining());
            return ev;
        } catch (const borsh::decode_error &ex) {
            logger::debug("failed to decode {} event {}: {}", _program_name, it->second.name, ex.what());
            return {};
        }
    }

    std::optional<event> event_schema::decode_base64(const std::string_view text) const
    {
        uint8_vector payload {};
        try {
            payload = base64::decode(text);
        } catch (const error &ex) {
            logger::trace("not a base64 event payload: {}", ex.what());
            return {};
        }
        return decode(payload);
    }

    const event_schema &tree_program_schema()
    {
        static const event_schema schema { "tree-program", {
            { change_log_event::name, [](borsh::decoder &dec) -> event_data { return read_change_log(dec); } }
        } };
        return schema;
    }

    const event_schema &token_program_schema()
    {
        static const event_schema schema { "token-program", {
            { new_leaf_event::name, [](borsh::decoder &dec) -> event_data { return read_new_leaf(dec); } },
            { leaf_schema_event::name, [](borsh::decoder &dec) -> event_data { return read_leaf_schema(dec); } },
            { decompression_event::name, [](borsh::decoder &dec) -> event_data { return read_decompression(dec); } }
        } };
        return schema;
    }

    uint8_vector encode_event(const event_data &ev)
    {
        return std::visit([](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            borsh::encoder enc {};
            enc.bytes(event_discriminator(T::name));
            write_event(enc, e);
            return enc.bytes();
        }, ev);
    }

    std::string encode_event_base64(const event_data &ev)
    {
        return base64::encode(encode_event(ev));
    }
}
