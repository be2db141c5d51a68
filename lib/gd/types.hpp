/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_TYPES_HPP
#define GUMDROP_TYPES_HPP

#include <gd/container.hpp>
#include <gd/pubkey.hpp>

namespace gumdrop {
    // one node of a leaf-to-root proof path, index is the node's position in the tree
    struct path_node {
        hash_32 hash {};
        uint32_t index = 0;

        bool operator==(const path_node &o) const =default;
    };
    using path_node_list = vector<path_node>;

    struct creator {
        pubkey address {};
        bool verified = false;
        uint8_t share = 0;

        bool operator==(const creator &o) const =default;
    };
    using creator_list = vector<creator>;
}

namespace fmt {
    template<>
    struct formatter<gumdrop::path_node>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}#{}", v.hash, v.index);
        }
    };

    template<>
    struct formatter<gumdrop::creator>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}:{}{}", v.address, v.share, v.verified ? ":verified" : "");
        }
    };
}

#endif // !GUMDROP_TYPES_HPP
