/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_BASE58_HPP
#define GUMDROP_BASE58_HPP

#include <string>
#include <gd/common/bytes.hpp>

namespace gumdrop::base58 {
    // Bitcoin alphabet, leading zero bytes are encoded as '1'
    extern std::string encode(const buffer &data);
    extern uint8_vector decode(std::string_view text);
}

#endif // !GUMDROP_BASE58_HPP
