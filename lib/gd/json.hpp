/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef GUMDROP_JSON_HPP
#define GUMDROP_JSON_HPP

#include <optional>
#include <boost/json.hpp>
#include <gd/file.hpp>

namespace gumdrop::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline std::optional<uint64_t> optional_uint64(const json::object &obj, const std::string_view key)
    {
        const auto it = obj.find(key);
        if (it == obj.end() || it->value().is_null())
            return {};
        return json::value_to<uint64_t>(it->value());
    }
}

#endif // !GUMDROP_JSON_HPP
