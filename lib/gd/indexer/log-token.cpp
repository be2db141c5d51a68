/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <gd/indexer/log-token.hpp>

namespace gumdrop::indexer {
    static constexpr std::string_view program_prefix { "Program " };
    static constexpr std::string_view data_prefix { "Program data: " };
    static constexpr std::string_view instruction_prefix { "Program log: Instruction: " };
    static constexpr std::string_view invoke_prefix { "invoke [" };
    static constexpr std::string_view base58_chars { "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };

    static pubkey parse_program_id(const std::string_view id, const std::string_view line)
    {
        try {
            return pubkey::from_base58(id);
        } catch (const error &ex) {
            throw parse_error(fmt::format("invalid program id in log line '{}': {}", line, ex.what()));
        }
    }

    static uint32_t parse_level(const std::string_view text, const std::string_view line)
    {
        uint32_t level = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), level);
        if (ec != std::errc {} || ptr != text.data() + text.size() || level == 0) [[unlikely]]
            throw parse_error(fmt::format("invalid invocation level in log line '{}'", line));
        return level;
    }

    log_token tokenize(const std::string_view line)
    {
        if (line.starts_with(truncated_prefix))
            return truncated_token {};
        if (line.starts_with(data_prefix))
            return data_token { std::string { line.substr(data_prefix.size()) } };
        if (line.starts_with(instruction_prefix))
            return instruction_token { std::string { line.substr(instruction_prefix.size()) } };
        if (line.starts_with(program_prefix)) {
            const auto rest = line.substr(program_prefix.size());
            const auto sp_pos = rest.find(' ');
            if (sp_pos != rest.npos && sp_pos > 0) {
                const auto id = rest.substr(0, sp_pos);
                // "Program log: ...", "Program return: ..." and similar are not program markers
                if (id.find_first_not_of(base58_chars) == id.npos) {
                    const auto tail = rest.substr(sp_pos + 1);
                    if (tail == "success")
                        return success_token { parse_program_id(id, line) };
                    if (tail.starts_with(invoke_prefix) && tail.ends_with(']')) {
                        const auto level_text = tail.substr(invoke_prefix.size(), tail.size() - invoke_prefix.size() - 1);
                        return invoke_token { parse_program_id(id, line), parse_level(level_text, line) };
                    }
                }
            }
        }
        return plain_token { std::string { line } };
    }

    log_token_list tokenize(const vector<std::string> &lines)
    {
        log_token_list tokens {};
        tokens.reserve(lines.size());
        for (const auto &l: lines)
            tokens.emplace_back(tokenize(l));
        return tokens;
    }

    bool is_truncated(const vector<std::string> &lines)
    {
        for (const auto &l: lines) {
            if (std::string_view { l }.starts_with(truncated_prefix))
                return true;
        }
        return false;
    }
}
