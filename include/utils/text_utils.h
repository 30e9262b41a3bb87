// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief Split on runs of whitespace, dropping empty tokens
 */
std::vector<std::string> split_whitespace(const std::string& line);

/**
 * @brief Strip leading and trailing whitespace (including '\r')
 */
std::string trim(const std::string& str);

/**
 * @brief Split text into lines on '\n', removing a trailing '\r' from each
 *
 * A trailing newline does not produce an extra empty line.
 */
std::vector<std::string> split_lines(const std::string& text);

/**
 * @brief Replace invalid UTF-8 sequences with U+FFFD
 *
 * Used on captured tool output so marker matching and parsing never see
 * broken multi-byte sequences. Valid input is returned unchanged.
 */
std::string utf8_lossy(const std::string& bytes);

/**
 * @brief Parse a base-10 integer, rejecting trailing garbage
 *
 * @return Parsed value, or nullopt for empty, non-numeric or out-of-int input
 */
std::optional<int> parse_int(const std::string& str);

/**
 * @brief Validate a free-text parameter destined for an external tool
 *
 * Rejects control characters (0x00-0x1F, 0x7F) and values over 255 bytes.
 *
 * @param input String to validate
 * @param allow_empty Whether an empty string is acceptable
 * @param[out] reason Why validation failed
 * @return true if valid
 */
bool validate_tool_argument(const std::string& input, bool allow_empty, std::string& reason);

} // namespace wlanctl
