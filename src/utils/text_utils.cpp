// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/text_utils.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace wlanctl {

namespace {

constexpr const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD
constexpr size_t MAX_TOOL_ARG_LENGTH = 255;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        // Expected sequence length and the valid range of the second byte
        // (rules out overlongs, surrogates and code points above U+10FFFF)
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) {
                lo = 0xA0;
            } else if (lead == 0xED) {
                hi = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) {
                lo = 0x90;
            } else if (lead == 0xF4) {
                hi = 0x8F;
            }
        } else {
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        size_t valid = 1;
        while (valid < len && i + valid < bytes.size()) {
            unsigned char c = static_cast<unsigned char>(bytes[i + valid]);
            bool ok = (valid == 1) ? (c >= lo && c <= hi) : is_continuation(c);
            if (!ok) {
                break;
            }
            ++valid;
        }

        if (valid == len) {
            out.append(bytes, i, len);
        } else {
            // Maximal invalid prefix collapses to one replacement character
            out += REPLACEMENT_CHAR;
        }
        i += valid;
    }

    return out;
}

std::optional<int> parse_int(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* endptr = nullptr;
    long val = std::strtol(str.c_str(), &endptr, 10);
    if (endptr == str.c_str() || *endptr != '\0' || errno == ERANGE || val < INT_MIN ||
        val > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(val);
}

bool validate_tool_argument(const std::string& input, bool allow_empty, std::string& reason) {
    if (input.empty()) {
        if (!allow_empty) {
            reason = "value is empty";
            return false;
        }
        return true;
    }

    if (input.length() > MAX_TOOL_ARG_LENGTH) {
        reason = "value too long (" + std::to_string(input.length()) + " bytes)";
        return false;
    }

    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 32 || c == 127) {
            reason = "invalid character (ASCII " + std::to_string(static_cast<int>(c)) + ")";
            return false;
        }
    }

    return true;
}

} // namespace wlanctl
