/*
 * Copyright (C) 2026, Robert Patterson
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <algorithm>
#include <optional>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace utils {

inline std::string toLowerCase(std::string_view inp)
{
    std::string s(inp);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// lower-cased alphanumerics only: "Semi Bold", "semi-bold" and "SEMI_BOLD" all normalize to "semibold"
inline std::string normalizeName(std::string_view input)
{
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        if (std::isalnum(ch)) {
            result.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return result;
}

inline std::string_view trim(std::string_view input)
{
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
        input.remove_suffix(1);
    }
    return input;
}

inline std::optional<int> parseInteger(std::string_view input)
{
    input = trim(input);
    if (input.empty()) {
        return std::nullopt;
    }
    int value{};
    const auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
    if (ec != std::errc() || ptr != input.data() + input.size()) {
        return std::nullopt;
    }
    return value;
}

/// splits "name=value" at the first separator. The name part must be non-empty.
inline std::optional<std::pair<std::string, std::string>> splitKeyValue(std::string_view input, char separator = '=')
{
    const auto pos = input.find(separator);
    if (pos == std::string_view::npos || pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(std::string(trim(input.substr(0, pos))), std::string(input.substr(pos + 1)));
}

inline std::optional<std::string> getEnvironmentValue(const char* name)
{
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* value = std::getenv(name)) {
        if (*value) {
            return std::string(value);
        }
    }
    return std::nullopt;
}

inline std::filesystem::path utf8ToPath(std::string_view str)
{
    return std::filesystem::path(std::u8string(reinterpret_cast<const char8_t*>(str.data()), str.size()));
}

inline std::string pathToString(const std::filesystem::path& path)
{
    const auto u8 = path.u8string();
    return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

/// lower-cased extension without the leading dot
inline std::string pathExtension(const std::filesystem::path& path)
{
    std::string ext = toLowerCase(pathToString(path.extension()));
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    return ext;
}

/// appends @p codepoint to @p target as utf-8. Invalid codepoints become U+FFFD.
inline void appendCodepoint(std::string& target, char32_t codepoint)
{
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        codepoint = 0xFFFD;
    }
    if (codepoint <= 0x7F) {
        target.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        target.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        target.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        target.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

/// decodes big-endian utf-16 (the encoding of most sfnt name records) to utf-8
inline std::string utf16BeToString(const unsigned char* data, size_t byteCount)
{
    std::string result;
    result.reserve(byteCount / 2);
    for (size_t x = 0; x + 1 < byteCount; x += 2) {
        char32_t unit = (char32_t(data[x]) << 8) | data[x + 1];
        if (unit >= 0xD800 && unit <= 0xDBFF && x + 3 < byteCount) {
            const char32_t low = (char32_t(data[x + 2]) << 8) | data[x + 3];
            if (low >= 0xDC00 && low <= 0xDFFF) {
                unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                x += 2;
            }
        }
        appendCodepoint(result, unit);
    }
    return result;
}

} // namespace utils
