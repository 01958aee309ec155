/*
 * utility.cpp - Various utility functions
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "diagstream.h"

namespace DiagStream {
namespace Core {
namespace Utility {

std::string toHex(const uint8_t* data, size_t size)
{
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        result += hex_chars[(data[i] >> 4) & 0x0F];
        result += hex_chars[data[i] & 0x0F];
    }
    return result;
}

std::string toHex(const std::vector<uint8_t>& data)
{
    return toHex(data.data(), data.size());
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWithIgnoreCase(const std::string& text, const std::string& suffix)
{
    if (suffix.size() > text.size()) {
        return false;
    }
    return toLower(text.substr(text.size() - suffix.size())) == toLower(suffix);
}

/**
 * @brief Formats a time point as ISO-8601 in local time.
 *
 * strftime's %z yields "+0100"; ISO-8601 extended format wants "+01:00",
 * so the colon is inserted by hand.
 */
std::string formatISO8601(std::chrono::system_clock::time_point when)
{
    std::time_t timer = std::chrono::system_clock::to_time_t(when);
    std::tm bt{};
    localtime_r(&timer, &bt);

    char stamp[32];
    char zone[8];
    if (std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &bt) == 0 ||
        std::strftime(zone, sizeof(zone), "%z", &bt) == 0) {
        return "";
    }

    std::string offset(zone);
    if (offset.size() == 5) {
        offset.insert(3, ":");
    }
    return std::string(stamp) + offset;
}

std::optional<uint64_t> parseByteSize(const std::string& text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t multiplier = 1;
    std::string digits = text;
    switch (std::tolower(static_cast<unsigned char>(text.back()))) {
        case 'k': multiplier = 1024ULL; digits.pop_back(); break;
        case 'm': multiplier = 1024ULL * 1024; digits.pop_back(); break;
        case 'g': multiplier = 1024ULL * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }

    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    errno = 0;
    unsigned long long value = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE || value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value) * multiplier;
}

std::vector<std::string> splitList(const std::string& text, char separator)
{
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, separator)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace Utility
} // namespace Core
} // namespace DiagStream
