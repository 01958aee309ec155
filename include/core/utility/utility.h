/*
 * utility.h - Various utility functions
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

#ifndef DIAGSTREAM_CORE_UTILITY_UTILITY_H
#define DIAGSTREAM_CORE_UTILITY_UTILITY_H

namespace DiagStream {
namespace Core {
namespace Utility {

/**
 * @brief Render bytes as a lowercase hexadecimal string without separators.
 * @param data Pointer to the bytes (may be null when size is 0)
 * @param size Number of bytes to render
 * @return Hex string of length 2 * size
 */
std::string toHex(const uint8_t* data, size_t size);

/**
 * @brief Render a byte vector as a lowercase hexadecimal string.
 */
std::string toHex(const std::vector<uint8_t>& data);

/**
 * @brief ASCII lower-casing, locale independent.
 */
std::string toLower(std::string text);

/**
 * @brief Case-insensitive suffix test ("capture.QMDL" ends with ".qmdl").
 */
bool endsWithIgnoreCase(const std::string& text, const std::string& suffix);

/**
 * @brief Format a wall-clock time as ISO-8601 local time with UTC offset,
 * e.g. 2025-03-14T09:26:53+01:00.
 */
std::string formatISO8601(std::chrono::system_clock::time_point when);

/**
 * @brief Parse a byte size with an optional k/m/g suffix (powers of 1024).
 * @param text Size such as "4096", "64k" or "20m"
 * @return Size in bytes, or std::nullopt if the text is not a valid size
 */
std::optional<uint64_t> parseByteSize(const std::string& text);

/**
 * @brief Split a comma separated list, dropping empty items.
 */
std::vector<std::string> splitList(const std::string& text, char separator = ',');

} // namespace Utility
} // namespace Core
} // namespace DiagStream

#endif // DIAGSTREAM_CORE_UTILITY_UTILITY_H
