/*
 * exceptions.cpp - Exception classes code
 * This file is part of DiagStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

/**
 * @brief Constructs an IOException.
 *
 * This exception is used for general file I/O operations that don't fit the
 * capture-specific exception categories, such as configuration file access.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs a SourceUnavailableException.
 *
 * Thrown when a capture file cannot be opened for reading, either because it
 * does not exist, permissions deny access, or the decompression layer cannot
 * be set up for it.
 * @param path The capture file path that failed.
 * @param why A string describing the reason for the failure.
 */
SourceUnavailableException::SourceUnavailableException(const std::string &path,
                                                       const std::string &why)
    : std::exception(), m_path(path), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing why the source is unavailable.
 */
const char *SourceUnavailableException::what() const noexcept {
  return m_why.c_str();
}

/**
 * @brief Returns the path of the capture file that could not be opened.
 */
const std::string &SourceUnavailableException::path() const noexcept {
  return m_path;
}

/**
 * @brief Constructs a FramingException.
 *
 * This is a special-case exception used internally by the frame extractor. It
 * signals that the delimiter scan produced an inconsistent result, allowing the
 * extractor to retry the buffer with the split strategy.
 * @param why A string describing the inconsistency.
 */
FramingException::FramingException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

const char *FramingException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs a ConfigException.
 * @param key The configuration key whose value was rejected.
 * @param why A string describing what is wrong with the value.
 */
ConfigException::ConfigException(const std::string &key, const std::string &why)
    : std::exception(), m_why("Invalid value for '" + key + "': " + why) {
  // ctor
}

const char *ConfigException::what() const noexcept { return m_why.c_str(); }

} // namespace Core
} // namespace DiagStream
