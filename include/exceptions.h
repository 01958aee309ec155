/*
 * exceptions.h - Various exception classes.
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace DiagStream {
namespace Core {

// General file I/O failure that does not fit the capture-specific categories.
class IOException : public std::exception
{
    public:
        IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// Capture file cannot be opened (missing, unreadable, unknown compression).
class SourceUnavailableException : public std::exception
{
    public:
        SourceUnavailableException(const std::string &path, const std::string &why);
        ~SourceUnavailableException() noexcept override = default;
        const char *what() const noexcept override;
        const std::string &path() const noexcept;
    protected:
    private:
        std::string m_path;
        std::string m_why;
};

// Internal consistency check of the delimiter scan failed. Callers fall back
// to the split strategy.
class FramingException : public std::exception
{
    public:
        FramingException(const std::string &why);
        ~FramingException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// Malformed configuration value.
class ConfigException : public std::exception
{
    public:
        ConfigException(const std::string &key, const std::string &why);
        ~ConfigException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

} // namespace Core
} // namespace DiagStream

#endif // EXCEPTIONS_H
