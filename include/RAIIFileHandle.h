/*
 * RAIIFileHandle.h - Owning wrapper for capture FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {

/**
 * @brief Owning wrapper for FILE* handles with automatic cleanup
 *
 * Closes the managed handle on destruction, including during exception
 * unwinding out of a chunk loop. The errno observed by the last failed
 * open() is kept so callers can report why a capture was unopenable.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;
    
    /**
     * @brief Adopt an existing FILE* handle
     * @param file FILE* handle to manage (can be nullptr)
     * @param take_ownership Whether to close the handle on destruction
     */
    explicit RAIIFileHandle(FILE* file, bool take_ownership = true) noexcept;
    
    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;
    ~RAIIFileHandle() noexcept;
    
    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;
    
    /**
     * @brief Open a file, closing any handle already held
     * @param filename Path to the file to open
     * @param mode fopen() mode string
     * @return true if the file was opened, false otherwise (see openError())
     */
    bool open(const std::string& filename, const char* mode) noexcept;
    
    /**
     * @brief Close the file handle if owned
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;
    
    /**
     * @brief Release ownership of the file handle
     * @return The FILE* handle (caller takes ownership)
     */
    FILE* release() noexcept;
    
    void reset(FILE* file = nullptr, bool take_ownership = true) noexcept;
    
    FILE* get() const noexcept;
    bool is_valid() const noexcept;
    bool owns_handle() const noexcept;
    explicit operator bool() const noexcept;
    
    /**
     * @brief errno recorded by the last failed open(), 0 if it succeeded
     */
    int openError() const noexcept;
    
    void swap(RAIIFileHandle& other) noexcept;

private:
    FILE* m_file;           // The managed FILE* handle
    bool m_owns_handle;     // Whether we own the handle and should close it
    int m_open_error;       // errno from the last open() attempt
};

void swap(RAIIFileHandle& lhs, RAIIFileHandle& rhs) noexcept;

} // namespace IO
} // namespace DiagStream

#endif // RAIIFILEHANDLE_H
