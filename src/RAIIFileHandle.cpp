/*
 * RAIIFileHandle.cpp - Owning wrapper for capture FILE* handles
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
namespace IO {

RAIIFileHandle::RAIIFileHandle() noexcept
    : m_file(nullptr), m_owns_handle(false), m_open_error(0) {
}

RAIIFileHandle::RAIIFileHandle(FILE* file, bool take_ownership) noexcept 
    : m_file(file), m_owns_handle(take_ownership), m_open_error(0) {
    Debug::log("raii", "RAIIFileHandle::RAIIFileHandle() - Adopting handle: ", 
              (file ? "valid" : "null"), ", ownership: ", (take_ownership ? "yes" : "no"));
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept 
    : m_file(other.m_file), m_owns_handle(other.m_owns_handle), m_open_error(other.m_open_error) {
    other.m_file = nullptr;
    other.m_owns_handle = false;
    other.m_open_error = 0;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = other.m_file;
        m_owns_handle = other.m_owns_handle;
        m_open_error = other.m_open_error;
        other.m_file = nullptr;
        other.m_owns_handle = false;
        other.m_open_error = 0;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const std::string& filename, const char* mode) noexcept {
    Debug::log("raii", "RAIIFileHandle::open() - Opening capture: ", filename, 
              ", mode: ", (mode ? mode : "null"));
    
    close(); // Close any existing handle
    
    if (filename.empty() || !mode) {
        m_open_error = EINVAL;
        Debug::log("raii", "RAIIFileHandle::open() - Invalid parameters");
        return false;
    }
    
    errno = 0;
    m_file = fopen(filename.c_str(), mode);
    m_owns_handle = (m_file != nullptr);
    m_open_error = m_file ? 0 : errno;
    
    if (!m_file) {
        Debug::log("raii", "RAIIFileHandle::open() - Failed to open ", filename, ": ", strerror(m_open_error));
    }
    
    return m_file != nullptr;
}

int RAIIFileHandle::close() noexcept {
    int result = 0;
    
    if (m_file && m_owns_handle) {
        result = fclose(m_file);
        if (result != 0) {
            Debug::log("raii", "RAIIFileHandle::close() - Error closing file: ", strerror(errno));
        }
    }
    
    m_file = nullptr;
    m_owns_handle = false;
    return result;
}

FILE* RAIIFileHandle::release() noexcept {
    FILE* file = m_file;
    m_file = nullptr;
    m_owns_handle = false;
    return file;
}

void RAIIFileHandle::reset(FILE* file, bool take_ownership) noexcept {
    close();
    m_file = file;
    m_owns_handle = take_ownership;
    m_open_error = 0;
}

FILE* RAIIFileHandle::get() const noexcept {
    return m_file;
}

bool RAIIFileHandle::is_valid() const noexcept {
    return m_file != nullptr;
}

bool RAIIFileHandle::owns_handle() const noexcept {
    return m_owns_handle;
}

RAIIFileHandle::operator bool() const noexcept {
    return is_valid();
}

int RAIIFileHandle::openError() const noexcept {
    return m_open_error;
}

void RAIIFileHandle::swap(RAIIFileHandle& other) noexcept {
    std::swap(m_file, other.m_file);
    std::swap(m_owns_handle, other.m_owns_handle);
    std::swap(m_open_error, other.m_open_error);
}

void swap(RAIIFileHandle& lhs, RAIIFileHandle& rhs) noexcept {
    lhs.swap(rhs);
}

} // namespace IO
} // namespace DiagStream
