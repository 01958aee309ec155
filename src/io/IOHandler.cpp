/*
 * IOHandler.cpp - Base I/O handler implementation
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

IOHandler::IOHandler() {
    Debug::log("io", "IOHandler::IOHandler() - Handler created");
}

IOHandler::~IOHandler() {
    Debug::log("io", "IOHandler::~IOHandler() - Handler destroyed");
}

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    // Reads advance the position, so they take the lock exclusively
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    
    return read_unlocked(buffer, size, count);
}

size_t IOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    // Default implementation returns 0 (no data read) for non-functional state
    // This follows fread-like semantics where 0 indicates EOF or error
    
    // Reset error state
    updateErrorState(0);
    
    if (m_closed.load()) {
        updateErrorState(EBADF);  // Bad file descriptor
        return 0;
    }
    
    if (!buffer) {
        updateErrorState(EINVAL); // Invalid argument
        return 0;
    }
    
    if (size == 0 || count == 0) {
        // Not an error, just nothing to do
        return 0;
    }
    
    if (m_eof.load()) {
        // Already at EOF, not an error
        return 0;
    }
    
    // Mark as EOF since we can't actually read anything in the base implementation
    updateEofState(true);
    return 0;
}

off_t IOHandler::tell() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    
    return tell_unlocked();
}

off_t IOHandler::tell_unlocked() {
    if (m_closed.load()) {
        updateErrorState(EBADF);  // Bad file descriptor
        return -1;
    }
    
    return m_position.load();
}

int IOHandler::close() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    
    return close_unlocked();
}

int IOHandler::close_unlocked() {
    // Reset error state
    updateErrorState(0);
    
    if (m_closed.load()) {
        // Already closed, not an error
        return 0;
    }
    
    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool IOHandler::eof() {
    // True if at end of stream or closed, false otherwise
    return m_closed.load() || m_eof.load();
}

off_t IOHandler::getFileSize() {
    // Base implementation doesn't know the size
    return -1;
}

int IOHandler::getLastError() const {
    return m_error.load();
}

bool IOHandler::isClosed() const {
    return m_closed.load();
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message;
    
    if (!context.empty()) {
        message = context + ": ";
    }
    
    // Get standard error message
    const char* error_str = strerror(error_code);
    if (error_str) {
        message += error_str;
    } else {
        message += "Unknown error " + std::to_string(error_code);
    }
    
    return message;
}

bool IOHandler::isRecoverableError(int error_code) {
    switch (error_code) {
        // Temporary I/O errors that might be recoverable
        case EIO:           // I/O error
        case EAGAIN:        // Resource temporarily unavailable
        case EINTR:         // Interrupted system call
        case ENOMEM:        // Out of memory (might be temporary)
            return true;
            
#ifdef ETIMEDOUT
        case ETIMEDOUT:     // Network filesystem timed out
            return true;
#endif
            
        // Permanent errors
        case ENOENT:        // No such file or directory
        case EACCES:        // Permission denied
        case EBADF:         // Bad file descriptor
        case EINVAL:        // Invalid argument
        case EISDIR:        // Is a directory
        default:
            return false;
    }
}

bool IOHandler::updatePosition(off_t new_position) {
    if (new_position < 0) {
        Debug::log("io", "IOHandler::updatePosition() - Rejected negative position: ", new_position);
        return false;
    }
    m_position.store(new_position);
    return true;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error.store(error_code);
    
    if (!error_message.empty()) {
        Debug::log("error", "IOHandler::updateErrorState() - Error ", error_code, ": ", error_message);
    }
}

void IOHandler::updateEofState(bool eof_state) {
    m_eof.store(eof_state);
}

void IOHandler::updateClosedState(bool closed_state) {
    m_closed.store(closed_state);
    Debug::log("io", "IOHandler::updateClosedState() - Closed state updated to: ", closed_state);
}

} // namespace IO
} // namespace DiagStream
