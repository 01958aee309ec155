/*
 * MemoryIOHandler.cpp - IOHandler over an in-memory capture buffer
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

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_own_buffer(copy), m_pos(0) {
    if (copy) {
        if (data && size > 0) {
            m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
        }
    } else {
        m_external_data = static_cast<const uint8_t*>(data);
        m_external_size = data ? size : 0;
    }
}

MemoryIOHandler::MemoryIOHandler(std::vector<uint8_t> data)
    : m_buffer(std::move(data)), m_own_buffer(true), m_pos(0) {
}

MemoryIOHandler::MemoryIOHandler()
    : m_own_buffer(true), m_pos(0) {
}

MemoryIOHandler::~MemoryIOHandler() = default;

size_t MemoryIOHandler::availableSize() const {
    return m_own_buffer ? m_buffer.size() : m_external_size;
}

size_t MemoryIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;

    size_t total = availableSize();
    size_t available = (m_pos < total) ? total - m_pos : 0;
    const uint8_t* source = (m_own_buffer ? m_buffer.data() : m_external_data) + m_pos;

    // Whole elements only, as fread would deliver
    size_t to_read = (std::min(bytes_requested, available) / size) * size;

    if (to_read > 0) {
        std::memcpy(buffer, source, to_read);
        m_pos += to_read;
        updatePosition(static_cast<off_t>(m_pos));
    }

    updateEofState(m_pos >= total);

    return to_read / size;
}

int MemoryIOHandler::close_unlocked() {
    updateClosedState(true);
    updateEofState(true);
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_external_data = nullptr;
    m_external_size = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_closed.load() || m_pos >= availableSize();
}

off_t MemoryIOHandler::getFileSize() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return static_cast<off_t>(availableSize());
}

size_t MemoryIOHandler::write(const void* data, size_t size) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (!m_own_buffer || m_closed.load()) {
        // Cannot write to external buffer reference
        return 0;
    }

    if (!data || size == 0) return 0;

    const uint8_t* p = static_cast<const uint8_t*>(data);
    m_buffer.insert(m_buffer.end(), p, p + size);

    // If we were at EOF, we might not be anymore
    updateEofState(m_pos >= m_buffer.size());

    return size;
}

} // namespace IO
} // namespace DiagStream
