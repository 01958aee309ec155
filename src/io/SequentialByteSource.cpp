/*
 * SequentialByteSource.cpp - Ordered multi-file capture byte source
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

SequentialByteSource::SequentialByteSource(std::vector<std::string> paths)
    : m_pending(paths.begin(), paths.end())
{
    Debug::log("io", "SequentialByteSource::SequentialByteSource() - ", m_pending.size(), " file(s) queued");

    // Open the first file in the list
    advance();
}

SequentialByteSource::SequentialByteSource(const std::string& path)
    : SequentialByteSource(std::vector<std::string>{path})
{
}

SequentialByteSource::~SequentialByteSource() {
    close();
}

std::unique_ptr<IOHandler> SequentialByteSource::openHandler(const std::string& path) {
    File::Compression compression = File::detectCompression(path);
    if (compression == File::Compression::None) {
        return std::make_unique<File::FileIOHandler>(path);
    }
    return std::make_unique<File::CompressedFileIOHandler>(path, compression);
}

void SequentialByteSource::closeActive() {
    if (m_active) {
        int result = m_active->close();
        if (result != 0) {
            Debug::log("io", "SequentialByteSource::closeActive() - Close reported error for ",
                      m_current_path, ": ", strerror(m_active->getLastError()));
        }
        m_active.reset();
    }
    m_current_path.clear();
}

bool SequentialByteSource::advance() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    closeActive();

    if (m_closed.load() || m_pending.empty()) {
        if (m_available.exchange(false)) {
            Debug::log("io", "SequentialByteSource::advance() - File list exhausted after ", m_files_opened, " file(s)");
        }
        updateEofState(true);
        return false;
    }

    std::string next = std::move(m_pending.front());
    m_pending.pop_front();

    // Throws SourceUnavailableException; the source stays without an
    // active file so a caller may still advance past the bad one.
    m_active = openHandler(next);
    m_current_path = next;
    m_files_opened++;
    updateEofState(false);

    Debug::log("io", "SequentialByteSource::advance() - Now reading ", m_current_path,
              " (", m_pending.size(), " pending)");
    return true;
}

std::vector<uint8_t> SequentialByteSource::read(size_t max_bytes) {
    std::vector<uint8_t> chunk(max_bytes);
    size_t got = read(chunk.data(), 1, max_bytes);
    chunk.resize(got);
    return chunk;
}

size_t SequentialByteSource::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (!m_active || !buffer || size == 0 || count == 0) {
        return 0;
    }

    size_t elements_read = 0;
    try {
        elements_read = m_active->read(buffer, size, count);
    } catch (const std::exception& e) {
        // A failing read is "no data"; the caller treats it as end of file
        Debug::log("io", "SequentialByteSource::read() - I/O warning on ", m_current_path, ": ", e.what());
        updateErrorState(EIO);
        return 0;
    }

    if (elements_read == 0 && m_active->getLastError() != 0) {
        int error_code = m_active->getLastError();
        Debug::log("io", "SequentialByteSource::read() - I/O warning on ", m_current_path, ": ",
                  getErrorMessage(error_code),
                  (isRecoverableError(error_code) ? " (recoverable)" : ""));
        updateErrorState(error_code);
        return 0;
    }

    if (elements_read > 0) {
        updatePosition(m_position.load() + static_cast<off_t>(elements_read * size));
    }

    return elements_read;
}

int SequentialByteSource::close_unlocked() {
    if (m_closed.load()) {
        // Safe to call repeatedly, including after exhaustion
        return 0;
    }

    closeActive();
    m_available.store(false);
    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool SequentialByteSource::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_closed.load() || !m_active || m_active->eof();
}

off_t SequentialByteSource::getFileSize() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_active ? m_active->getFileSize() : -1;
}

bool SequentialByteSource::isAvailable() const {
    return m_available.load();
}

std::string SequentialByteSource::currentPath() const {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_current_path;
}

size_t SequentialByteSource::pendingCount() const {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_pending.size();
}

size_t SequentialByteSource::filesOpened() const {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_files_opened;
}

} // namespace IO
} // namespace DiagStream
