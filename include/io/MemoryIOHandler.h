/*
 * MemoryIOHandler.h - IOHandler over an in-memory capture buffer
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

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Allows reading capture bytes from a memory buffer as if it were a file.
 * Supports referencing external buffers (fixed) or an internal buffer that
 * can be appended to while it is being consumed.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @brief Construct from existing data (copy or reference)
     * @param data Pointer to data
     * @param size Size of data
     * @param copy If true, copies data to internal buffer. If false, references external data (must remain valid).
     */
    MemoryIOHandler(const void* data, size_t size, bool copy = true);

    /**
     * @brief Construct by taking over a byte vector
     */
    explicit MemoryIOHandler(std::vector<uint8_t> data);

    /**
     * @brief Construct empty handler for dynamic feeding
     */
    MemoryIOHandler();

    ~MemoryIOHandler() override;

    bool eof() override;
    off_t getFileSize() override;

    /**
     * @brief Append data to the internal buffer
     * @param data Data to append
     * @param size Size of data
     * @return Number of bytes appended (0 for referenced external buffers)
     */
    size_t write(const void* data, size_t size);

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int close_unlocked() override;

    size_t availableSize() const;

    std::vector<uint8_t> m_buffer;
    const uint8_t* m_external_data = nullptr;
    size_t m_external_size = 0;
    bool m_own_buffer = true;
    size_t m_pos = 0;
};

} // namespace IO
} // namespace DiagStream

#endif // MEMORYIOHANDLER_H
