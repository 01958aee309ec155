/*
 * SequentialByteSource.h - Ordered multi-file capture byte source
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

#ifndef SEQUENTIALBYTESOURCE_H
#define SEQUENTIALBYTESOURCE_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {

/**
 * @brief Reads an ordered list of capture files one at a time
 *
 * The source owns exactly one active handler at a time. Reads are served
 * from the active file only; moving on to the next file is always an
 * explicit advance() by the caller, so a caller that wants per-file
 * boundaries gets them and a caller that wants one continuous stream
 * advances on every empty read. Compressed files (".gz", ".bz2") are
 * decompressed transparently.
 *
 * Read failures of the active handler are reported as "no data" and
 * logged on the "io" channel; they never throw.
 */
class SequentialByteSource : public IOHandler {
public:
    /**
     * @brief Construct from a file list and open the first file
     * @param paths Files to read, front to back. An empty list gives a
     *              source that is unavailable from the start.
     * @throws Core::SourceUnavailableException if the first file cannot be opened
     */
    explicit SequentialByteSource(std::vector<std::string> paths);

    /**
     * @brief Convenience constructor for a single file
     */
    explicit SequentialByteSource(const std::string& path);

    ~SequentialByteSource() override;

    using IOHandler::read;

    /**
     * @brief Read up to max_bytes from the active file
     * @return The bytes read; empty when the active file is exhausted,
     *         when no file is active, or after a read error
     */
    std::vector<uint8_t> read(size_t max_bytes);

    /**
     * @brief Close the active file and open the next pending one
     * @return true if a file is now active, false once the list is exhausted
     * @throws Core::SourceUnavailableException if the next file cannot be opened
     */
    bool advance();

    bool eof() override;
    off_t getFileSize() override;

    /**
     * @brief false once advance() has run out of files; never becomes true again
     */
    bool isAvailable() const;

    /**
     * @brief Path of the active file, empty if none is active
     */
    std::string currentPath() const;

    size_t pendingCount() const;
    size_t filesOpened() const;

    /**
     * @brief Choose the handler for a path by its suffix
     * @throws Core::SourceUnavailableException if the file cannot be opened
     */
    static std::unique_ptr<IOHandler> openHandler(const std::string& path);

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int close_unlocked() override;
    void closeActive();

    std::deque<std::string> m_pending;
    std::unique_ptr<IOHandler> m_active;
    std::string m_current_path;
    std::atomic<bool> m_available{true};
    size_t m_files_opened = 0;
};

} // namespace IO
} // namespace DiagStream

#endif // SEQUENTIALBYTESOURCE_H
