/*
 * FileIOHandler.h - Raw capture file reader
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

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {
namespace File {

/**
 * @brief IOHandler for uncompressed capture files on the local filesystem
 *
 * Opens the file in binary mode on construction and reads it strictly
 * forward. The handle is owned by an RAIIFileHandle so it is released on
 * every exit path.
 */
class FileIOHandler : public IOHandler {
public:
    /**
     * @brief Open a capture file for reading
     * @param path Path of the file to open
     * @throws Core::SourceUnavailableException if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path);

    ~FileIOHandler() override;

    bool eof() override;
    off_t getFileSize() override;

    const std::string& path() const { return m_file_path; }

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int close_unlocked() override;

    std::string m_file_path;
    RAIIFileHandle m_file_handle;
    off_t m_cached_file_size = -1;
};

} // namespace File
} // namespace IO
} // namespace DiagStream

#endif // FILEIOHANDLER_H
