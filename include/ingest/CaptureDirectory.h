/*
 * CaptureDirectory.h - Capture file discovery
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

#ifndef INGEST_CAPTUREDIRECTORY_H
#define INGEST_CAPTUREDIRECTORY_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Ingest {

struct CaptureFileInfo {
    std::string path;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified;
    std::chrono::system_clock::time_point created;     // inode change time
};

/**
 * @brief Finds capture files in one directory (not recursive)
 */
class CaptureDirectory {
public:
    CaptureDirectory(std::string directory, std::string extension = ".qmdl",
                     uint64_t min_file_size = 20ULL * 1024 * 1024);

    /**
     * @brief Regular files whose name ends in the extension (any case) and
     *        whose size is at least the minimum, sorted by path
     *
     * An unreadable directory yields an empty list.
     */
    std::vector<CaptureFileInfo> list() const;

    /**
     * @brief stat() a single file
     * @return The file's info, or std::nullopt if it cannot be stat'ed
     */
    static std::optional<CaptureFileInfo> getFileInfo(const std::string& path);

    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
    std::string m_extension;
    uint64_t m_min_file_size;
};

} // namespace Ingest
} // namespace DiagStream

#endif // INGEST_CAPTUREDIRECTORY_H
