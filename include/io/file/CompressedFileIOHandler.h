/*
 * CompressedFileIOHandler.h - gzip/bzip2 capture file reader
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

#ifndef COMPRESSEDFILEIOHANDLER_H
#define COMPRESSEDFILEIOHANDLER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {
namespace File {

enum class Compression {
    None,
    Gzip,
    Bzip2
};

/**
 * @brief Pick the decompression mode from the file name suffix.
 *
 * ".gz" selects gzip and ".bz2" selects bzip2, compared case-insensitively.
 * Everything else is read as raw binary.
 */
Compression detectCompression(const std::string& path);

const char* compressionName(Compression compression);

/**
 * @brief IOHandler yielding the decompressed bytes of a gzip or bzip2 file
 *
 * The file is read through a Boost.Iostreams filtering chain. Corrupt
 * compressed data surfaces as a read error (EIO) rather than an exception.
 * The decompressed size is not known up front, so getFileSize() reports -1.
 */
class CompressedFileIOHandler : public IOHandler {
public:
    /**
     * @param path Path of the compressed capture
     * @param compression Gzip or Bzip2
     * @throws Core::SourceUnavailableException if the file cannot be opened
     */
    CompressedFileIOHandler(const std::string& path, Compression compression);

    ~CompressedFileIOHandler() override;

    bool eof() override;
    off_t getFileSize() override;

    Compression compression() const { return m_compression; }

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int close_unlocked() override;

    std::string m_file_path;
    Compression m_compression;
    std::ifstream m_file;
    std::unique_ptr<boost::iostreams::filtering_istream> m_stream;
};

} // namespace File
} // namespace IO
} // namespace DiagStream

#endif // COMPRESSEDFILEIOHANDLER_H
