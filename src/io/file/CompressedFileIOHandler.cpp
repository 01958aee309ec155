/*
 * CompressedFileIOHandler.cpp - gzip/bzip2 capture file reader
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
namespace File {

Compression detectCompression(const std::string& path) {
    if (Core::Utility::endsWithIgnoreCase(path, ".gz")) return Compression::Gzip;
    if (Core::Utility::endsWithIgnoreCase(path, ".bz2")) return Compression::Bzip2;
    return Compression::None;
}

const char* compressionName(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return "gzip";
        case Compression::Bzip2: return "bzip2";
        case Compression::None:
        default: return "none";
    }
}

CompressedFileIOHandler::CompressedFileIOHandler(const std::string& path, Compression compression)
    : m_file_path(path), m_compression(compression) {
    updateClosedState(false);
    updateEofState(false);
    updatePosition(0);
    updateErrorState(0);

    if (compression == Compression::None) {
        throw Core::SourceUnavailableException(path, "no decompressor for uncompressed input");
    }

    errno = 0;
    m_file.open(path, std::ios::in | std::ios::binary);
    if (!m_file.is_open()) {
        int error_code = errno ? errno : ENOENT;
        m_error = error_code;
        std::string errorMsg = getErrorMessage(error_code, "Could not open file");
        Debug::log("io", "CompressedFileIOHandler::CompressedFileIOHandler() - ", path, ": ", errorMsg);
        throw Core::SourceUnavailableException(path, errorMsg);
    }

    m_stream = std::make_unique<boost::iostreams::filtering_istream>();
    if (compression == Compression::Gzip) {
        m_stream->push(boost::iostreams::gzip_decompressor());
    } else {
        m_stream->push(boost::iostreams::bzip2_decompressor());
    }
    m_stream->push(m_file);

    // Decompressor failures are raised from inside the stream buffer;
    // with badbit set they propagate to read_unlocked() instead of
    // silently ending the stream.
    m_stream->exceptions(std::ios::badbit);

    Debug::log("io", "CompressedFileIOHandler::CompressedFileIOHandler() - Opened ", path,
              " (", compressionName(compression), ")");
}

CompressedFileIOHandler::~CompressedFileIOHandler() {
    close();
}

size_t CompressedFileIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed.load() || !m_stream) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0 || m_eof.load()) {
        return 0;
    }

    size_t bytes_requested = size * count;
    std::streamsize bytes_read = 0;

    try {
        m_stream->read(static_cast<char*>(buffer), static_cast<std::streamsize>(bytes_requested));
        bytes_read = m_stream->gcount();
        if (m_stream->eof()) {
            updateEofState(true);
        }
    } catch (const std::exception& e) {
        bytes_read = m_stream->gcount();
        updateErrorState(EIO, "Decompression failed for " + m_file_path + ": " + e.what());
        // The filter chain is unusable after a failure
        updateEofState(true);
    }

    if (bytes_read > 0) {
        updatePosition(m_position.load() + static_cast<off_t>(bytes_read));
    }

    return static_cast<size_t>(bytes_read) / size;
}

int CompressedFileIOHandler::close_unlocked() {
    updateErrorState(0);

    if (m_closed.load()) {
        return 0;
    }

    Debug::log("io", "CompressedFileIOHandler::close_unlocked() - Closing file: ", m_file_path);

    // Tear down the filter chain before the underlying file
    m_stream.reset();
    if (m_file.is_open()) {
        m_file.close();
    }

    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool CompressedFileIOHandler::eof() {
    return m_closed.load() || m_eof.load();
}

off_t CompressedFileIOHandler::getFileSize() {
    return -1;
}

} // namespace File
} // namespace IO
} // namespace DiagStream
