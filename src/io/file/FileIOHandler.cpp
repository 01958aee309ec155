/*
 * FileIOHandler.cpp - Raw capture file reader
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

/**
 * @brief Constructs a FileIOHandler for a given local file path.
 *
 * This opens the specified file in binary read mode.
 *
 * @param path The file path to open
 * @throws SourceUnavailableException if the file cannot be opened
 */
FileIOHandler::FileIOHandler(const std::string& path) : m_file_path(path) {
    updateClosedState(false);
    updateEofState(false);
    updatePosition(0);
    updateErrorState(0);

    if (!m_file_handle.open(path, "rb")) {
        int error_code = m_file_handle.openError();
        m_error = error_code;

        std::string errorMsg = getErrorMessage(error_code, "Could not open file");
        Debug::log("io", "FileIOHandler::FileIOHandler() - ", path, ": ", errorMsg);

        if (isRecoverableError(error_code)) {
            Debug::log("io", "FileIOHandler::FileIOHandler() - Error may be recoverable: ", error_code);
        }

        throw Core::SourceUnavailableException(path, errorMsg);
    }

    struct stat st;
    if (fstat(fileno(m_file_handle.get()), &st) == 0) {
        m_cached_file_size = st.st_size;
        Debug::log("io", "FileIOHandler::FileIOHandler() - Opened ", path, ", ", m_cached_file_size, " bytes");
    } else {
        Debug::log("io", "FileIOHandler::FileIOHandler() - Warning: Could not determine file size: ", strerror(errno));
    }
}

/**
 * @brief Destroys the FileIOHandler object.
 *
 * This ensures the underlying file handle is closed properly.
 */
FileIOHandler::~FileIOHandler() {
    close();
}

size_t FileIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed.load() || !m_file_handle.is_valid()) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        // Not an error, just nothing to do
        return 0;
    }

    FILE* file = m_file_handle.get();
    size_t elements_read = fread(buffer, size, count, file);

    if (elements_read < count) {
        if (feof(file)) {
            updateEofState(true);
        } else if (ferror(file)) {
            int error_code = errno ? errno : EIO;
            updateErrorState(error_code, getErrorMessage(error_code, "Read failed on " + m_file_path));
            clearerr(file);
        }
    }

    if (elements_read > 0) {
        off_t new_position = m_position.load() + static_cast<off_t>(elements_read * size);
        if (!updatePosition(new_position)) {
            Debug::log("io", "FileIOHandler::read_unlocked() - Position overflow prevented");
        }
    }

    return elements_read;
}

int FileIOHandler::close_unlocked() {
    updateErrorState(0);

    if (m_closed.load() || !m_file_handle.is_valid()) {
        updateClosedState(true);
        return 0;  // Already closed, not an error
    }

    Debug::log("io", "FileIOHandler::close_unlocked() - Closing file: ", m_file_path);

    int result = m_file_handle.close();
    if (result != 0) {
        updateErrorState(errno, "Failed to close file " + m_file_path);
    }

    // The handle is gone either way
    updateClosedState(true);
    updateEofState(true);

    return result;
}

bool FileIOHandler::eof() {
    return m_closed.load() || !m_file_handle.is_valid() || m_eof.load();
}

off_t FileIOHandler::getFileSize() {
    return m_cached_file_size;
}

} // namespace File
} // namespace IO
} // namespace DiagStream
