/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace IO {

/**
 * @brief Base IOHandler interface for unified I/O operations
 * 
 * This class provides a consistent, forward-only interface for reading
 * capture data from raw files, compressed files and memory buffers.
 * All concrete implementations must provide virtual destructor for proper cleanup.
 */
class IOHandler {
public:
    /**
     * @brief Constructor for IOHandler base class
     */
    IOHandler();
    
    /**
     * @brief Virtual destructor for proper polymorphic cleanup
     */
    virtual ~IOHandler();
    
    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count);
    
    /**
     * @brief Get number of bytes consumed so far
     * @return Current position, -1 on failure
     */
    virtual off_t tell();
    
    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close();
    
    /**
     * @brief Check if at end-of-stream condition
     * @return true if at end of stream, false otherwise
     */
    virtual bool eof();
    
    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown (compressed streams)
     */
    virtual off_t getFileSize();
    
    /**
     * @brief Get the last error code
     * @return Error code (0 = no error)
     */
    virtual int getLastError() const;

    /**
     * @brief Check whether close() has been called
     */
    bool isClosed() const;

protected:
    /**
     * @brief Convert error code to consistent error message
     * @param error_code The error code to convert
     * @param context Additional context for the error
     * @return Descriptive error message
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");
    
    /**
     * @brief Check if the given error code represents a temporary/recoverable error
     * @param error_code The error code to check
     * @return true if error is potentially recoverable, false otherwise
     */
    static bool isRecoverableError(int error_code);

private:
    // Private unlocked methods for thread-safe implementation
    
    /**
     * @brief Read data from the source (unlocked version)
     */
    virtual size_t read_unlocked(void* buffer, size_t size, size_t count);
    
    /**
     * @brief Get current byte offset position (unlocked version)
     */
    virtual off_t tell_unlocked();
    
    /**
     * @brief Close the I/O source and cleanup resources (unlocked version)
     */
    virtual int close_unlocked();

protected:
    /**
     * @brief Common state tracking for derived classes
     */
    std::atomic<bool> m_closed{false};   // Indicates if the handler is closed (thread-safe)
    std::atomic<bool> m_eof{false};      // Indicates end-of-stream condition (thread-safe)
    std::atomic<off_t> m_position{0};    // Bytes consumed so far (thread-safe)
    std::atomic<int> m_error{0};         // Last error code (0 = no error) (thread-safe)
    
    // Thread safety synchronization
    mutable std::shared_mutex m_operation_mutex;  // Allows concurrent queries, exclusive reads
    
    /**
     * @brief Thread-safe position update with overflow protection
     * @param new_position New position value
     * @return true if position was updated successfully, false if it would be negative
     */
    bool updatePosition(off_t new_position);
    
    /**
     * @brief Thread-safe error state update
     * @param error_code New error code
     * @param error_message Optional error message for logging
     */
    void updateErrorState(int error_code, const std::string& error_message = "");
    
    /**
     * @brief Thread-safe EOF state update
     */
    void updateEofState(bool eof_state);
    
    /**
     * @brief Thread-safe closed state update
     */
    void updateClosedState(bool closed_state);
};

} // namespace IO
} // namespace DiagStream

#endif // IOHANDLER_H
