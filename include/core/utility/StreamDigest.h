/*
 * StreamDigest.h - Incremental SHA-256 over an ingested byte stream
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

#ifndef STREAMDIGEST_H
#define STREAMDIGEST_H

#include <cstdint>
#include <string>

// Forward declaration for OpenSSL EVP context
struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace DiagStream {
namespace Core {

/**
 * @brief SHA-256 digest accumulated chunk by chunk
 * 
 * Fingerprints the decompressed capture bytes as they pass through the
 * ingestion loop, so identical captures can be recognised regardless of
 * the compression they were stored with.
 * 
 * USAGE PATTERN:
 * =============
 * StreamDigest digest;
 * digest.reset();
 * 
 * // For each chunk read:
 * digest.update(chunk, chunk_size);
 * 
 * // At end of stream:
 * std::string hex = digest.finalizeHex();
 * 
 * @thread_safety This class is NOT thread-safe. External synchronization
 *                required if used from multiple threads.
 */
class StreamDigest {
public:
    static constexpr size_t DIGEST_SIZE = 32;

    StreamDigest();
    ~StreamDigest();

    StreamDigest(const StreamDigest&) = delete;
    StreamDigest& operator=(const StreamDigest&) = delete;

    /**
     * @brief Reset digest state for a new stream
     * @return true if reset successful, false on error
     */
    bool reset();

    /**
     * @brief Feed bytes into the running digest
     * @return true if update successful, false on error
     */
    bool update(const uint8_t* data, size_t size);

    /**
     * @brief Complete the digest and return it as lowercase hex
     * 
     * Calling again after finalization returns the cached value.
     * 
     * @return 64 character hex string, or empty string on error
     */
    std::string finalizeHex();

    bool isFinalized() const { return m_finalized; }

private:
    EVP_MD_CTX* m_ctx;
    bool m_finalized;
    uint8_t m_digest[DIGEST_SIZE];
};

} // namespace Core
} // namespace DiagStream

#endif // STREAMDIGEST_H
