/*
 * StreamDigest.cpp - Incremental SHA-256 over an ingested byte stream
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
namespace Core {

StreamDigest::StreamDigest()
    : m_ctx(nullptr)
    , m_finalized(false)
{
    for (size_t i = 0; i < DIGEST_SIZE; i++) {
        m_digest[i] = 0;
    }
}

StreamDigest::~StreamDigest()
{
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

bool StreamDigest::reset()
{
    // Free existing context if any
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = EVP_MD_CTX_new();
    if (!m_ctx) {
        Debug::log("error", "StreamDigest::reset() - Failed to create SHA-256 context");
        return false;
    }

    if (!EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr)) {
        Debug::log("error", "StreamDigest::reset() - Failed to initialize SHA-256 digest");
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    m_finalized = false;
    for (size_t i = 0; i < DIGEST_SIZE; i++) {
        m_digest[i] = 0;
    }

    return true;
}

bool StreamDigest::update(const uint8_t* data, size_t size)
{
    if (!m_ctx) {
        Debug::log("error", "StreamDigest::update() - Context not initialized");
        return false;
    }

    if (m_finalized) {
        Debug::log("error", "StreamDigest::update() - Cannot update after finalization");
        return false;
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    if (!EVP_DigestUpdate(m_ctx, data, size)) {
        Debug::log("error", "StreamDigest::update() - Failed to update SHA-256 digest");
        return false;
    }

    return true;
}

std::string StreamDigest::finalizeHex()
{
    if (m_finalized) {
        return Utility::toHex(m_digest, DIGEST_SIZE);
    }

    if (!m_ctx) {
        Debug::log("error", "StreamDigest::finalizeHex() - Context not initialized");
        return "";
    }

    unsigned int digest_len = 0;
    if (!EVP_DigestFinal_ex(m_ctx, m_digest, &digest_len) || digest_len != DIGEST_SIZE) {
        Debug::log("error", "StreamDigest::finalizeHex() - Failed to finalize SHA-256 digest");
        return "";
    }

    m_finalized = true;
    return Utility::toHex(m_digest, DIGEST_SIZE);
}

} // namespace Core
} // namespace DiagStream
