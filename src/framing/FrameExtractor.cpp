/*
 * FrameExtractor.cpp - Delimiter-based frame extraction with carryover
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
namespace Framing {

FrameExtractor::FrameExtractor(FrameSizeWindow window) : m_window(window) {
    if (m_window.min_size > m_window.max_size) {
        throw std::invalid_argument("FrameExtractor: minimum frame size " + std::to_string(m_window.min_size) +
                                    " exceeds maximum " + std::to_string(m_window.max_size));
    }
}

ExtractionResult FrameExtractor::extract(const std::vector<uint8_t>& buffer) const {
    try {
        return scanDelimiters(buffer);
    } catch (const std::exception& e) {
        Debug::log("framing", "FrameExtractor::extract() - Delimiter scan failed (", e.what(),
                  "), splitting ", buffer.size(), " bytes instead");
        return extractBySplitting(buffer);
    }
}

ExtractionResult FrameExtractor::scanDelimiters(const std::vector<uint8_t>& buffer) const {
    ExtractionResult result;

    std::vector<size_t> positions;
    for (size_t i = 0; i < buffer.size(); ++i) {
        if (buffer[i] == HDLC_FLAG) {
            positions.push_back(i);
        }
    }

    if (positions.size() < 2) {
        // Nothing is closed yet; keep everything for the next chunk
        result.tail = buffer;
        return result;
    }

    size_t accounted = positions.front();
    for (size_t i = 0; i + 1 < positions.size(); ++i) {
        size_t start = positions[i] + 1;
        size_t end = positions[i + 1];
        size_t length = end - start;

        accounted += length + 1;

        if (!m_window.accepts(length)) {
            result.discarded++;
            continue;
        }
        result.frames.emplace_back(buffer.begin() + start, buffer.begin() + end);
    }

    result.tail.assign(buffer.begin() + positions.back(), buffer.end());
    accounted += result.tail.size();

    if (accounted != buffer.size() || result.tail.empty() || result.tail.front() != HDLC_FLAG) {
        throw Core::FramingException("scan accounted for " + std::to_string(accounted) +
                                     " of " + std::to_string(buffer.size()) + " bytes");
    }

    return result;
}

ExtractionResult FrameExtractor::extractBySplitting(const std::vector<uint8_t>& buffer) const {
    ExtractionResult result;
    result.used_fallback = true;

    std::vector<std::vector<uint8_t>> segments(1);
    for (uint8_t byte : buffer) {
        if (byte == HDLC_FLAG) {
            segments.emplace_back();
        } else {
            segments.back().push_back(byte);
        }
    }

    if (segments.size() == 1) {
        // No delimiter at all
        result.tail = buffer;
        return result;
    }

    if (segments.size() == 2) {
        // A single delimiter opens a frame that is not closed yet. The
        // leading segment still has to travel with it: the whole buffer is
        // the tail, exactly as for the delimiter scan.
        result.tail = buffer;
        return result;
    }

    // segments[0] precedes the first delimiter and is never a frame
    for (size_t i = 1; i + 1 < segments.size(); ++i) {
        if (!m_window.accepts(segments[i].size())) {
            result.discarded++;
            continue;
        }
        result.frames.push_back(std::move(segments[i]));
    }

    result.tail.reserve(segments.back().size() + 1);
    result.tail.push_back(HDLC_FLAG);
    result.tail.insert(result.tail.end(), segments.back().begin(), segments.back().end());

    return result;
}

} // namespace Framing
} // namespace DiagStream
