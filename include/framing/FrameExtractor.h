/*
 * FrameExtractor.h - Delimiter-based frame extraction with carryover
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

#ifndef FRAMING_FRAMEEXTRACTOR_H
#define FRAMING_FRAMEEXTRACTOR_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Framing {

/**
 * @brief Splits a byte buffer into HDLC frames and a carryover tail
 *
 * The caller prepends the previous tail to each new chunk and hands the
 * combined buffer to extract(). Because the tail always begins at the last
 * delimiter seen, a frame that straddles any number of chunk boundaries is
 * recovered intact, and the frames produced do not depend on how the
 * stream was chunked.
 *
 * Bytes before the first delimiter of a buffer are never emitted as a
 * frame. The extractor holds no stream state and never blocks.
 */
class FrameExtractor {
public:
    explicit FrameExtractor(FrameSizeWindow window = FrameSizeWindow());
    virtual ~FrameExtractor() = default;

    /**
     * @brief Extract frames with the delimiter scan, falling back to
     *        extractBySplitting() if the scan fails
     */
    ExtractionResult extract(const std::vector<uint8_t>& buffer) const;

    /**
     * @brief Split-based extraction
     *
     * Splits on every delimiter, drops the segment before the first one and
     * keeps the last segment (with its opening delimiter) as the tail.
     * Produces the same frames and tail as the delimiter scan.
     */
    ExtractionResult extractBySplitting(const std::vector<uint8_t>& buffer) const;

    const FrameSizeWindow& window() const { return m_window; }

protected:
    /**
     * @brief Delimiter position scan
     * @throws Core::FramingException if the scan's own bookkeeping is inconsistent
     */
    virtual ExtractionResult scanDelimiters(const std::vector<uint8_t>& buffer) const;

private:
    FrameSizeWindow m_window;
};

} // namespace Framing
} // namespace DiagStream

#endif // FRAMING_FRAMEEXTRACTOR_H
