/*
 * Frame.h - HDLC frame types shared by the framing layer
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

#ifndef FRAMING_FRAME_H
#define FRAMING_FRAME_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Framing {

/**
 * @brief Bytes strictly between two delimiter occurrences
 */
using Frame = std::vector<uint8_t>;

// Acts as both the opening and the closing boundary of a frame
constexpr uint8_t HDLC_FLAG = 0x7E;

/**
 * @brief Inclusive frame length window; frames outside it are dropped
 */
struct FrameSizeWindow {
    size_t min_size = 3;
    size_t max_size = 8192;

    bool accepts(size_t length) const {
        return length >= min_size && length <= max_size;
    }
};

/**
 * @brief Output of one extraction pass over a combined buffer
 */
struct ExtractionResult {
    std::vector<Frame> frames;      // in-window frames, in stream order
    std::vector<uint8_t> tail;      // carryover; starts at the last delimiter when there is one
    size_t discarded = 0;           // delimited candidates outside the window
    bool used_fallback = false;     // the split strategy produced this result
};

} // namespace Framing
} // namespace DiagStream

#endif // FRAMING_FRAME_H
