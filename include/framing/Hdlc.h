/*
 * Hdlc.h - HDLC byte-stuffing helpers
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

#ifndef FRAMING_HDLC_H
#define FRAMING_HDLC_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Framing {
namespace Hdlc {

constexpr uint8_t ESCAPE = 0x7D;
constexpr uint8_t ESCAPE_XOR = 0x20;

/**
 * @brief Undo HDLC byte stuffing (0x7D xx -> xx ^ 0x20)
 * @param frame Escaped frame content without delimiters
 * @return The unescaped bytes, or std::nullopt if the frame ends in a
 *         dangling escape byte
 */
std::optional<Frame> unescape(const Frame& frame);

} // namespace Hdlc
} // namespace Framing
} // namespace DiagStream

#endif // FRAMING_HDLC_H
