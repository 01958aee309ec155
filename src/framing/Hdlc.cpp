/*
 * Hdlc.cpp - HDLC byte-stuffing helpers
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
namespace Hdlc {

std::optional<Frame> unescape(const Frame& frame) {
    Frame out;
    out.reserve(frame.size());

    for (size_t i = 0; i < frame.size(); ++i) {
        if (frame[i] != ESCAPE) {
            out.push_back(frame[i]);
            continue;
        }
        if (i + 1 >= frame.size()) {
            Debug::log("framing", "Hdlc::unescape() - Dangling escape at end of ", frame.size(), " byte frame");
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(frame[++i] ^ ESCAPE_XOR));
    }

    return out;
}

} // namespace Hdlc
} // namespace Framing
} // namespace DiagStream
