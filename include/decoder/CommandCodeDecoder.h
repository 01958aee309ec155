/*
 * CommandCodeDecoder.h - Minimal DIAG command code classifier
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

#ifndef DECODER_COMMANDCODEDECODER_H
#define DECODER_COMMANDCODEDECODER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Decoder {

/**
 * @brief Reference FrameDecoder that classifies DIAG packets
 *
 * Unescapes the frame, strips the CRC and looks at the command code. Log
 * packets are attributed to a radio technology by the equipment nibble of
 * their log code and carry the modem timestamp. No message bodies are
 * parsed, so the cellular state is always empty.
 */
class CommandCodeDecoder : public FrameDecoder {
public:
    static constexpr uint8_t DIAG_LOG_F = 0x10;
    static constexpr uint8_t DIAG_EVENT_REPORT_F = 0x60;
    static constexpr uint8_t DIAG_EXT_MSG_F = 0x79;
    static constexpr uint8_t DIAG_QSR_EXT_MSG_TERSE_F = 0x92;
    static constexpr uint8_t DIAG_MULTI_RADIO_CMD_F = 0x98;
    static constexpr uint8_t DIAG_QSR4_EXT_MSG_TERSE_F = 0x99;

    // cmd(1) more(1) len(2) len(2) log_code(2) timestamp(8)
    static constexpr size_t LOG_HEADER_SIZE = 16;

    CommandCodeDecoder() = default;
    ~CommandCodeDecoder() override = default;

    std::optional<DecodedRecord> decode(const Framing::Frame& frame, bool hdlc_encoded, bool has_crc) override;
    void resetStatistics() override;
    DecoderCounters getExtractionStatistics() const override;
    CellularState getCurrentCellularState() const override;

    /**
     * @brief Radio technology owning a log code (Unknown if not attributable)
     */
    static RadioTechnology technologyForLogCode(uint16_t log_code);

    /**
     * @brief Convert a modem timestamp (1.25 ms ticks since 1980-01-06 in
     *        the upper 48 bits) to wall-clock time
     */
    static std::chrono::system_clock::time_point convertTimestamp(uint64_t raw);

private:
    void decodeLogPacket(const Framing::Frame& body, DecodedRecord& record);
    void countTechnology(RadioTechnology technology);

    DecoderCounters m_counters;
};

} // namespace Decoder
} // namespace DiagStream

#endif // DECODER_COMMANDCODEDECODER_H
