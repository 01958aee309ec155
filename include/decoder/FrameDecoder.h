/*
 * FrameDecoder.h - Interface of the frame decoding collaborator
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

#ifndef DECODER_FRAMEDECODER_H
#define DECODER_FRAMEDECODER_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Decoder {

enum class RadioTechnology {
    Unknown,
    GSM,
    UMTS,
    LTE,
    NR
};

const char* technologyName(RadioTechnology technology);

/**
 * @brief One frame decoded into a structured record
 */
struct DecodedRecord {
    RadioTechnology technology = RadioTechnology::Unknown;
    std::string kind;                   // e.g. "log", "event", "ext_msg"
    std::string summary;
    std::vector<uint8_t> payload;
    std::optional<std::chrono::system_clock::time_point> timestamp;
};

/**
 * @brief Running totals kept by a decoder
 */
struct DecoderCounters {
    uint64_t total_packets = 0;
    uint64_t parsed_packets = 0;
    uint64_t gsm_data_extracted = 0;
    uint64_t umts_data_extracted = 0;
    uint64_t lte_data_extracted = 0;
    uint64_t nr_data_extracted = 0;
    uint64_t system_messages = 0;
    uint64_t events_extracted = 0;
};

/**
 * @brief Serving cell per radio technology, as far as the decoder knows it
 */
struct CellularState {
    struct Cell {
        std::string cell_id;
        uint32_t channel = 0;   // ARFCN / UARFCN / EARFCN / NR-ARFCN
        std::string band;
    };

    std::optional<Cell> gsm;
    std::optional<Cell> umts;
    std::optional<Cell> lte;
    std::optional<Cell> nr;

    bool empty() const { return !gsm && !umts && !lte && !nr; }
};

/**
 * @brief Decoder collaborator consumed by the ingestion pipeline
 *
 * Implementations turn a single extracted frame into a record. They own
 * all protocol knowledge; the pipeline only counts what comes back.
 */
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    /**
     * @param frame Frame content without delimiters
     * @param hdlc_encoded Frame is still byte-stuffed
     * @param has_crc Frame carries a trailing 2-byte CRC
     * @return The decoded record, or std::nullopt if the frame could not be decoded
     */
    virtual std::optional<DecodedRecord> decode(const Framing::Frame& frame, bool hdlc_encoded, bool has_crc) = 0;

    virtual void resetStatistics() = 0;
    virtual DecoderCounters getExtractionStatistics() const = 0;
    virtual CellularState getCurrentCellularState() const = 0;
};

} // namespace Decoder
} // namespace DiagStream

#endif // DECODER_FRAMEDECODER_H
