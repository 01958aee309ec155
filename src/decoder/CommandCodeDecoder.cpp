/*
 * CommandCodeDecoder.cpp - Minimal DIAG command code classifier
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
namespace Decoder {

namespace {

// 1980-01-06T00:00:00Z in Unix seconds
constexpr int64_t GPS_EPOCH_UNIX_SECONDS = 315964800;

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint64_t readLE64(const uint8_t* p) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

std::string hex16(uint16_t value) {
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << value;
    return out.str();
}

std::string hex8(uint8_t value) {
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return out.str();
}

} // namespace

const char* technologyName(RadioTechnology technology) {
    switch (technology) {
        case RadioTechnology::GSM: return "GSM";
        case RadioTechnology::UMTS: return "UMTS";
        case RadioTechnology::LTE: return "LTE";
        case RadioTechnology::NR: return "NR";
        case RadioTechnology::Unknown:
        default: return "Unknown";
    }
}

RadioTechnology CommandCodeDecoder::technologyForLogCode(uint16_t log_code) {
    uint8_t equipment = (log_code >> 12) & 0x0F;
    uint8_t subsystem = (log_code >> 8) & 0x0F;

    switch (equipment) {
        case 0x4:
        case 0x7:
            return RadioTechnology::UMTS;
        case 0x5:
            return RadioTechnology::GSM;
        case 0xB:
            // 0xB8xx and 0xB9xx are NR5G, the rest of 0xBxxx is LTE
            return (subsystem == 0x8 || subsystem == 0x9) ? RadioTechnology::NR : RadioTechnology::LTE;
        default:
            return RadioTechnology::Unknown;
    }
}

std::chrono::system_clock::time_point CommandCodeDecoder::convertTimestamp(uint64_t raw) {
    uint64_t ticks = raw >> 16;
    auto since_epoch = std::chrono::seconds(GPS_EPOCH_UNIX_SECONDS) +
                       std::chrono::microseconds(static_cast<int64_t>(ticks) * 1250);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

void CommandCodeDecoder::countTechnology(RadioTechnology technology) {
    switch (technology) {
        case RadioTechnology::GSM: m_counters.gsm_data_extracted++; break;
        case RadioTechnology::UMTS: m_counters.umts_data_extracted++; break;
        case RadioTechnology::LTE: m_counters.lte_data_extracted++; break;
        case RadioTechnology::NR: m_counters.nr_data_extracted++; break;
        case RadioTechnology::Unknown:
        default: break;
    }
}

void CommandCodeDecoder::decodeLogPacket(const Framing::Frame& body, DecodedRecord& record) {
    record.kind = "log";

    if (body.size() < LOG_HEADER_SIZE) {
        record.summary = "truncated log packet";
        return;
    }

    uint16_t log_code = readLE16(&body[6]);
    record.technology = technologyForLogCode(log_code);
    record.timestamp = convertTimestamp(readLE64(&body[8]));
    record.payload.assign(body.begin() + LOG_HEADER_SIZE, body.end());
    record.summary = "log " + hex16(log_code) + " (" + technologyName(record.technology) + "), " +
                     std::to_string(record.payload.size()) + " bytes";
    countTechnology(record.technology);
}

std::optional<DecodedRecord> CommandCodeDecoder::decode(const Framing::Frame& frame, bool hdlc_encoded, bool has_crc) {
    m_counters.total_packets++;

    Framing::Frame body;
    if (hdlc_encoded) {
        std::optional<Framing::Frame> unescaped = Framing::Hdlc::unescape(frame);
        if (!unescaped) {
            return std::nullopt;
        }
        body = std::move(*unescaped);
    } else {
        body = frame;
    }

    if (has_crc) {
        if (body.size() < 3) {
            Debug::log("decoder", "CommandCodeDecoder::decode() - ", body.size(), " bytes is too short to carry a CRC");
            return std::nullopt;
        }
        body.resize(body.size() - 2);
    }

    if (body.empty()) {
        return std::nullopt;
    }

    DecodedRecord record;
    uint8_t command = body[0];

    switch (command) {
        case DIAG_LOG_F:
            decodeLogPacket(body, record);
            break;
        case DIAG_EVENT_REPORT_F:
            record.kind = "event";
            record.payload.assign(body.begin() + 1, body.end());
            record.summary = "event report, " + std::to_string(record.payload.size()) + " bytes";
            m_counters.events_extracted++;
            break;
        case DIAG_EXT_MSG_F:
        case DIAG_QSR_EXT_MSG_TERSE_F:
        case DIAG_QSR4_EXT_MSG_TERSE_F:
            record.kind = "ext_msg";
            record.payload.assign(body.begin() + 1, body.end());
            record.summary = "extended message " + hex8(command);
            m_counters.system_messages++;
            break;
        case DIAG_MULTI_RADIO_CMD_F:
            record.kind = "multi_radio";
            record.payload.assign(body.begin() + 1, body.end());
            record.summary = "multi-radio command, " + std::to_string(record.payload.size()) + " bytes";
            break;
        default:
            record.kind = "command";
            record.payload.assign(body.begin() + 1, body.end());
            record.summary = "command " + hex8(command);
            break;
    }

    m_counters.parsed_packets++;
    return record;
}

void CommandCodeDecoder::resetStatistics() {
    m_counters = DecoderCounters();
}

DecoderCounters CommandCodeDecoder::getExtractionStatistics() const {
    return m_counters;
}

CellularState CommandCodeDecoder::getCurrentCellularState() const {
    return CellularState();
}

} // namespace Decoder
} // namespace DiagStream
