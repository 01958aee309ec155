/*
 * IngestTypes.h - Results of an ingestion run
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

#ifndef INGEST_INGESTTYPES_H
#define INGEST_INGESTTYPES_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Ingest {

/**
 * @brief Frame counters kept by the pipeline for one run
 *
 * Counts are exact even when frame retention is capped. Only the pipeline
 * mutates them; every run starts from a fresh set.
 */
struct ExtractionStatistics {
    uint64_t total_frames = 0;          // in-window frames extracted
    uint64_t frames_decoded = 0;        // decoder returned a record
    uint64_t decode_failures = 0;       // decoder returned nothing
    uint64_t frames_out_of_window = 0;  // delimited but too short or too long
    uint64_t fallback_extractions = 0;  // buffers framed by the split strategy
    std::map<std::string, uint64_t> per_technology;
    std::map<std::string, uint64_t> per_kind;
};

/**
 * @brief Leading bytes of one combined (tail + chunk) buffer
 */
struct HexSample {
    uint64_t chunk_index = 0;
    uint64_t buffer_size = 0;
    std::string hex;                    // at most hex_sample_bytes bytes, lowercase
};

struct ProgressSnapshot {
    uint64_t chunks = 0;
    uint64_t bytes = 0;
    ExtractionStatistics statistics;
    Decoder::CellularState cellular_state;
};

struct IngestReport {
    std::string file_path;
    std::vector<std::string> files;     // every file read, in order
    uint64_t total_bytes = 0;
    uint64_t total_chunks = 0;
    double average_chunk_size = 0.0;
    uint64_t tail_bytes = 0;            // unframed bytes left at the end
    std::vector<HexSample> hex_samples;
    ExtractionStatistics statistics;
    Decoder::DecoderCounters decoder_counters;
    Decoder::CellularState cellular_state;
    std::vector<Decoder::DecodedRecord> sample_records;
    std::string sha256;                 // empty when digesting is disabled
    bool cancelled = false;
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;
};

enum class SkipReason {
    NotFound,
    TooSmall,
    Unopenable
};

const char* skipReasonName(SkipReason reason);

/**
 * @brief The capture was never read
 */
struct IngestSkipped {
    std::string file_path;
    SkipReason reason = SkipReason::NotFound;
    std::string message;
    int64_t file_size = -1;             // -1 when stat() failed
};

/**
 * @brief Reading started but was aborted by an unexpected error
 */
struct IngestFailed {
    std::string message;
    IngestReport partial;
};

using IngestOutcome = std::variant<IngestReport, IngestSkipped, IngestFailed>;

} // namespace Ingest
} // namespace DiagStream

#endif // INGEST_INGESTTYPES_H
