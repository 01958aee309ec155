/*
 * IngestBridge.h - JSON boundary for ingestion results
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

#ifndef INGEST_INGESTBRIDGE_H
#define INGEST_INGESTBRIDGE_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Ingest {

/**
 * @brief Turns pipeline outcomes into JSON text for external callers
 *
 * Bytes are written as lowercase hex strings and times as ISO-8601. The
 * bridge owns nothing; the pipeline (and through it the decoder) belongs
 * to the caller.
 */
class IngestBridge {
public:
    using Value = JSON::JSONUtil::Value;

    explicit IngestBridge(IngestionPipeline& pipeline);

    /**
     * @brief Ingest one capture and describe the outcome
     * @param indent JSON indentation, 0 for compact output
     */
    std::string readCaptureFile(const std::string& path, int indent = 0);

    /**
     * @brief Ingest several captures as one chained stream
     */
    std::string readCaptureFiles(const std::vector<std::string>& paths, int indent = 0);

    /**
     * @brief List the captures of a directory that pass the pipeline's size gate
     */
    std::string listCaptureFiles(const std::string& directory, int indent = 0) const;

    static Value outcomeToJSON(const IngestOutcome& outcome);
    static Value reportToJSON(const IngestReport& report);
    static Value statisticsToJSON(const ExtractionStatistics& statistics);
    static Value countersToJSON(const Decoder::DecoderCounters& counters);
    static Value cellularStateToJSON(const Decoder::CellularState& state);
    static Value recordToJSON(const Decoder::DecodedRecord& record);
    static Value fileInfoToJSON(const CaptureFileInfo& info);

private:
    IngestionPipeline& m_pipeline;
};

} // namespace Ingest
} // namespace DiagStream

#endif // INGEST_INGESTBRIDGE_H
