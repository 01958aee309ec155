/*
 * IngestBridge.cpp - JSON boundary for ingestion results
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
namespace Ingest {

using JSON::JSONUtil;
using Core::Utility::formatISO8601;

namespace {

std::string completionMessage(const IngestReport& report) {
    const Decoder::DecoderCounters& c = report.decoder_counters;
    std::ostringstream out;
    out << (report.cancelled ? "Cancelled after parsing " : "Successfully parsed ")
        << c.parsed_packets << "/" << c.total_packets << " packets"
        << " (GSM: " << c.gsm_data_extracted
        << ", UMTS: " << c.umts_data_extracted
        << ", LTE: " << c.lte_data_extracted
        << ", NR: " << c.nr_data_extracted
        << ", Messages: " << c.system_messages << ")";
    return out.str();
}

IngestBridge::Value cellToJSON(const Decoder::CellularState::Cell& cell) {
    IngestBridge::Value v = IngestBridge::Value::object();
    v.set("cell_id", cell.cell_id);
    v.set("channel", static_cast<uint64_t>(cell.channel));
    v.set("band", cell.band);
    return v;
}

IngestBridge::Value countMapToJSON(const std::map<std::string, uint64_t>& counts) {
    IngestBridge::Value v = IngestBridge::Value::object();
    for (const auto& entry : counts) {
        v.set(entry.first, entry.second);
    }
    return v;
}

} // namespace

IngestBridge::IngestBridge(IngestionPipeline& pipeline) : m_pipeline(pipeline) {
}

std::string IngestBridge::readCaptureFile(const std::string& path, int indent) {
    return JSONUtil::generateJSON(outcomeToJSON(m_pipeline.ingestFile(path)), indent);
}

std::string IngestBridge::readCaptureFiles(const std::vector<std::string>& paths, int indent) {
    return JSONUtil::generateJSON(outcomeToJSON(m_pipeline.ingestFiles(paths)), indent);
}

std::string IngestBridge::listCaptureFiles(const std::string& directory, int indent) const {
    const IngestConfig& config = m_pipeline.config();
    CaptureDirectory captures(directory, config.capture_extension, config.min_file_size);

    Value files = Value::array();
    for (const auto& info : captures.list()) {
        files.push(fileInfoToJSON(info));
    }

    Value root = Value::object();
    root.set("directory", directory);
    root.set("extension", config.capture_extension);
    root.set("min_file_size", config.min_file_size);
    root.set("files", std::move(files));
    return JSONUtil::generateJSON(root, indent);
}

IngestBridge::Value IngestBridge::outcomeToJSON(const IngestOutcome& outcome) {
    Value root = Value::object();

    if (const auto* report = std::get_if<IngestReport>(&outcome)) {
        root.set("metadata", reportToJSON(*report));
        root.set("status", report->cancelled ? "cancelled" : "completed");
        root.set("message", completionMessage(*report));
    } else if (const auto* skipped = std::get_if<IngestSkipped>(&outcome)) {
        root.set("status", "skipped");
        root.set("reason", skipReasonName(skipped->reason));
        root.set("file_path", skipped->file_path);
        root.set("file_size", skipped->file_size);
        root.set("error", skipped->message);
        root.set("message", skipped->reason == SkipReason::TooSmall
                                ? "File too small to be a capture"
                                : "File could not be read");
    } else if (const auto* failed = std::get_if<IngestFailed>(&outcome)) {
        root.set("metadata", reportToJSON(failed->partial));
        root.set("status", "failed");
        root.set("error", failed->message);
        root.set("message", "Ingestion aborted after " + std::to_string(failed->partial.total_chunks) + " chunks");
    }

    return root;
}

IngestBridge::Value IngestBridge::reportToJSON(const IngestReport& report) {
    Value files = Value::array();
    for (const auto& file : report.files) {
        files.push(file);
    }

    Value samples = Value::array();
    for (const auto& sample : report.hex_samples) {
        Value s = Value::object();
        s.set("chunk_index", sample.chunk_index);
        s.set("buffer_size", sample.buffer_size);
        s.set("hex", sample.hex);
        samples.push(std::move(s));
    }

    Value records = Value::array();
    for (const auto& record : report.sample_records) {
        records.push(recordToJSON(record));
    }

    Value m = Value::object();
    m.set("file_path", report.file_path);
    m.set("files", std::move(files));
    m.set("total_bytes", report.total_bytes);
    m.set("total_chunks", report.total_chunks);
    m.set("avg_chunk_size", report.average_chunk_size);
    m.set("tail_bytes", report.tail_bytes);
    m.set("hex_samples", std::move(samples));
    m.set("signaling_extraction_stats", statisticsToJSON(report.statistics));
    m.set("decoder_stats", countersToJSON(report.decoder_counters));
    m.set("cellular_state", cellularStateToJSON(report.cellular_state));
    m.set("sample_data", std::move(records));
    if (report.sha256.empty()) {
        m.set("sha256", Value());
    } else {
        m.set("sha256", report.sha256);
    }
    m.set("cancelled", report.cancelled);
    m.set("started", formatISO8601(report.started));
    m.set("finished", formatISO8601(report.finished));
    return m;
}

IngestBridge::Value IngestBridge::statisticsToJSON(const ExtractionStatistics& statistics) {
    Value v = Value::object();
    v.set("total_frames", statistics.total_frames);
    v.set("frames_decoded", statistics.frames_decoded);
    v.set("decode_failures", statistics.decode_failures);
    v.set("frames_out_of_window", statistics.frames_out_of_window);
    v.set("fallback_extractions", statistics.fallback_extractions);
    v.set("per_technology", countMapToJSON(statistics.per_technology));
    v.set("per_kind", countMapToJSON(statistics.per_kind));
    return v;
}

IngestBridge::Value IngestBridge::countersToJSON(const Decoder::DecoderCounters& counters) {
    Value v = Value::object();
    v.set("total_packets", counters.total_packets);
    v.set("parsed_packets", counters.parsed_packets);
    v.set("gsm_data_extracted", counters.gsm_data_extracted);
    v.set("umts_data_extracted", counters.umts_data_extracted);
    v.set("lte_data_extracted", counters.lte_data_extracted);
    v.set("nr_data_extracted", counters.nr_data_extracted);
    v.set("system_messages", counters.system_messages);
    v.set("events_extracted", counters.events_extracted);
    return v;
}

IngestBridge::Value IngestBridge::cellularStateToJSON(const Decoder::CellularState& state) {
    Value v = Value::object();
    if (state.gsm) v.set("gsm", cellToJSON(*state.gsm));
    if (state.umts) v.set("umts", cellToJSON(*state.umts));
    if (state.lte) v.set("lte", cellToJSON(*state.lte));
    if (state.nr) v.set("nr", cellToJSON(*state.nr));
    return v;
}

IngestBridge::Value IngestBridge::recordToJSON(const Decoder::DecodedRecord& record) {
    Value v = Value::object();
    v.set("technology", Decoder::technologyName(record.technology));
    v.set("kind", record.kind);
    v.set("summary", record.summary);
    v.set("payload", Core::Utility::toHex(record.payload));
    if (record.timestamp) {
        v.set("timestamp", formatISO8601(*record.timestamp));
    } else {
        v.set("timestamp", Value());
    }
    return v;
}

IngestBridge::Value IngestBridge::fileInfoToJSON(const CaptureFileInfo& info) {
    Value v = Value::object();
    v.set("path", info.path);
    v.set("size", info.size);
    v.set("modified", formatISO8601(info.modified));
    v.set("created", formatISO8601(info.created));
    return v;
}

} // namespace Ingest
} // namespace DiagStream
