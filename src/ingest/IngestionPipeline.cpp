/*
 * IngestionPipeline.cpp - Chunked capture ingestion
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

const char* skipReasonName(SkipReason reason) {
    switch (reason) {
        case SkipReason::NotFound: return "not_found";
        case SkipReason::TooSmall: return "too_small";
        case SkipReason::Unopenable: return "unopenable";
        default: return "unknown";
    }
}

namespace {

IngestConfig validated(IngestConfig config) {
    config.validate();
    return config;
}

} // namespace

IngestionPipeline::IngestionPipeline(Decoder::FrameDecoder& decoder, IngestConfig config)
    : m_decoder(decoder), m_config(validated(std::move(config))), m_extractor(m_config.frame_window) {
}

void IngestionPipeline::cancel() {
    Debug::log("ingest", "IngestionPipeline::cancel() - Cancellation requested");
    m_cancel_requested.store(true);
}

void IngestionPipeline::setProgressCallback(ProgressCallback callback) {
    m_progress_callback = std::move(callback);
}

std::optional<IngestSkipped> IngestionPipeline::checkGate(const std::string& path) const {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        int error_code = errno;
        IngestSkipped skipped;
        skipped.file_path = path;
        skipped.reason = (error_code == ENOENT || error_code == ENOTDIR) ? SkipReason::NotFound : SkipReason::Unopenable;
        skipped.message = std::string("Cannot stat file: ") + strerror(error_code);
        Debug::log("ingest", "IngestionPipeline::checkGate() - ", path, ": ", skipped.message);
        return skipped;
    }

    if (S_ISDIR(st.st_mode)) {
        IngestSkipped skipped;
        skipped.file_path = path;
        skipped.reason = SkipReason::Unopenable;
        skipped.message = "Path is a directory";
        skipped.file_size = static_cast<int64_t>(st.st_size);
        return skipped;
    }

    if (static_cast<uint64_t>(st.st_size) < m_config.min_file_size) {
        IngestSkipped skipped;
        skipped.file_path = path;
        skipped.reason = SkipReason::TooSmall;
        skipped.file_size = static_cast<int64_t>(st.st_size);
        skipped.message = "File is " + std::to_string(st.st_size) + " bytes, minimum is " +
                          std::to_string(m_config.min_file_size);
        Debug::log("ingest", "IngestionPipeline::checkGate() - ", path, ": ", skipped.message);
        return skipped;
    }

    return std::nullopt;
}

IngestOutcome IngestionPipeline::ingestFile(const std::string& path) {
    return ingestFiles(std::vector<std::string>{path});
}

IngestOutcome IngestionPipeline::ingestFiles(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        IngestSkipped skipped;
        skipped.reason = SkipReason::NotFound;
        skipped.message = "No capture files given";
        return skipped;
    }

    // Gate every file up front; nothing is opened unless all pass
    for (const auto& path : paths) {
        if (auto skipped = checkGate(path)) {
            return *skipped;
        }
    }

    std::unique_ptr<IO::SequentialByteSource> source;
    try {
        source = std::make_unique<IO::SequentialByteSource>(paths);
    } catch (const Core::SourceUnavailableException& e) {
        IngestSkipped skipped;
        skipped.file_path = e.path();
        skipped.reason = SkipReason::Unopenable;
        skipped.message = e.what();
        return skipped;
    }

    IO::SequentialByteSource& chain = *source;
    std::string label = paths.front();

    if (paths.size() == 1) {
        return runChunkLoop(chain, label, nullptr);
    }

    return runChunkLoop(chain, label, [this, &chain]() {
        // SourceUnavailableException from a later file aborts the run
        if (!chain.advance()) {
            return false;
        }
        m_report.files.push_back(chain.currentPath());
        return true;
    });
}

IngestOutcome IngestionPipeline::ingestStream(IO::IOHandler& source, const std::string& label) {
    return runChunkLoop(source, label, nullptr);
}

void IngestionPipeline::beginRun(const std::string& label) {
    m_cancel_requested.store(false);
    m_report = IngestReport();
    m_report.file_path = label;
    m_report.files.push_back(label);
    m_report.started = std::chrono::system_clock::now();
    m_tail.clear();
    m_frames.clear();
    m_decoder.resetStatistics();
    m_digest_ok = m_config.compute_digest && m_digest.reset();

    Debug::log("ingest", "IngestionPipeline::beginRun() - Reading ", label, " in ", m_config.chunk_size, " byte chunks");
}

IngestOutcome IngestionPipeline::runChunkLoop(IO::IOHandler& source, const std::string& label,
                                              const std::function<bool()>& next_file) {
    try {
        beginRun(label);

        std::vector<uint8_t> chunk(m_config.chunk_size);

        while (true) {
            if (m_cancel_requested.load()) {
                Debug::log("ingest", "IngestionPipeline::runChunkLoop() - Cancelled after ", m_report.total_chunks, " chunks");
                m_report.cancelled = true;
                break;
            }

            size_t got = source.read(chunk.data(), 1, chunk.size());
            if (got == 0) {
                // Current file exhausted (or unreadable); chained runs move on
                if (next_file && next_file()) {
                    continue;
                }
                break;
            }

            processChunk(chunk.data(), got);
        }

        source.close();
        finishRun();
        collectDecoderState();
        return m_report;
    } catch (const std::exception& e) {
        return failRun(source, label, std::string(typeid(e).name()) + ": " + e.what());
    } catch (...) {
        // Decoders and progress callbacks are free to throw anything
        return failRun(source, label, "unknown exception");
    }
}

IngestFailed IngestionPipeline::failRun(IO::IOHandler& source, const std::string& label, const std::string& message) {
    Debug::log("error", "IngestionPipeline::runChunkLoop() - Ingestion of ", label, " aborted after ",
              m_report.total_chunks, " chunks: ", message);

    source.close();
    finishRun();

    try {
        collectDecoderState();
    } catch (const std::exception& e) {
        Debug::log("error", "IngestionPipeline::failRun() - Decoder state unavailable: ", e.what());
    } catch (...) {
        Debug::log("error", "IngestionPipeline::failRun() - Decoder state unavailable: unknown exception");
    }

    IngestFailed failed;
    failed.message = message;
    failed.partial = m_report;
    return failed;
}

void IngestionPipeline::processChunk(const uint8_t* data, size_t size) {
    if (m_digest_ok && !m_digest.update(data, size)) {
        Debug::log("ingest", "IngestionPipeline::processChunk() - Stream digest disabled for this run");
        m_digest_ok = false;
    }

    // The carried tail never holds more than one delimiter, so a frame can
    // only close inside the bytes appended here
    size_t carried = m_tail.size();
    m_tail.insert(m_tail.end(), data, data + size);

    if (m_report.hex_samples.size() < m_config.hex_sample_count) {
        HexSample sample;
        sample.chunk_index = m_report.total_chunks;
        sample.buffer_size = m_tail.size();
        sample.hex = Core::Utility::toHex(m_tail.data(), std::min(m_tail.size(), m_config.hex_sample_bytes));
        m_report.hex_samples.push_back(std::move(sample));
    }

    m_report.total_chunks++;
    m_report.total_bytes += size;

    if (std::find(m_tail.begin() + carried, m_tail.end(), Framing::HDLC_FLAG) != m_tail.end()) {
        Framing::ExtractionResult result = m_extractor.extract(m_tail);
        m_report.statistics.frames_out_of_window += result.discarded;
        if (result.used_fallback) {
            m_report.statistics.fallback_extractions++;
        }
        m_tail = std::move(result.tail);

        for (auto& frame : result.frames) {
            forwardFrame(std::move(frame));
        }
    }

    if (m_config.progress_interval > 0 && m_report.total_chunks % m_config.progress_interval == 0) {
        reportProgress();
    }
}

void IngestionPipeline::forwardFrame(Framing::Frame frame) {
    ExtractionStatistics& stats = m_report.statistics;
    stats.total_frames++;

    std::optional<Decoder::DecodedRecord> record = m_decoder.decode(frame, true, true);

    if (m_frames.size() < m_config.max_retained_frames) {
        m_frames.push_back(std::move(frame));
    }

    if (!record) {
        stats.decode_failures++;
        return;
    }

    stats.frames_decoded++;
    stats.per_technology[Decoder::technologyName(record->technology)]++;
    stats.per_kind[record->kind]++;

    if (m_report.sample_records.size() < m_config.max_sample_records) {
        m_report.sample_records.push_back(std::move(*record));
    }
}

void IngestionPipeline::reportProgress() {
    ProgressSnapshot snapshot;
    snapshot.chunks = m_report.total_chunks;
    snapshot.bytes = m_report.total_bytes;
    snapshot.statistics = m_report.statistics;
    snapshot.cellular_state = m_decoder.getCurrentCellularState();

    Debug::log("ingest", "Progress: ", snapshot.chunks, " chunks, ", snapshot.bytes, " bytes, ",
              snapshot.statistics.total_frames, " frames (", snapshot.statistics.frames_decoded, " decoded, ",
              snapshot.statistics.decode_failures, " failed)");

    if (m_progress_callback) {
        m_progress_callback(snapshot);
    }
}

void IngestionPipeline::finishRun() {
    m_report.finished = std::chrono::system_clock::now();
    m_report.tail_bytes = m_tail.size();
    m_report.average_chunk_size = m_report.total_chunks > 0
        ? static_cast<double>(m_report.total_bytes) / static_cast<double>(m_report.total_chunks)
        : 0.0;
    if (m_digest_ok) {
        m_report.sha256 = m_digest.finalizeHex();
        m_digest_ok = false;
    }

    Debug::log("ingest", "IngestionPipeline::finishRun() - ", m_report.file_path, ": ", m_report.total_bytes,
              " bytes in ", m_report.total_chunks, " chunks, ", m_report.statistics.total_frames, " frames, ",
              m_report.statistics.frames_out_of_window, " out of window");
}

void IngestionPipeline::collectDecoderState() {
    m_report.decoder_counters = m_decoder.getExtractionStatistics();
    m_report.cellular_state = m_decoder.getCurrentCellularState();
}

} // namespace Ingest
} // namespace DiagStream
