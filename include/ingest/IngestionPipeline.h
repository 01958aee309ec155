/*
 * IngestionPipeline.h - Chunked capture ingestion
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

#ifndef INGEST_INGESTIONPIPELINE_H
#define INGEST_INGESTIONPIPELINE_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Ingest {

/**
 * @brief Reads a capture chunk by chunk, frames it and feeds the decoder
 *
 * One pipeline runs one ingestion at a time and is not shared between
 * threads, with the exception of cancel(). Each run starts from clean
 * statistics, an empty tail and a reset decoder.
 *
 * Every run ends in exactly one IngestOutcome. Files that cannot be read
 * at all come back as IngestSkipped; errors after reading started come
 * back as IngestFailed with everything gathered up to that point.
 */
class IngestionPipeline {
public:
    using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

    /**
     * @param decoder Decoder collaborator; must outlive the pipeline
     * @param config Settings for every run of this pipeline
     * @throws Core::ConfigException if the settings are unusable
     */
    explicit IngestionPipeline(Decoder::FrameDecoder& decoder, IngestConfig config = IngestConfig());

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    /**
     * @brief Ingest a single capture file
     */
    IngestOutcome ingestFile(const std::string& path);

    /**
     * @brief Ingest several files as one continuous stream
     *
     * Each file must pass the size gate. The tail is carried across file
     * boundaries, so a frame split between two files is recovered.
     */
    IngestOutcome ingestFiles(const std::vector<std::string>& paths);

    /**
     * @brief Run the chunk loop over an already opened source
     * @param source Source to drain; closed when the run ends
     * @param label Name reported as the file path
     */
    IngestOutcome ingestStream(IO::IOHandler& source, const std::string& label);

    /**
     * @brief Ask the running ingestion to stop before its next chunk
     *
     * Safe to call from another thread or from the progress callback. The
     * run returns its report with the cancelled flag set.
     */
    void cancel();

    void setProgressCallback(ProgressCallback callback);

    const IngestConfig& config() const { return m_config; }

    /**
     * @brief Frames of the last run in stream order, capped at max_retained_frames
     */
    const std::vector<Framing::Frame>& retainedFrames() const { return m_frames; }

    /**
     * @brief Unframed bytes carried at the end of the last run
     */
    const std::vector<uint8_t>& pendingTail() const { return m_tail; }

private:
    std::optional<IngestSkipped> checkGate(const std::string& path) const;
    IngestOutcome runChunkLoop(IO::IOHandler& source, const std::string& label,
                               const std::function<bool()>& next_file);
    void beginRun(const std::string& label);
    void processChunk(const uint8_t* data, size_t size);
    void forwardFrame(Framing::Frame frame);
    void reportProgress();
    void finishRun();
    void collectDecoderState();
    IngestFailed failRun(IO::IOHandler& source, const std::string& label, const std::string& message);

    Decoder::FrameDecoder& m_decoder;
    IngestConfig m_config;
    Framing::FrameExtractor m_extractor;
    ProgressCallback m_progress_callback;
    std::atomic<bool> m_cancel_requested{false};

    // Per-run state
    IngestReport m_report;
    std::vector<uint8_t> m_tail;
    std::vector<Framing::Frame> m_frames;
    Core::StreamDigest m_digest;
    bool m_digest_ok = false;
};

} // namespace Ingest
} // namespace DiagStream

#endif // INGEST_INGESTIONPIPELINE_H
