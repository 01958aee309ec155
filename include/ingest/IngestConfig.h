/*
 * IngestConfig.h - Ingestion settings and config file loading
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

#ifndef INGEST_INGESTCONFIG_H
#define INGEST_INGESTCONFIG_H

// No direct includes - all includes should be in diagstream.h

namespace DiagStream {
namespace Ingest {

/**
 * @brief Settings for one ingestion pipeline
 *
 * Defaults match the canonical capture reader. Values can be loaded from a
 * key=value file and then overridden from the command line.
 */
struct IngestConfig {
    size_t chunk_size = 4096;
    uint64_t min_file_size = 20ULL * 1024 * 1024;
    size_t progress_interval = 100;             // chunks between progress reports, 0 disables
    size_t hex_sample_count = 5;
    size_t hex_sample_bytes = 64;
    size_t max_sample_records = 50;
    size_t max_retained_frames = 1024;
    Framing::FrameSizeWindow frame_window;
    bool chain_files = false;
    bool compute_digest = true;
    std::string capture_extension = ".qmdl";
    std::string log_file;
    std::string debug_channels;

    /**
     * @brief Load settings from a key=value file
     *
     * Blank lines and lines starting with '#' are skipped, as are unknown
     * keys (logged on "config").
     *
     * @throws Core::IOException if the file cannot be read
     * @throws Core::ConfigException on a malformed value
     */
    void readConfigFile(const std::string& path);

    /**
     * @brief Apply one setting
     * @return false if the key is not known
     * @throws Core::ConfigException on a malformed value
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * @brief Reject combinations the pipeline cannot run with
     * @throws Core::ConfigException
     */
    void validate() const;
};

} // namespace Ingest
} // namespace DiagStream

#endif // INGEST_INGESTCONFIG_H
