/*
 * IngestConfig.cpp - Ingestion settings and config file loading
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

namespace {

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

uint64_t parseSize(const std::string& key, const std::string& value) {
    std::optional<uint64_t> size = Core::Utility::parseByteSize(value);
    if (!size) {
        throw Core::ConfigException(key, "'" + value + "' is not a size");
    }
    return *size;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = Core::Utility::toLower(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw Core::ConfigException(key, "'" + value + "' is not a boolean");
}

} // namespace

bool IngestConfig::set(const std::string& key, const std::string& value) {
    if (key == "chunk_size") {
        chunk_size = static_cast<size_t>(parseSize(key, value));
    } else if (key == "min_file_size") {
        min_file_size = parseSize(key, value);
    } else if (key == "progress_interval") {
        progress_interval = static_cast<size_t>(parseSize(key, value));
    } else if (key == "hex_sample_count") {
        hex_sample_count = static_cast<size_t>(parseSize(key, value));
    } else if (key == "hex_sample_bytes") {
        hex_sample_bytes = static_cast<size_t>(parseSize(key, value));
    } else if (key == "max_sample_records") {
        max_sample_records = static_cast<size_t>(parseSize(key, value));
    } else if (key == "max_retained_frames") {
        max_retained_frames = static_cast<size_t>(parseSize(key, value));
    } else if (key == "min_frame_size") {
        frame_window.min_size = static_cast<size_t>(parseSize(key, value));
    } else if (key == "max_frame_size") {
        frame_window.max_size = static_cast<size_t>(parseSize(key, value));
    } else if (key == "chain_files") {
        chain_files = parseBool(key, value);
    } else if (key == "compute_digest") {
        compute_digest = parseBool(key, value);
    } else if (key == "capture_extension") {
        if (value.empty()) {
            throw Core::ConfigException(key, "extension must not be empty");
        }
        capture_extension = (value[0] == '.') ? value : "." + value;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "debug_channels") {
        debug_channels = value;
    } else {
        return false;
    }

    Debug::log("config", "IngestConfig::set() - ", key, " = ", value);
    return true;
}

void IngestConfig::readConfigFile(const std::string& path) {
    Debug::log("config", "Reading configuration from ", path);
    std::ifstream config(path);
    if (!config.is_open()) {
        throw Core::IOException("Cannot read config file " + path + ": " + strerror(errno));
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(config, line)) {
        line_number++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            Debug::log("config", path, ":", line_number, ": ignoring line without '='");
            continue;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (!set(key, value)) {
            Debug::log("config", path, ":", line_number, ": unknown key '", key, "' ignored");
        }
    }

    validate();
}

void IngestConfig::validate() const {
    if (chunk_size == 0) {
        throw Core::ConfigException("chunk_size", "must be greater than zero");
    }
    if (frame_window.min_size > frame_window.max_size) {
        throw Core::ConfigException("min_frame_size", "exceeds max_frame_size");
    }
}

} // namespace Ingest
} // namespace DiagStream
