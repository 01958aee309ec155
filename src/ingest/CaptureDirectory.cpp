/*
 * CaptureDirectory.cpp - Capture file discovery
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

CaptureDirectory::CaptureDirectory(std::string directory, std::string extension, uint64_t min_file_size)
    : m_directory(std::move(directory)), m_extension(std::move(extension)), m_min_file_size(min_file_size) {
    if (!m_extension.empty() && m_extension[0] != '.') {
        m_extension.insert(m_extension.begin(), '.');
    }
}

namespace {

CaptureFileInfo infoFromStat(const std::string& path, const struct stat& st) {
    CaptureFileInfo info;
    info.path = path;
    info.size = static_cast<uint64_t>(st.st_size);
    info.modified = std::chrono::system_clock::from_time_t(st.st_mtime);
    info.created = std::chrono::system_clock::from_time_t(st.st_ctime);
    return info;
}

} // namespace

std::optional<CaptureFileInfo> CaptureDirectory::getFileInfo(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        Debug::log("ingest", "CaptureDirectory::getFileInfo() - Cannot stat ", path, ": ", strerror(errno));
        return std::nullopt;
    }
    return infoFromStat(path, st);
}

std::vector<CaptureFileInfo> CaptureDirectory::list() const {
    Debug::log("ingest", "CaptureDirectory::list() - Scanning: ", m_directory);

    std::vector<CaptureFileInfo> files;

    std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(m_directory.c_str()), closedir);
    if (!dir) {
        Debug::log("ingest", "CaptureDirectory::list() - Directory not accessible: ", m_directory, ": ", strerror(errno));
        return files;
    }

    std::string prefix = m_directory;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }

    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
        std::string filename = entry->d_name;
        if (filename == "." || filename == "..") continue;
        if (!Core::Utility::endsWithIgnoreCase(filename, m_extension)) continue;
        // A bare ".qmdl" has no name part
        if (filename.length() == m_extension.length()) continue;

        std::string full_path = prefix + filename;
        struct stat st;
        if (stat(full_path.c_str(), &st) != 0) {
            Debug::log("ingest", "CaptureDirectory::list() - Could not get size for ", filename, ": ", strerror(errno));
            continue;
        }
        if (!S_ISREG(st.st_mode)) continue;

        if (static_cast<uint64_t>(st.st_size) < m_min_file_size) {
            Debug::log("ingest", "CaptureDirectory::list() - Skipping ", filename, " (", st.st_size, " bytes)");
            continue;
        }

        files.push_back(infoFromStat(full_path, st));
    }

    std::sort(files.begin(), files.end(),
              [](const CaptureFileInfo& a, const CaptureFileInfo& b) { return a.path < b.path; });
    files.erase(std::unique(files.begin(), files.end(),
                            [](const CaptureFileInfo& a, const CaptureFileInfo& b) { return a.path == b.path; }),
                files.end());

    Debug::log("ingest", "CaptureDirectory::list() - Found ", files.size(), " capture(s) in ", m_directory);
    return files;
}

} // namespace Ingest
} // namespace DiagStream
