/*
 * diagstream.h - main include for all other source files.
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

#ifndef __DIAGSTREAM_H__
#define __DIAGSTREAM_H__

// defines
#define DIAGSTREAM_VERSION "1-CURRENT"
#define DIAGSTREAM_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <sstream>
#include <typeinfo>
#include <unordered_set>
#include <variant>
#include <vector>
#include <optional>
#include <chrono>
#include <limits>

// C Standard Library (wrapped)
#include <cctype>
#include <cmath>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

// OpenSSL headers
#include <openssl/evp.h>

// Boost.Iostreams (gzip / bzip2 capture decompression)
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"
#include "core/utility/utility.h"
#include "core/utility/JSONUtil.h"
#include "core/utility/StreamDigest.h"

// I/O Handler subsystem
#include "io/IOHandler.h"
#include "RAIIFileHandle.h"
#include "io/MemoryIOHandler.h"
#include "io/file/FileIOHandler.h"
#include "io/file/CompressedFileIOHandler.h"
#include "io/SequentialByteSource.h"

// Using declarations for I/O classes
using DiagStream::IO::IOHandler;
using DiagStream::IO::MemoryIOHandler;
using DiagStream::IO::SequentialByteSource;
using DiagStream::IO::File::FileIOHandler;
using DiagStream::IO::File::CompressedFileIOHandler;

// Framing
#include "framing/Frame.h"
#include "framing/Hdlc.h"
#include "framing/FrameExtractor.h"

// Decoder collaborator interface and reference implementation
#include "decoder/FrameDecoder.h"
#include "decoder/CommandCodeDecoder.h"

// Ingestion
#include "ingest/IngestConfig.h"
#include "ingest/IngestTypes.h"
#include "ingest/IngestionPipeline.h"
#include "ingest/CaptureDirectory.h"
#include "ingest/IngestBridge.h"

#endif // __DIAGSTREAM_H__
