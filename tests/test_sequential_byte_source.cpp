/*
 * test_sequential_byte_source.cpp - Tests for multi-file capture reading
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */


#include "diagstream.h"
#include "test_framework.h"
#include "test_fixtures.h"

using namespace DiagStream::IO;
using namespace TestFramework;
using namespace TestFixtures;

namespace {

std::string text(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

// Everything the active file still has, in reads of `step` bytes
Bytes drainActive(SequentialByteSource& source, size_t step) {
    Bytes out;
    for (;;) {
        Bytes chunk = source.read(step);
        if (chunk.empty()) break;
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

} // namespace

// ============================================================================
// File sequencing
// ============================================================================

class MultiFileBoundaryTest : public TestCase {
public:
    MultiFileBoundaryTest() : TestCase("Reads stop at each file boundary until advance()") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string a = dir.write("a.qmdl", bytes("first-file-contents"));
        std::string b = dir.write("b.qmdl", bytes("second"));

        SequentialByteSource source(std::vector<std::string>{a, b});
        ASSERT_TRUE(source.isAvailable(), "Available after opening the first file");
        ASSERT_EQUALS(a, source.currentPath(), "First file is active");
        ASSERT_EQUALS(1u, source.pendingCount(), "One file pending");
        ASSERT_EQUALS(1u, source.filesOpened(), "One file opened");
        ASSERT_EQUALS(static_cast<off_t>(19), source.getFileSize(), "Size of the active file");

        ASSERT_EQUALS(std::string("first-file-contents"), text(drainActive(source, 4)), "First file content");
        ASSERT_TRUE(source.read(16).empty(), "Exhausted file keeps returning nothing");
        ASSERT_TRUE(source.isAvailable(), "Still available before advance()");

        ASSERT_TRUE(source.advance(), "Second file opened");
        ASSERT_EQUALS(b, source.currentPath(), "Second file is active");
        ASSERT_EQUALS(0u, source.pendingCount(), "Nothing pending");
        ASSERT_EQUALS(2u, source.filesOpened(), "Two files opened");
        ASSERT_EQUALS(std::string("second"), text(drainActive(source, 1024)), "Second file content");

        ASSERT_FALSE(source.advance(), "List exhausted");
        ASSERT_FALSE(source.isAvailable(), "Unavailable after exhaustion");
        ASSERT_TRUE(source.currentPath().empty(), "No active file");
        ASSERT_TRUE(source.read(16).empty(), "Reads after exhaustion return nothing");
        ASSERT_FALSE(source.advance(), "Advance stays false");
        ASSERT_FALSE(source.isAvailable(), "Availability never returns");
    }
};

class EmptyListTest : public TestCase {
public:
    EmptyListTest() : TestCase("Empty file list is unavailable from the start") {}

protected:
    void runTest() override {
        SequentialByteSource source{std::vector<std::string>()};
        ASSERT_FALSE(source.isAvailable(), "Nothing to read");
        ASSERT_TRUE(source.read(8).empty(), "Read returns nothing");
        ASSERT_TRUE(source.eof(), "eof with no active file");
        ASSERT_EQUALS(static_cast<off_t>(-1), source.getFileSize(), "No size without a file");
    }
};

class MissingFirstFileTest : public TestCase {
public:
    MissingFirstFileTest() : TestCase("Missing first file is reported at construction") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string missing = dir.path() + "/does-not-exist.qmdl";

        TestPatterns::assertThrows<DiagStream::Core::SourceUnavailableException>(
            [&]() { SequentialByteSource source(missing); });

        try {
            SequentialByteSource source(missing);
            throw AssertionFailure("Construction should have thrown");
        } catch (const DiagStream::Core::SourceUnavailableException& e) {
            ASSERT_EQUALS(missing, e.path(), "Exception carries the path");
        }
    }
};

class MissingLaterFileTest : public TestCase {
public:
    MissingLaterFileTest() : TestCase("Missing later file throws from advance()") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string a = dir.write("a.qmdl", bytes("abc"));
        std::string gone = dir.path() + "/gone.qmdl";
        std::string c = dir.write("c.qmdl", bytes("xyz"));

        SequentialByteSource source(std::vector<std::string>{a, gone, c});
        drainActive(source, 8);

        TestPatterns::assertThrows<DiagStream::Core::SourceUnavailableException>(
            [&]() { source.advance(); });
        ASSERT_TRUE(source.currentPath().empty(), "No active file after a failed open");

        ASSERT_TRUE(source.advance(), "Can advance past the bad file");
        ASSERT_EQUALS(std::string("xyz"), text(drainActive(source, 8)), "Third file content");
    }
};

class CloseIdempotentTest : public TestCase {
public:
    CloseIdempotentTest() : TestCase("close() may be called repeatedly") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string a = dir.write("a.qmdl", bytes("abcdef"));
        std::string b = dir.write("b.qmdl", bytes("ghi"));

        SequentialByteSource source(std::vector<std::string>{a, b});
        ASSERT_EQUALS(0, source.close(), "First close succeeds");
        ASSERT_EQUALS(0, source.close(), "Second close succeeds");
        ASSERT_TRUE(source.isClosed(), "Closed");
        ASSERT_FALSE(source.isAvailable(), "Closed source is unavailable");
        ASSERT_FALSE(source.advance(), "Cannot advance a closed source");
        ASSERT_TRUE(source.read(8).empty(), "Closed source reads nothing");
    }
};

class PositionTrackingTest : public TestCase {
public:
    PositionTrackingTest() : TestCase("tell() counts bytes across files") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string a = dir.write("a.qmdl", frameOfSize(300));
        std::string b = dir.write("b.qmdl", frameOfSize(200));

        SequentialByteSource source(std::vector<std::string>{a, b});
        drainActive(source, 64);
        ASSERT_EQUALS(static_cast<off_t>(300), source.tell(), "After first file");
        source.advance();
        drainActive(source, 64);
        ASSERT_EQUALS(static_cast<off_t>(500), source.tell(), "After second file");
    }
};

// ============================================================================
// Compressed captures
// ============================================================================

class CompressedFilesTest : public TestCase {
public:
    CompressedFilesTest() : TestCase("gzip and bzip2 captures are decompressed") {}

protected:
    void runTest() override {
        TempDir dir;
        Bytes plain = delimited({frameOfSize(500, 3), frameOfSize(1200, 9)});
        std::string gz = dir.writeGzip("capture.qmdl.gz", plain);
        std::string bz = dir.writeBzip2("capture.qmdl.bz2", plain);
        std::string upper = dir.writeGzip("CAPTURE.QMDL.GZ", plain);

        SequentialByteSource source(std::vector<std::string>{gz, bz, upper});
        ASSERT_EQUALS(static_cast<off_t>(-1), source.getFileSize(), "Decompressed size is unknown");
        ASSERT_EQUALS(hex(plain), hex(drainActive(source, 333)), "gzip content");

        ASSERT_TRUE(source.advance(), "bzip2 file opened");
        ASSERT_EQUALS(hex(plain), hex(drainActive(source, 4096)), "bzip2 content");

        ASSERT_TRUE(source.advance(), "Upper-case suffix opened");
        ASSERT_EQUALS(hex(plain), hex(drainActive(source, 1)), "Upper-case gzip content");
    }
};

class HandlerSelectionTest : public TestCase {
public:
    HandlerSelectionTest() : TestCase("openHandler() picks a handler by suffix") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string raw = dir.write("plain.qmdl", bytes("raw"));
        std::string gz = dir.writeGzip("packed.qmdl.Gz", bytes("zipped"));

        auto raw_handler = SequentialByteSource::openHandler(raw);
        ASSERT_NOT_NULL(dynamic_cast<File::FileIOHandler*>(raw_handler.get()), "Plain file uses FileIOHandler");

        auto gz_handler = SequentialByteSource::openHandler(gz);
        auto* compressed = dynamic_cast<File::CompressedFileIOHandler*>(gz_handler.get());
        ASSERT_NOT_NULL(compressed, "gzip file uses CompressedFileIOHandler");
        ASSERT_TRUE(compressed->compression() == File::Compression::Gzip, "gzip detected");
    }
};

class CorruptCompressedFileTest : public TestCase {
public:
    CorruptCompressedFileTest() : TestCase("Corrupt compressed data reads as no data") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string bad = dir.write("broken.qmdl.gz", bytes("this is not gzip data at all"));

        SequentialByteSource source(bad);
        Bytes got;
        TestPatterns::assertNoThrow([&]() { got = source.read(64); }, "Read error must not throw");
        ASSERT_TRUE(got.empty(), "No data from a corrupt file");
        ASSERT_EQUALS(EIO, source.getLastError(), "Error surfaced as EIO");
        ASSERT_FALSE(source.advance(), "Nothing further to read");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("SequentialByteSource Tests");

    suite.addTest(std::make_unique<MultiFileBoundaryTest>());
    suite.addTest(std::make_unique<EmptyListTest>());
    suite.addTest(std::make_unique<MissingFirstFileTest>());
    suite.addTest(std::make_unique<MissingLaterFileTest>());
    suite.addTest(std::make_unique<CloseIdempotentTest>());
    suite.addTest(std::make_unique<PositionTrackingTest>());
    suite.addTest(std::make_unique<CompressedFilesTest>());
    suite.addTest(std::make_unique<HandlerSelectionTest>());
    suite.addTest(std::make_unique<CorruptCompressedFileTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
