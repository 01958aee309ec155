/*
 * test_capture_directory.cpp - Tests for capture file discovery
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */


#include "diagstream.h"
#include "test_framework.h"
#include "test_fixtures.h"

using namespace DiagStream::Ingest;
using namespace TestFramework;
using namespace TestFixtures;

class ListingFilterTest : public TestCase {
public:
    ListingFilterTest() : TestCase("Listing filters by extension, size and type") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string big_upper = dir.write("B_capture.QMDL", frameOfSize(200));
        std::string big_lower = dir.write("a_capture.qmdl", frameOfSize(150));
        dir.write("small.qmdl", frameOfSize(99));
        dir.write("other.txt", frameOfSize(500));
        dir.write(".qmdl", frameOfSize(500));
        dir.write("capture.qmdl.gz", frameOfSize(500));
        dir.subdir("folder.qmdl");

        CaptureDirectory captures(dir.path(), ".qmdl", 100);
        std::vector<CaptureFileInfo> files = captures.list();

        ASSERT_EQUALS(2u, files.size(), "Two captures qualify");
        ASSERT_EQUALS(big_upper, files[0].path, "Sorted by path (upper case first)");
        ASSERT_EQUALS(big_lower, files[1].path, "Lower-case name second");
        ASSERT_EQUALS(200u, files[0].size, "Size recorded");
        ASSERT_EQUALS(150u, files[1].size, "Size recorded");
    }
};

class ExtensionNormalisationTest : public TestCase {
public:
    ExtensionNormalisationTest() : TestCase("Extension without a dot and trailing slash") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string gz = dir.write("one.qmdl.gz", frameOfSize(10));

        CaptureDirectory captures(dir.path() + "/", "gz", 0);
        std::vector<CaptureFileInfo> files = captures.list();

        ASSERT_EQUALS(1u, files.size(), "Compressed capture found");
        ASSERT_EQUALS(gz, files[0].path, "No doubled separator");
    }
};

class MissingDirectoryTest : public TestCase {
public:
    MissingDirectoryTest() : TestCase("Unreadable directory lists nothing") {}

protected:
    void runTest() override {
        TempDir dir;
        CaptureDirectory captures(dir.path() + "/absent");
        std::vector<CaptureFileInfo> files;
        TestPatterns::assertNoThrow([&]() { files = captures.list(); }, "Listing must not throw");
        ASSERT_TRUE(files.empty(), "Empty listing");
    }
};

class FileInfoTest : public TestCase {
public:
    FileInfoTest() : TestCase("getFileInfo() reports size and times") {}

protected:
    void runTest() override {
        TempDir dir;
        auto before = std::chrono::system_clock::now() - std::chrono::seconds(5);
        std::string path = dir.write("info.qmdl", frameOfSize(321));

        std::optional<CaptureFileInfo> info = CaptureDirectory::getFileInfo(path);
        ASSERT_TRUE(info.has_value(), "Info available");
        ASSERT_EQUALS(path, info->path, "Path");
        ASSERT_EQUALS(321u, info->size, "Size");
        ASSERT_TRUE(info->modified >= before, "Modified time is recent");
        ASSERT_TRUE(info->created >= before, "Change time is recent");

        ASSERT_FALSE(CaptureDirectory::getFileInfo(dir.path() + "/nothing").has_value(), "Missing file has no info");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("CaptureDirectory Tests");

    suite.addTest(std::make_unique<ListingFilterTest>());
    suite.addTest(std::make_unique<ExtensionNormalisationTest>());
    suite.addTest(std::make_unique<MissingDirectoryTest>());
    suite.addTest(std::make_unique<FileInfoTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
