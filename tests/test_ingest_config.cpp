/*
 * test_ingest_config.cpp - Tests for ingestion configuration
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
using DiagStream::Core::ConfigException;
using DiagStream::Core::IOException;
using namespace TestFramework;
using namespace TestFixtures;

class DefaultsTest : public TestCase {
public:
    DefaultsTest() : TestCase("Defaults") {}

protected:
    void runTest() override {
        IngestConfig config;
        ASSERT_EQUALS(4096u, config.chunk_size, "chunk_size");
        ASSERT_EQUALS(20u * 1024u * 1024u, config.min_file_size, "min_file_size");
        ASSERT_EQUALS(100u, config.progress_interval, "progress_interval");
        ASSERT_EQUALS(5u, config.hex_sample_count, "hex_sample_count");
        ASSERT_EQUALS(64u, config.hex_sample_bytes, "hex_sample_bytes");
        ASSERT_EQUALS(3u, config.frame_window.min_size, "min_frame_size");
        ASSERT_EQUALS(8192u, config.frame_window.max_size, "max_frame_size");
        ASSERT_FALSE(config.chain_files, "chain_files");
        ASSERT_TRUE(config.compute_digest, "compute_digest");
        ASSERT_EQUALS(std::string(".qmdl"), config.capture_extension, "capture_extension");
        TestPatterns::assertNoThrow([&]() { config.validate(); }, "Defaults are valid");
    }
};

class SetTest : public TestCase {
public:
    SetTest() : TestCase("set() parses sizes, booleans and strings") {}

protected:
    void runTest() override {
        IngestConfig config;
        ASSERT_TRUE(config.set("chunk_size", "8k"), "chunk_size known");
        ASSERT_EQUALS(8192u, config.chunk_size, "k suffix");
        ASSERT_TRUE(config.set("min_file_size", "2M"), "min_file_size known");
        ASSERT_EQUALS(2u * 1024u * 1024u, config.min_file_size, "M suffix");
        ASSERT_TRUE(config.set("max_frame_size", "10000"), "max_frame_size known");
        ASSERT_EQUALS(10000u, config.frame_window.max_size, "Plain number");
        ASSERT_TRUE(config.set("chain_files", "Yes"), "chain_files known");
        ASSERT_TRUE(config.chain_files, "Boolean yes");
        ASSERT_TRUE(config.set("compute_digest", "off"), "compute_digest known");
        ASSERT_FALSE(config.compute_digest, "Boolean off");
        ASSERT_TRUE(config.set("capture_extension", "dlf"), "capture_extension known");
        ASSERT_EQUALS(std::string(".dlf"), config.capture_extension, "Dot prefixed");
        ASSERT_FALSE(config.set("no_such_key", "1"), "Unknown key reported");
    }
};

class BadValueTest : public TestCase {
public:
    BadValueTest() : TestCase("Bad values raise ConfigException") {}

protected:
    void runTest() override {
        IngestConfig config;
        TestPatterns::assertThrows<ConfigException>([&]() { config.set("chunk_size", "lots"); }, "chunk_size");
        TestPatterns::assertThrows<ConfigException>([&]() { config.set("chunk_size", "-5"); }, "not a size");
        TestPatterns::assertThrows<ConfigException>([&]() { config.set("chain_files", "maybe"); }, "boolean");
        TestPatterns::assertThrows<ConfigException>([&]() { config.set("capture_extension", ""); }, "empty");
        ASSERT_EQUALS(4096u, config.chunk_size, "Failed set leaves the value alone");

        config.chunk_size = 0;
        TestPatterns::assertThrows<ConfigException>([&]() { config.validate(); }, "chunk_size");

        IngestConfig inverted;
        inverted.frame_window.min_size = 100;
        inverted.frame_window.max_size = 10;
        TestPatterns::assertThrows<ConfigException>([&]() { inverted.validate(); }, "min_frame_size");
    }
};

class ConfigFileTest : public TestCase {
public:
    ConfigFileTest() : TestCase("readConfigFile() applies key=value lines") {}

protected:
    void runTest() override {
        TempDir dir;
        std::string path = dir.write("diagstream.conf", bytes(
            "# capture ingestion\n"
            "\n"
            "  chunk_size = 16k  \n"
            "min_file_size=1m\n"
            "progress_interval = 0\n"
            "unknown_setting = whatever\n"
            "this line has no separator\n"
            "debug_channels = io,framing\n"
            "log_file = /tmp/diagstream.log\n"));

        IngestConfig config;
        config.readConfigFile(path);
        ASSERT_EQUALS(16384u, config.chunk_size, "Trimmed value with suffix");
        ASSERT_EQUALS(1024u * 1024u, config.min_file_size, "Lower-case m suffix");
        ASSERT_EQUALS(0u, config.progress_interval, "Progress disabled");
        ASSERT_EQUALS(std::string("io,framing"), config.debug_channels, "String value");
        ASSERT_EQUALS(std::string("/tmp/diagstream.log"), config.log_file, "Path value");
    }
};

class ConfigFileErrorsTest : public TestCase {
public:
    ConfigFileErrorsTest() : TestCase("readConfigFile() errors") {}

protected:
    void runTest() override {
        TempDir dir;
        IngestConfig config;
        TestPatterns::assertThrows<IOException>([&]() { config.readConfigFile(dir.path() + "/absent.conf"); },
                                                "absent.conf");

        std::string bad = dir.write("bad.conf", bytes("chunk_size = 0\n"));
        TestPatterns::assertThrows<ConfigException>([&]() { config.readConfigFile(bad); }, "chunk_size");

        std::string garbage = dir.write("garbage.conf", bytes("min_frame_size = three\n"));
        IngestConfig other;
        TestPatterns::assertThrows<ConfigException>([&]() { other.readConfigFile(garbage); }, "three");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("IngestConfig Tests");

    suite.addTest(std::make_unique<DefaultsTest>());
    suite.addTest(std::make_unique<SetTest>());
    suite.addTest(std::make_unique<BadValueTest>());
    suite.addTest(std::make_unique<ConfigFileTest>());
    suite.addTest(std::make_unique<ConfigFileErrorsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
