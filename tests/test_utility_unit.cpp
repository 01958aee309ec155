/*
 * test_utility_unit.cpp - Unit tests for utility helpers, JSON output and stream digests
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */


#include "diagstream.h"
#include "test_framework.h"

using namespace DiagStream::Core;
using namespace DiagStream::Core::Utility;
using DiagStream::JSON::JSONUtil;
using namespace TestFramework;

// ============================================================================
// String helpers
// ============================================================================

class HexTest : public TestCase {
public:
    HexTest() : TestCase("toHex() is lowercase and two digits per byte") {}

protected:
    void runTest() override {
        std::vector<uint8_t> data = {0x00, 0x0F, 0x7E, 0xAB, 0xFF};
        ASSERT_EQUALS(std::string("000f7eabff"), toHex(data), "Vector overload");
        ASSERT_EQUALS(std::string("000f"), toHex(data.data(), 2), "Pointer overload");
        ASSERT_EQUALS(std::string(""), toHex(std::vector<uint8_t>()), "Empty input");
    }
};

class SuffixTest : public TestCase {
public:
    SuffixTest() : TestCase("endsWithIgnoreCase() and toLower()") {}

protected:
    void runTest() override {
        ASSERT_TRUE(endsWithIgnoreCase("diag_log.QMDL", ".qmdl"), "Upper-case name");
        ASSERT_TRUE(endsWithIgnoreCase("diag_log.qmdl", ".QmDl"), "Mixed-case suffix");
        ASSERT_FALSE(endsWithIgnoreCase("diag_log.qmdl2", ".qmdl"), "Suffix must be at the end");
        ASSERT_FALSE(endsWithIgnoreCase("gz", ".gz"), "Suffix longer than text");
        ASSERT_TRUE(endsWithIgnoreCase("anything", ""), "Empty suffix matches");
        ASSERT_EQUALS(std::string("abc.gz"), toLower("ABC.Gz"), "toLower");
    }
};

class ByteSizeTest : public TestCase {
public:
    ByteSizeTest() : TestCase("parseByteSize() suffixes and rejects") {}

protected:
    void runTest() override {
        ASSERT_TRUE(parseByteSize("4096") == std::optional<uint64_t>(4096), "Plain");
        ASSERT_TRUE(parseByteSize("4k") == std::optional<uint64_t>(4096), "k");
        ASSERT_TRUE(parseByteSize("20M") == std::optional<uint64_t>(20ULL * 1024 * 1024), "M");
        ASSERT_TRUE(parseByteSize("1g") == std::optional<uint64_t>(1024ULL * 1024 * 1024), "g");
        ASSERT_FALSE(parseByteSize("").has_value(), "Empty");
        ASSERT_FALSE(parseByteSize("k").has_value(), "Suffix only");
        ASSERT_FALSE(parseByteSize("12x").has_value(), "Unknown suffix");
        ASSERT_FALSE(parseByteSize(" 12").has_value(), "Whitespace");
        ASSERT_FALSE(parseByteSize("99999999999999999999").has_value(), "Overflow");
        ASSERT_FALSE(parseByteSize("17179869184g").has_value(), "Overflow after multiplier");
    }
};

class SplitListTest : public TestCase {
public:
    SplitListTest() : TestCase("splitList() drops empty items") {}

protected:
    void runTest() override {
        std::vector<std::string> items = splitList("io,,framing,ingest,");
        ASSERT_EQUALS(3u, items.size(), "Three items");
        ASSERT_EQUALS(std::string("framing"), items[1], "Order kept");
        ASSERT_TRUE(splitList("").empty(), "Empty text");
        ASSERT_EQUALS(2u, splitList("a:b", ':').size(), "Custom separator");
    }
};

class ISO8601Test : public TestCase {
public:
    ISO8601Test() : TestCase("formatISO8601() layout") {}

protected:
    void runTest() override {
        std::string text = formatISO8601(std::chrono::system_clock::from_time_t(0));
        ASSERT_EQUALS(25u, text.size(), "Date, time and offset");
        ASSERT_EQUALS('T', text[10], "Date/time separator");
        ASSERT_EQUALS(':', text[22], "Offset has a colon");
        ASSERT_TRUE(text[19] == '+' || text[19] == '-', "Offset sign");
    }
};

// ============================================================================
// JSON
// ============================================================================

class JSONCompactTest : public TestCase {
public:
    JSONCompactTest() : TestCase("Compact JSON output") {}

protected:
    void runTest() override {
        JSONUtil::Value root = JSONUtil::Value::object();
        root.set("status", "completed");
        root.set("count", static_cast<uint64_t>(18446744073709551615ULL));
        root.set("delta", -3);
        root.set("ok", true);
        root.set("none", JSONUtil::Value());
        root.set("list", JSONUtil::Value::array().push(1).push("two"));
        root.set("empty", JSONUtil::Value::array());

        ASSERT_EQUALS(std::string("{\"status\":\"completed\",\"count\":18446744073709551615,\"delta\":-3,"
                                  "\"ok\":true,\"none\":null,\"list\":[1,\"two\"],\"empty\":[]}"),
                      JSONUtil::generateJSON(root), "Compact layout");

        root.set("status", "failed");
        ASSERT_EQUALS(std::string("failed"), root.get("status")->string, "set() replaces an existing key");
        ASSERT_NULL(root.get("missing"), "Missing key");
    }
};

class JSONIndentTest : public TestCase {
public:
    JSONIndentTest() : TestCase("Indented JSON output") {}

protected:
    void runTest() override {
        JSONUtil::Value root = JSONUtil::Value::object();
        root.set("a", 1);
        root.set("b", JSONUtil::Value::array().push(true));

        ASSERT_EQUALS(std::string("{\n  \"a\": 1,\n  \"b\": [\n    true\n  ]\n}"),
                      JSONUtil::generateJSON(root, 2), "Two-space indent");
        ASSERT_EQUALS(std::string("{}"), JSONUtil::generateJSON(JSONUtil::Value::object(), 2), "Empty object");
    }
};

class JSONEscapeTest : public TestCase {
public:
    JSONEscapeTest() : TestCase("String escaping and non-finite numbers") {}

protected:
    void runTest() override {
        ASSERT_EQUALS(std::string("a\\\"b\\\\c\\n\\t\\u0001"),
                      JSONUtil::escapeJSON(std::string("a\"b\\c\n\t\x01")), "Escapes");
        ASSERT_EQUALS(std::string("null"), JSONUtil::generateJSON(JSONUtil::Value(std::nan(""))), "NaN");
        ASSERT_EQUALS(std::string("null"),
                      JSONUtil::generateJSON(JSONUtil::Value(std::numeric_limits<double>::infinity())), "Infinity");
        ASSERT_EQUALS(std::string("2.5"), JSONUtil::generateJSON(JSONUtil::Value(2.5)), "Finite real");
    }
};

// ============================================================================
// StreamDigest
// ============================================================================

class DigestTest : public TestCase {
public:
    DigestTest() : TestCase("Incremental SHA-256") {}

protected:
    void runTest() override {
        StreamDigest digest;
        ASSERT_FALSE(digest.update(reinterpret_cast<const uint8_t*>("x"), 1), "Update before reset fails");
        ASSERT_EQUALS(std::string(""), digest.finalizeHex(), "Finalize before reset fails");

        ASSERT_TRUE(digest.reset(), "Reset");
        ASSERT_EQUALS(std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"),
                      digest.finalizeHex(), "Empty input");

        ASSERT_TRUE(digest.reset(), "Reset again");
        const std::string text = "abc";
        for (char c : text) {
            uint8_t byte = static_cast<uint8_t>(c);
            ASSERT_TRUE(digest.update(&byte, 1), "Byte-wise update");
        }
        std::string first = digest.finalizeHex();
        ASSERT_EQUALS(std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), first, "abc");
        ASSERT_TRUE(digest.isFinalized(), "Finalized");
        ASSERT_EQUALS(first, digest.finalizeHex(), "Cached result");
        ASSERT_FALSE(digest.update(reinterpret_cast<const uint8_t*>("d"), 1),
                     "Update after finalize fails");
    }
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Utility Unit Tests");

    suite.addTest(std::make_unique<HexTest>());
    suite.addTest(std::make_unique<SuffixTest>());
    suite.addTest(std::make_unique<ByteSizeTest>());
    suite.addTest(std::make_unique<SplitListTest>());
    suite.addTest(std::make_unique<ISO8601Test>());
    suite.addTest(std::make_unique<JSONCompactTest>());
    suite.addTest(std::make_unique<JSONIndentTest>());
    suite.addTest(std::make_unique<JSONEscapeTest>());
    suite.addTest(std::make_unique<DigestTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
