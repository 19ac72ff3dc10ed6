/*
 * test_page_unit.cpp - Unit tests for Ogg page construction and serialization
 * This file is part of OggFrame.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OggFrame is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "oggframe.h"
#include "test_framework.h"
#include "ogg_test_utils.h"

using namespace OggFrame;
using namespace OggFrame::Container;
using namespace TestFramework;

// ============================================================================
// Header type
// ============================================================================

class PageHeaderTypeTest : public TestCase {
public:
    PageHeaderTypeTest() : TestCase("Page header type flags") {}

protected:
    void runTest() override {
        Page page;
        ASSERT_EQUALS(0, static_cast<int>(page.getHeaderType()), "New page has no flags");

        page.setBeginningOfStream(true);
        ASSERT_EQUALS(2, static_cast<int>(page.getHeaderType()), "BOS flag");
        page.setEndOfStream(true);
        page.setContinuation(true);
        ASSERT_EQUALS(7, static_cast<int>(page.getHeaderType()), "All three flags");

        page.setHeaderType(0xFC);
        ASSERT_EQUALS(4, static_cast<int>(page.getHeaderType()), "Undefined bits are ignored");
        ASSERT_TRUE(page.isEndOfStream(), "EOS from header byte");
        ASSERT_FALSE(page.isContinuation(), "No continuation from header byte");
    }
};

// ============================================================================
// Capacity and overplus
// ============================================================================

class PageCapacityTest : public TestCase {
public:
    PageCapacityTest() : TestCase("Page holds at most 255 segments") {}

protected:
    void runTest() override {
        Page page;
        for (size_t i = 0; i < 255; i++) {
            ASSERT_TRUE(page.addSegment(Segment(1, static_cast<uint8_t>(i))), "Segment within capacity");
        }
        size_t size_before = page.getSize();
        ASSERT_FALSE(page.addSegment(Segment(1, 0)), "256th segment is refused");
        ASSERT_EQUALS(255u, page.getSegmentCount(), "Segment count unchanged");
        ASSERT_EQUALS(size_before, page.getSize(), "Page size unchanged");
        ASSERT_EQUALS(255u, page.getPacketCount(), "Every one-byte segment ends a packet");
    }
};

class PageOverplusTest : public TestCase {
public:
    PageOverplusTest() : TestCase("Page returns segments that do not fit") {}

protected:
    void runTest() override {
        Page page;
        for (size_t i = 0; i < 253; i++) {
            page.addSegment(Segment(1, 0));
        }

        // 600 bytes laces as 255, 255, 90 but only two slots remain
        Page::Overplus overplus = page.addPacket(OggTestUtils::makePacket(600));
        ASSERT_EQUALS(1u, overplus.size(), "One segment overflows");
        ASSERT_EQUALS(90u, overplus[0].size(), "Overflowing segment is the 90-byte tail");
        ASSERT_TRUE(page.contentContinuesInNextPage(), "Page ends in a 255 segment");

        Page second;
        for (size_t i = 0; i < 253; i++) {
            second.addSegment(Segment(1, 0));
        }
        // 510 bytes laces as 255, 255, 0
        overplus = second.addPacket(OggTestUtils::makePacket(510));
        ASSERT_EQUALS(1u, overplus.size(), "Terminating empty segment overflows");
        ASSERT_EQUALS(0u, overplus[0].size(), "Overflowing segment is empty");
        ASSERT_TRUE(second.contentContinuesInNextPage(), "Continuation needed for the empty terminator");
    }
};

class PageAddPacketsTest : public TestCase {
public:
    PageAddPacketsTest() : TestCase("Page addPackets collects all overplus in order") {}

protected:
    void runTest() override {
        Page page;
        // 254 full segments leave room for one more
        std::vector<Packet> packets;
        for (size_t i = 0; i < 127; i++) {
            packets.push_back(OggTestUtils::makePacket(300));
        }
        Page::Overplus overplus = page.addPackets(packets);
        ASSERT_EQUALS(254u, page.getSegmentCount(), "127 two-segment packets");
        ASSERT_TRUE(overplus.empty(), "Everything fits");

        overplus = page.addPackets(OggTestUtils::makePacket(300, 1), OggTestUtils::makePacket(10, 2));
        ASSERT_EQUALS(255u, page.getSegmentCount(), "Page filled");
        ASSERT_EQUALS(2u, overplus.size(), "Tail of first packet and all of second overflow");
        ASSERT_EQUALS(45u, overplus[0].size(), "Tail of the 300-byte packet");
        ASSERT_EQUALS(10u, overplus[1].size(), "The 10-byte packet");
    }
};

class InvalidPackable : public Packable {
public:
    bool isValid() const override { return false; }
    Packet toPacket() const override { return Packet(); }
};

class PageInvalidPacketTest : public TestCase {
public:
    PageInvalidPacketTest() : TestCase("Page refuses invalid packables") {}

protected:
    void runTest() override {
        Page page;
        InvalidPackable invalid;
        TestPatterns::assertThrows<InvalidPacketException>([&page, &invalid]() {
            page.addPacket(invalid);
        }, "", "Invalid packable must be refused");
        ASSERT_EQUALS(0u, page.getSegmentCount(), "Nothing added");
    }
};

// ============================================================================
// Serialization
// ============================================================================

class PageMissingFieldsTest : public TestCase {
public:
    PageMissingFieldsTest() : TestCase("Page serialization requires header fields") {}

protected:
    void runTest() override {
        Page page;
        page.addPacket(OggTestUtils::makePacket(4));

        TestPatterns::assertThrows<InvalidContainerStateException>([&page]() {
            page.getBytes();
        }, "granule position", "Missing granule position");

        page.setGranulePosition(0);
        TestPatterns::assertThrows<InvalidContainerStateException>([&page]() {
            page.getBytes();
        }, "serial number", "Missing serial number");

        page.setSerialNumber(1);
        TestPatterns::assertThrows<InvalidContainerStateException>([&page]() {
            page.getBytes();
        }, "page number", "Missing page number");

        page.setPageNumber(0);
        TestPatterns::assertThrows<InvalidContainerStateException>([&page]() {
            page.getBytes();
        }, "CRC", "Missing checksum");

        TestPatterns::assertNoThrow([&page]() {
            page.getBytes(false);
        }, "Checksum is not needed when excluded");

        ASSERT_FALSE(page.isCrcChecksumValid(), "No stored checksum is never valid");
    }
};

class PageLayoutTest : public TestCase {
public:
    PageLayoutTest() : TestCase("Page byte layout") {}

protected:
    void runTest() override {
        Page page;
        page.setBeginningOfStream(true);
        page.addPacket(OggTestUtils::makePacket(3, 0x10));
        Paginator::seal(page, 0xAABBCCDD, 5, 0x0102030405060708ULL);

        std::vector<uint8_t> bytes = page.getBytes();
        ASSERT_EQUALS(page.getSize(), bytes.size(), "getSize matches serialized length");
        ASSERT_EQUALS(31u, bytes.size(), "27 header + 1 lacing + 3 body");
        ASSERT_TRUE(Page::isCapturePattern(bytes.data()), "Starts with OggS");
        ASSERT_EQUALS(0, static_cast<int>(bytes[4]), "Version");
        ASSERT_EQUALS(2, static_cast<int>(bytes[5]), "Header type");
        ASSERT_EQUALS(0x08, static_cast<int>(bytes[6]), "Granule low byte first");
        ASSERT_EQUALS(0x01, static_cast<int>(bytes[13]), "Granule high byte last");
        ASSERT_EQUALS(0xDD, static_cast<int>(bytes[14]), "Serial little-endian");
        ASSERT_EQUALS(5, static_cast<int>(bytes[18]), "Page number");
        ASSERT_EQUALS(1, static_cast<int>(bytes[26]), "Segment count");
        ASSERT_EQUALS(3, static_cast<int>(bytes[27]), "Lacing value");
        ASSERT_EQUALS(0x10, static_cast<int>(bytes[28]), "First body byte");

        ASSERT_EQUALS(*page.getCrcChecksum(), Core::ByteOrder::readLE32(bytes.data() + Page::CRC_OFFSET),
                      "Stored checksum is serialized");
        ASSERT_TRUE(page.isCrcChecksumValid(), "Sealed page has a valid checksum");
    }
};

class PageParseTest : public TestCase {
public:
    PageParseTest() : TestCase("Page parses its own bytes") {}

protected:
    void runTest() override {
        Page page = OggTestUtils::makePage({ OggTestUtils::makePacket(700), OggTestUtils::makePacket(0) },
                                           0x55, 9, 1234);
        page.setEndOfStream(true);
        page.computeAndSetCrcChecksum();

        std::vector<uint8_t> bytes = page.getBytes();
        bytes.push_back(0xEE);  // trailing byte after the page

        size_t consumed = 0;
        Page parsed = Page::fromBytes(bytes, &consumed);
        ASSERT_EQUALS(bytes.size() - 1, consumed, "Consumed exactly one page");
        ASSERT_EQUALS(1234u, *parsed.getGranulePosition(), "Granule");
        ASSERT_EQUALS(0x55u, *parsed.getSerialNumber(), "Serial");
        ASSERT_EQUALS(9u, *parsed.getPageNumber(), "Page number");
        ASSERT_TRUE(parsed.isEndOfStream(), "EOS");
        ASSERT_EQUALS(page.getSegmentCount(), parsed.getSegmentCount(), "Segment count");
        ASSERT_EQUALS(2u, parsed.getPacketCount(), "Two packets finish");
        ASSERT_TRUE(parsed.getBytes() == page.getBytes(), "Re-serialization is byte-identical");
    }
};

class PageParseErrorsTest : public TestCase {
public:
    PageParseErrorsTest() : TestCase("Page parsing errors") {}

protected:
    void runTest() override {
        std::vector<uint8_t> good = OggTestUtils::makePage({ OggTestUtils::makePacket(40) }).getBytes();

        std::vector<uint8_t> short_header(good.begin(), good.begin() + 20);
        TestPatterns::assertThrows<UnexpectedEndOfDataException>([&short_header]() {
            Page::fromBytes(short_header);
        }, "", "Header shorter than 27 bytes");

        std::vector<uint8_t> truncated(good.begin(), good.end() - 1);
        TestPatterns::assertThrows<UnexpectedEndOfDataException>([&truncated]() {
            Page::fromBytes(truncated);
        }, "", "Body one byte short");

        std::vector<uint8_t> bad_pattern = good;
        bad_pattern[3] = 'X';
        TestPatterns::assertThrows<NotAContainerPageException>([&bad_pattern]() {
            Page::fromBytes(bad_pattern);
        }, "", "Wrong capture pattern");

        std::vector<uint8_t> bad_version = good;
        bad_version[4] = 1;
        TestPatterns::assertThrows<NotAContainerPageException>([&bad_version]() {
            Page::fromBytes(bad_version);
        }, "version", "Nonzero version");

        std::vector<uint8_t> bad_crc = good;
        bad_crc[Page::CRC_OFFSET] ^= 0x01;
        TestPatterns::assertThrows<CorruptedPageException>([&bad_crc]() {
            Page::fromBytes(bad_crc);
        }, "checksum", "Corrupted checksum field");

        TestPatterns::assertNoThrow([&bad_crc]() {
            Page page = Page::fromBytes(bad_crc, nullptr, false);
            (void)page;
        }, "Checksum validation can be disabled");
    }
};

class PageBitFlipTest : public TestCase {
public:
    PageBitFlipTest() : TestCase("Page detects any single-bit corruption") {}

protected:
    void runTest() override {
        std::vector<uint8_t> good = OggTestUtils::makePage({ OggTestUtils::makePacket(20, 4) }, 7, 3, 99).getBytes();

        // Flip every bit outside the capture pattern, version and segment count
        for (size_t offset = 5; offset < good.size(); offset++) {
            if (offset == 26) {
                continue;
            }
            for (int bit = 0; bit < 8; bit++) {
                std::vector<uint8_t> corrupt = good;
                corrupt[offset] ^= static_cast<uint8_t>(1 << bit);
                bool rejected = false;
                try {
                    Page::fromBytes(corrupt);
                } catch (const CorruptedPageException&) {
                    rejected = true;
                } catch (const UnexpectedEndOfDataException&) {
                    // A flipped lacing value can make the body look longer
                    rejected = true;
                }
                ASSERT_TRUE(rejected, "Flip at byte " + std::to_string(offset) + " bit " + std::to_string(bit));
            }
        }
    }
};

int main() {
    TestSuite suite("Page Unit Tests");

    suite.addTest(std::make_unique<PageHeaderTypeTest>());
    suite.addTest(std::make_unique<PageCapacityTest>());
    suite.addTest(std::make_unique<PageOverplusTest>());
    suite.addTest(std::make_unique<PageAddPacketsTest>());
    suite.addTest(std::make_unique<PageInvalidPacketTest>());
    suite.addTest(std::make_unique<PageMissingFieldsTest>());
    suite.addTest(std::make_unique<PageLayoutTest>());
    suite.addTest(std::make_unique<PageParseTest>());
    suite.addTest(std::make_unique<PageParseErrorsTest>());
    suite.addTest(std::make_unique<PageBitFlipTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
