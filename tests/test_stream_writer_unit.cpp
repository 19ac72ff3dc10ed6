/*
 * test_stream_writer_unit.cpp - Unit tests for writing logical Ogg streams
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
using namespace OggFrame::IO;
using namespace TestFramework;

namespace {

std::vector<uint8_t> bytesOf(const std::ostringstream& out) {
    std::string data = out.str();
    return std::vector<uint8_t>(data.begin(), data.end());
}

std::vector<Page> readAllPages(const std::vector<uint8_t>& bytes) {
    MemoryIOHandler handler(bytes);
    PageReader reader(&handler);
    std::vector<Page> pages;
    while (reader.hasMoreData()) {
        pages.push_back(reader.readPage());
    }
    return pages;
}

class InvalidPackable : public Packable {
public:
    bool isValid() const override { return false; }
    Packet toPacket() const override { return Packet(); }
};

} // namespace

class StreamWriterHeaderTest : public TestCase {
public:
    StreamWriterHeaderTest() : TestCase("StreamWriter header page") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriter writer(out, 0x1111);
        writer.writeHeader(OggTestUtils::makePacket(30));
        writer.writeTags(OggTestUtils::makePacket(60));

        std::vector<Page> pages = readAllPages(bytesOf(out));
        ASSERT_EQUALS(2u, pages.size(), "Header and tags pages");
        ASSERT_TRUE(pages[0].isBeginningOfStream(), "Header page is BOS");
        ASSERT_FALSE(pages[1].isBeginningOfStream(), "Tags page is not BOS");
        ASSERT_EQUALS(0u, *pages[0].getGranulePosition(), "Header granule is zero");
        ASSERT_EQUALS(0u, *pages[1].getGranulePosition(), "Tags granule is zero");
        ASSERT_EQUALS(1u, *pages[1].getPageNumber(), "Page numbers continue");
        ASSERT_EQUALS(0x1111u, *pages[1].getSerialNumber(), "Serial");
        ASSERT_EQUALS(2u, writer.getPageCount(), "Page count");
        ASSERT_EQUALS(static_cast<uint64_t>(out.str().size()), writer.getBytesWritten(), "Byte count");
    }
};

class StreamWriterOrderingTest : public TestCase {
public:
    StreamWriterOrderingTest() : TestCase("StreamWriter enforces write order") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriter writer(out, 1);
        Packet packet = OggTestUtils::makePacket(10);

        TestPatterns::assertThrows<InvalidContainerStateException>([&writer, &packet]() {
            writer.writePacket(packet, 1);
        }, "header", "Data before header");
        TestPatterns::assertThrows<InvalidContainerStateException>([&writer, &packet]() {
            writer.writeTags(packet);
        }, "header", "Tags before header");

        writer.writeHeader(packet);
        TestPatterns::assertThrows<InvalidContainerStateException>([&writer, &packet]() {
            writer.writeHeader(packet);
        }, "", "Second header");

        writer.writePacket(packet, 1);
        TestPatterns::assertThrows<InvalidContainerStateException>([&writer, &packet]() {
            writer.writeTags(packet);
        }, "precede", "Tags after data");

        writer.finish();
        ASSERT_TRUE(writer.isFinished(), "Finished");
        TestPatterns::assertThrows<InvalidContainerStateException>([&writer, &packet]() {
            writer.writePacket(packet, 2);
        }, "finished", "Data after finish");

        uint64_t bytes = writer.getBytesWritten();
        writer.finish();
        ASSERT_EQUALS(bytes, writer.getBytesWritten(), "Second finish writes nothing");
    }
};

class StreamWriterInvalidPacketTest : public TestCase {
public:
    StreamWriterInvalidPacketTest() : TestCase("StreamWriter refuses invalid packables") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriter writer(out, 1);
        InvalidPackable invalid;

        TestPatterns::assertThrows<InvalidPacketException>([&writer, &invalid]() {
            writer.writeHeader(invalid);
        }, "invalid stream header", "Invalid identification header");
        ASSERT_TRUE(out.str().empty(), "Nothing written for a rejected header");
        ASSERT_EQUALS(0u, writer.getPageCount(), "No page counted for a rejected header");

        writer.writeHeader(OggTestUtils::makePacket(10));
        ASSERT_EQUALS(1u, writer.getPageCount(), "Valid header accepted afterwards");

        TestPatterns::assertThrows<InvalidPacketException>([&writer, &invalid]() {
            writer.writeTags(invalid);
        }, "", "Invalid tags");
        TestPatterns::assertThrows<InvalidPacketException>([&writer, &invalid]() {
            writer.writePacket(invalid, 0);
        }, "", "Invalid data packet");
    }
};

class StreamWriterGranuleTest : public TestCase {
public:
    StreamWriterGranuleTest() : TestCase("StreamWriter page granule positions") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriterConfig config;
        config.maxPageContentSize = 1000;
        StreamWriter writer(out, 7, config);
        writer.writeHeader(OggTestUtils::makePacket(30));

        for (uint64_t i = 1; i <= 10; i++) {
            writer.writePacket(OggTestUtils::makePacket(300, static_cast<uint8_t>(i)), i * 10);
        }
        writer.finish();

        std::vector<Page> pages = readAllPages(bytesOf(out));
        // Four 300-byte packets exceed 1000 bytes, so every data page but the last holds four
        ASSERT_EQUALS(4u, pages.size(), "Header plus three data pages");
        ASSERT_EQUALS(4u, pages[1].getPacketCount(), "First data page");
        ASSERT_EQUALS(40u, *pages[1].getGranulePosition(), "Granule of the last packet on page 1");
        ASSERT_EQUALS(80u, *pages[2].getGranulePosition(), "Granule of the last packet on page 2");
        ASSERT_EQUALS(100u, *pages[3].getGranulePosition(), "Final granule");
        ASSERT_TRUE(pages[3].isEndOfStream(), "Last page is EOS");
        ASSERT_FALSE(pages[2].isEndOfStream(), "Only the last page is EOS");

        for (size_t i = 0; i < pages.size(); i++) {
            ASSERT_EQUALS(static_cast<uint32_t>(i), *pages[i].getPageNumber(), "Consecutive page numbers");
        }
    }
};

class StreamWriterSegmentLimitTest : public TestCase {
public:
    StreamWriterSegmentLimitTest() : TestCase("StreamWriter flushes on the segment limit") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriterConfig config;
        config.maxPageSegments = 10;
        StreamWriter writer(out, 7, config);
        writer.writeHeader(OggTestUtils::makePacket(1));

        for (uint64_t i = 1; i <= 30; i++) {
            writer.writePacket(OggTestUtils::makePacket(2), i);
        }
        writer.finish();

        std::vector<Page> pages = readAllPages(bytesOf(out));
        for (size_t i = 1; i < pages.size(); i++) {
            ASSERT_TRUE(pages[i].getSegmentCount() <= 11, "Segment limit respected");
        }
        ASSERT_EQUALS(30u, *pages.back().getGranulePosition(), "Final granule");
    }
};

class StreamWriterSpanningPacketTest : public TestCase {
public:
    StreamWriterSpanningPacketTest() : TestCase("StreamWriter spans large packets over pages") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriter writer(out, 3);
        Packet header = OggTestUtils::makePacket(30, 1);
        Packet big = OggTestUtils::makePacket(70000, 2);
        writer.writeHeader(header);
        writer.writePacket(big, 5);
        writer.finish();

        std::vector<Page> pages = readAllPages(bytesOf(out));
        ASSERT_EQUALS(3u, pages.size(), "Header, full page, final page");
        ASSERT_EQUALS(Page::NO_GRANULE_POSITION, *pages[1].getGranulePosition(),
                      "Page with no finished packet has no granule");
        ASSERT_TRUE(pages[2].isContinuation(), "Final page continues the packet");
        ASSERT_EQUALS(5u, *pages[2].getGranulePosition(), "Granule where the packet ends");
        ASSERT_TRUE(pages[2].isEndOfStream(), "EOS");

        std::vector<Packet> packets = PageReader::packetsFromPages(pages);
        ASSERT_EQUALS(2u, packets.size(), "Header and data packet");
        ASSERT_TRUE(packets[0] == header, "Header intact");
        ASSERT_TRUE(packets[1] == big, "Large packet intact");
    }
};

class StreamWriterEmptyStreamTest : public TestCase {
public:
    StreamWriterEmptyStreamTest() : TestCase("StreamWriter finish without data") {}

protected:
    void runTest() override {
        std::ostringstream out;
        StreamWriter writer(out, 9);
        writer.writeHeader(OggTestUtils::makePacket(16));
        writer.finish();

        std::vector<Page> pages = readAllPages(bytesOf(out));
        ASSERT_EQUALS(2u, pages.size(), "Header page plus empty EOS page");
        ASSERT_EQUALS(0u, pages[1].getSegmentCount(), "EOS page is empty");
        ASSERT_TRUE(pages[1].isEndOfStream(), "EOS flag");
        ASSERT_EQUALS(0u, *pages[1].getGranulePosition(), "Empty EOS page uses the last granule");
    }
};

class StreamWriterFailedStreamTest : public TestCase {
public:
    StreamWriterFailedStreamTest() : TestCase("StreamWriter reports output failures") {}

protected:
    void runTest() override {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        StreamWriter writer(out, 1);
        TestPatterns::assertThrows<IOErrorException>([&writer]() {
            writer.writeHeader(OggTestUtils::makePacket(10));
        }, "Failed to write page", "Write to a bad stream");
    }
};

int main() {
    TestSuite suite("StreamWriter Unit Tests");

    suite.addTest(std::make_unique<StreamWriterHeaderTest>());
    suite.addTest(std::make_unique<StreamWriterOrderingTest>());
    suite.addTest(std::make_unique<StreamWriterInvalidPacketTest>());
    suite.addTest(std::make_unique<StreamWriterGranuleTest>());
    suite.addTest(std::make_unique<StreamWriterSegmentLimitTest>());
    suite.addTest(std::make_unique<StreamWriterSpanningPacketTest>());
    suite.addTest(std::make_unique<StreamWriterEmptyStreamTest>());
    suite.addTest(std::make_unique<StreamWriterFailedStreamTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
