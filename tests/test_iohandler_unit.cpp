/*
 * test_iohandler_unit.cpp - Unit tests for the byte source handlers
 * This file is part of OggFrame.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OggFrame is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "oggframe.h"
#include "test_framework.h"

#include <fstream>
#include <unistd.h>

using namespace OggFrame;
using namespace OggFrame::IO;
using namespace TestFramework;

namespace {

std::vector<uint8_t> sequence(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = static_cast<uint8_t>(i);
    }
    return data;
}

std::string tempPath(const char* name) {
    return "/tmp/oggframe_" + std::to_string(getpid()) + "_" + name;
}

} // namespace

// ============================================================================
// MemoryIOHandler
// ============================================================================

class MemoryIOHandlerReadTest : public TestCase {
public:
    MemoryIOHandlerReadTest() : TestCase("MemoryIOHandler sequential reads") {}

protected:
    void runTest() override {
        MemoryIOHandler handler(sequence(10));
        uint8_t buffer[8] = {};

        ASSERT_EQUALS(4u, handler.read(buffer, 1, 4), "First read returns 4 bytes");
        ASSERT_EQUALS(3, static_cast<int>(buffer[3]), "Content of first read");
        ASSERT_EQUALS(static_cast<off_t>(4), handler.tell(), "Position after first read");
        ASSERT_FALSE(handler.eof(), "Not at end yet");

        ASSERT_EQUALS(6u, handler.read(buffer, 1, 8), "Short read at end of buffer");
        ASSERT_EQUALS(9, static_cast<int>(buffer[5]), "Last byte delivered");
        ASSERT_TRUE(handler.eof(), "End reached");
        ASSERT_EQUALS(0u, handler.read(buffer, 1, 1), "Nothing left to read");
        ASSERT_EQUALS(0, handler.getLastError(), "End of data is not an error");
    }
};

class MemoryIOHandlerWholeElementsTest : public TestCase {
public:
    MemoryIOHandlerWholeElementsTest() : TestCase("MemoryIOHandler transfers whole elements only") {}

protected:
    void runTest() override {
        MemoryIOHandler handler(sequence(7));
        uint32_t words[2] = {};

        ASSERT_EQUALS(1u, handler.read(words, 4, 2), "Only one complete 4-byte element");
        ASSERT_EQUALS(static_cast<off_t>(4), handler.tell(), "Partial element is not consumed");
    }
};

class MemoryIOHandlerSeekTest : public TestCase {
public:
    MemoryIOHandlerSeekTest() : TestCase("MemoryIOHandler seek") {}

protected:
    void runTest() override {
        MemoryIOHandler handler(sequence(100));
        ASSERT_TRUE(handler.canSeek(), "Memory is seekable");
        ASSERT_EQUALS(static_cast<off_t>(100), handler.getFileSize(), "Size");

        ASSERT_EQUALS(0, handler.seek(50, SEEK_SET), "SEEK_SET");
        uint8_t byte = 0;
        handler.read(&byte, 1, 1);
        ASSERT_EQUALS(50, static_cast<int>(byte), "Byte at offset 50");

        ASSERT_EQUALS(0, handler.seek(-11, SEEK_CUR), "SEEK_CUR backwards");
        handler.read(&byte, 1, 1);
        ASSERT_EQUALS(40, static_cast<int>(byte), "Byte at offset 40");

        ASSERT_EQUALS(0, handler.seek(-1, SEEK_END), "SEEK_END");
        handler.read(&byte, 1, 1);
        ASSERT_EQUALS(99, static_cast<int>(byte), "Last byte");

        ASSERT_EQUALS(-1, handler.seek(-1, SEEK_SET), "Negative position is rejected");
        ASSERT_EQUALS(EINVAL, handler.getLastError(), "EINVAL after bad seek");
    }
};

class MemoryIOHandlerFeedTest : public TestCase {
public:
    MemoryIOHandlerFeedTest() : TestCase("MemoryIOHandler incremental feeding") {}

protected:
    void runTest() override {
        MemoryIOHandler handler;
        ASSERT_TRUE(handler.eof(), "Empty handler is at end");

        std::vector<uint8_t> first = sequence(6);
        handler.write(first.data(), first.size());
        uint8_t buffer[6] = {};
        ASSERT_EQUALS(6u, handler.read(buffer, 1, 6), "Reads what was written");

        handler.discardRead();
        ASSERT_EQUALS(static_cast<off_t>(6), handler.tell(), "Logical position survives discard");
        ASSERT_EQUALS(-1, handler.seek(0, SEEK_SET), "Discarded data cannot be revisited");

        const uint8_t more[2] = {0xAA, 0xBB};
        handler.write(more, 2);
        ASSERT_FALSE(handler.eof(), "New data clears end state");
        ASSERT_EQUALS(2u, handler.read(buffer, 1, 2), "Reads appended data");
        ASSERT_EQUALS(0xBB, static_cast<int>(buffer[1]), "Appended content");
    }
};

class MemoryIOHandlerClosedTest : public TestCase {
public:
    MemoryIOHandlerClosedTest() : TestCase("MemoryIOHandler after close") {}

protected:
    void runTest() override {
        MemoryIOHandler handler(sequence(4));
        handler.close();
        uint8_t byte = 0;
        ASSERT_EQUALS(0u, handler.read(&byte, 1, 1), "Closed handler delivers nothing");
        ASSERT_EQUALS(EBADF, handler.getLastError(), "EBADF after close");
    }
};

// ============================================================================
// PushbackIOHandler
// ============================================================================

class PushbackIOHandlerUnreadTest : public TestCase {
public:
    PushbackIOHandlerUnreadTest() : TestCase("PushbackIOHandler returns unread bytes first") {}

protected:
    void runTest() override {
        PushbackIOHandler handler(std::make_unique<MemoryIOHandler>(sequence(10)));
        ASSERT_FALSE(handler.canSeek(), "Pushback source is not seekable");
        ASSERT_EQUALS(-1, handler.seek(0, SEEK_SET), "Seek is refused");

        uint8_t buffer[4] = {};
        ASSERT_EQUALS(4u, handler.read(buffer, 1, 4), "Initial read");
        ASSERT_EQUALS(4u, handler.unread(buffer + 0, 4), "Push the same bytes back");
        ASSERT_EQUALS(4u, handler.getPushbackSize(), "Pushback holds 4 bytes");
        ASSERT_EQUALS(static_cast<off_t>(0), handler.tell(), "Position rewinds");

        uint8_t again[6] = {};
        ASSERT_EQUALS(6u, handler.read(again, 1, 6), "Read spanning pushback and source");
        for (int i = 0; i < 6; i++) {
            ASSERT_EQUALS(i, static_cast<int>(again[i]), "Bytes come back in original order");
        }
        ASSERT_EQUALS(0u, handler.getPushbackSize(), "Pushback drained");
    }
};

class PushbackIOHandlerCapacityTest : public TestCase {
public:
    PushbackIOHandlerCapacityTest() : TestCase("PushbackIOHandler capacity limit") {}

protected:
    void runTest() override {
        PushbackIOHandler handler(std::make_unique<MemoryIOHandler>(sequence(10)));
        ASSERT_EQUALS(PushbackIOHandler::DEFAULT_CAPACITY, handler.getCapacity(), "Default capacity");

        uint8_t buffer[6] = {};
        handler.read(buffer, 1, 6);
        ASSERT_EQUALS(0u, handler.unread(buffer, 6), "More than capacity is refused");
        ASSERT_EQUALS(0u, handler.getPushbackSize(), "Refused unread leaves nothing behind");
        ASSERT_EQUALS(5u, handler.unread(buffer + 1, 5), "Exactly capacity is accepted");
        ASSERT_EQUALS(0u, handler.unread(buffer, 1), "Full pushback refuses more");
    }
};

class PushbackIOHandlerEofTest : public TestCase {
public:
    PushbackIOHandlerEofTest() : TestCase("PushbackIOHandler end of data") {}

protected:
    void runTest() override {
        PushbackIOHandler handler(std::make_unique<MemoryIOHandler>(sequence(2)));
        uint8_t buffer[2] = {};
        handler.read(buffer, 1, 2);
        ASSERT_TRUE(handler.eof(), "Source exhausted");

        handler.unread(buffer + 1, 1);
        ASSERT_FALSE(handler.eof(), "Pushed back byte is pending");
        uint8_t byte = 0;
        ASSERT_EQUALS(1u, handler.read(&byte, 1, 1), "Pending byte delivered");
        ASSERT_EQUALS(1, static_cast<int>(byte), "Pending byte value");
        ASSERT_TRUE(handler.eof(), "Exhausted again");
    }
};

class PushbackIOHandlerNullSourceTest : public TestCase {
public:
    PushbackIOHandlerNullSourceTest() : TestCase("PushbackIOHandler rejects null source") {}

protected:
    void runTest() override {
        TestPatterns::assertThrows<std::invalid_argument>([]() {
            PushbackIOHandler handler(nullptr);
        }, "cannot be null", "Null source must be rejected");
    }
};

// ============================================================================
// ByteReader
// ============================================================================

class ByteReaderReadFullyTest : public TestCase {
public:
    ByteReaderReadFullyTest() : TestCase("ByteReader readFully and readBytes") {}

protected:
    void runTest() override {
        MemoryIOHandler handler(sequence(10));
        ASSERT_EQUALS(0, static_cast<int>(ByteReader::readByte(&handler, "first byte")), "readByte");

        std::vector<uint8_t> bytes = ByteReader::readBytes(&handler, 5, "body");
        ASSERT_EQUALS(5u, bytes.size(), "readBytes size");
        ASSERT_EQUALS(5, static_cast<int>(bytes[4]), "readBytes content");

        TestPatterns::assertThrows<UnexpectedEndOfDataException>([&handler]() {
            ByteReader::readBytes(&handler, 10, "trailer");
        }, "trailer", "Short read must name what was being read");
    }
};

class ByteReaderSkipTest : public TestCase {
public:
    ByteReaderSkipTest() : TestCase("ByteReader skip on seekable and streaming sources") {}

protected:
    void runTest() override {
        MemoryIOHandler memory(sequence(100));
        ASSERT_EQUALS(40u, ByteReader::skip(&memory, 40), "Seekable skip");
        ASSERT_EQUALS(static_cast<off_t>(40), memory.tell(), "Position after seekable skip");
        ASSERT_EQUALS(60u, ByteReader::skip(&memory, 1000), "Skip clamps at end");

        PushbackIOHandler stream(std::make_unique<MemoryIOHandler>(sequence(10000)));
        ASSERT_EQUALS(9000u, ByteReader::skip(&stream, 9000), "Streaming skip reads through");
        uint8_t byte = ByteReader::readByte(&stream, "byte after skip");
        ASSERT_EQUALS(static_cast<uint8_t>(9000 & 0xFF), byte, "Next byte after streaming skip");
        ASSERT_EQUALS(999u, ByteReader::skip(&stream, 5000), "Streaming skip stops at end");
    }
};

class ByteReaderNullHandlerTest : public TestCase {
public:
    ByteReaderNullHandlerTest() : TestCase("ByteReader rejects null handler") {}

protected:
    void runTest() override {
        uint8_t byte = 0;
        TestPatterns::assertThrows<std::invalid_argument>([&byte]() {
            ByteReader::readUpTo(nullptr, &byte, 1);
        }, "", "readUpTo with null handler");
        TestPatterns::assertThrows<std::invalid_argument>([]() {
            ByteReader::skip(nullptr, 1);
        }, "", "skip with null handler");
    }
};

// ============================================================================
// FileIOHandler and RAIIFileHandle
// ============================================================================

class FileIOHandlerReadSeekTest : public TestCase {
public:
    FileIOHandlerReadSeekTest() : TestCase("FileIOHandler reads and seeks a real file") {}

protected:
    void setUp() override {
        m_path = tempPath("file_io.bin");
        std::vector<uint8_t> data = sequence(256);
        std::ofstream out(m_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    void tearDown() override {
        std::remove(m_path.c_str());
    }

    void runTest() override {
        File::FileIOHandler handler{TagLib::String(m_path)};
        ASSERT_TRUE(handler.canSeek(), "Files are seekable");
        ASSERT_EQUALS(static_cast<off_t>(256), handler.getFileSize(), "File size");

        uint8_t buffer[16] = {};
        ASSERT_EQUALS(16u, handler.read(buffer, 1, 16), "Read 16 bytes");
        ASSERT_EQUALS(15, static_cast<int>(buffer[15]), "Content");

        ASSERT_EQUALS(0, handler.seek(-4, SEEK_END), "Seek near end");
        ASSERT_EQUALS(4u, handler.read(buffer, 1, 16), "Short read at end");
        ASSERT_EQUALS(255, static_cast<int>(buffer[3]), "Last byte");
        ASSERT_TRUE(handler.eof(), "End of file reported");
    }

private:
    std::string m_path;
};

class FileIOHandlerMissingFileTest : public TestCase {
public:
    FileIOHandlerMissingFileTest() : TestCase("FileIOHandler reports a missing file") {}

protected:
    void runTest() override {
        std::string path = tempPath("does_not_exist.ogg");
        TestPatterns::assertThrows<IOErrorException>([&path]() {
            File::FileIOHandler handler{TagLib::String(path)};
        }, "", "Opening a missing file must throw");
    }
};

class RAIIFileHandleOwnershipTest : public TestCase {
public:
    RAIIFileHandleOwnershipTest() : TestCase("RAIIFileHandle ownership and moves") {}

protected:
    void runTest() override {
        std::string path = tempPath("raii.bin");
        {
            RAIIFileHandle handle;
            ASSERT_FALSE(handle.is_valid(), "Default handle is empty");
            ASSERT_TRUE(handle.open(path.c_str(), "wb"), "Open for writing");
            ASSERT_TRUE(static_cast<bool>(handle), "Handle converts to true");
            ASSERT_TRUE(handle.owns_handle(), "Handle owns what it opened");

            RAIIFileHandle moved(std::move(handle));
            ASSERT_TRUE(moved.is_valid(), "Moved-to handle is valid");
            ASSERT_FALSE(handle.is_valid(), "Moved-from handle is empty");
            ASSERT_EQUALS(0, moved.close(), "Close succeeds");
            ASSERT_FALSE(moved.is_valid(), "Closed handle is empty");
        }
        std::remove(path.c_str());
    }
};

class IOHandlerErrorLogTest : public TestCase {
public:
    IOHandlerErrorLogTest() : TestCase("IOHandler logs error code and message") {}

protected:
    void setUp() override {
        m_path = tempPath("io_errors.log");
        std::remove(m_path.c_str());
    }

    void tearDown() override {
        Debug::shutdown();
        std::remove(m_path.c_str());
    }

    void runTest() override {
        Debug::init(m_path, { "io" });

        MemoryIOHandler handler;
        std::vector<uint8_t> data = sequence(4);
        handler.write(data.data(), data.size());
        uint8_t buffer[4] = {};
        handler.read(buffer, 1, 4);
        handler.discardRead();
        ASSERT_EQUALS(-1, handler.seek(0, SEEK_SET), "Seek into discarded data fails");
        ASSERT_EQUALS(EINVAL, handler.getLastError(), "Error code recorded");
        Debug::shutdown();

        std::ifstream in(m_path);
        std::string line;
        bool found = false;
        std::string expected = "Error " + std::to_string(EINVAL) + ": Cannot seek to discarded data";
        while (std::getline(in, line)) {
            if (line.find(expected) != std::string::npos) {
                found = true;
            }
        }
        ASSERT_TRUE(found, "Log line carries the code followed by the message");
    }

private:
    std::string m_path;
};

// Forward-only source relying on the IOHandler defaults
class CountingSource : public IOHandler {
public:
    explicit CountingSource(size_t length) : m_length(length), m_offset(0) {}

    size_t read(void* buffer, size_t size, size_t count) override {
        if (!buffer || size == 0) {
            return 0;
        }
        size_t elements = std::min(count, (m_length - m_offset) / size);
        uint8_t* out = static_cast<uint8_t*>(buffer);
        for (size_t i = 0; i < elements * size; i++) {
            out[i] = static_cast<uint8_t>(m_offset + i);
        }
        m_offset += elements * size;
        updatePosition(static_cast<off_t>(m_offset));
        updateEofState(m_offset >= m_length);
        return elements;
    }

    int seek(off_t, int) override {
        updateErrorState(ESPIPE);
        return -1;
    }

    off_t tell() override {
        return m_position.load();
    }

    int close() override {
        updateClosedState(true);
        return 0;
    }

private:
    size_t m_length;
    size_t m_offset;
};

class IOHandlerDefaultsTest : public TestCase {
public:
    IOHandlerDefaultsTest() : TestCase("IOHandler defaults describe a forward-only source") {}

protected:
    void runTest() override {
        CountingSource source(6);
        ASSERT_FALSE(source.canSeek(), "Not seekable by default");
        ASSERT_EQUALS(static_cast<off_t>(-1), source.getFileSize(), "Size unknown by default");

        const uint8_t back[2] = {1, 2};
        ASSERT_EQUALS(0u, source.unread(back, 2), "No pushback by default");

        uint8_t buffer[8] = {};
        ASSERT_EQUALS(6u, source.read(buffer, 1, 8), "Short count at end of data");
        ASSERT_TRUE(source.eof(), "End of data reported");
        ASSERT_EQUALS(static_cast<off_t>(6), source.tell(), "Position tracked");

        ASSERT_EQUALS(-1, source.seek(0, SEEK_SET), "Seek refused");
        ASSERT_EQUALS(ESPIPE, source.getLastError(), "Error code kept");

        source.close();
        ASSERT_TRUE(source.eof(), "Closed source is at end");

        Container::PageReader reader(&source);
        TestPatterns::assertThrows<UnsupportedOperationException>([&reader]() {
            reader.locateLastPage();
        }, "seekable", "Last page needs a seekable source");
    }
};

int main() {
    TestSuite suite("IOHandler Unit Tests");

    suite.addTest(std::make_unique<MemoryIOHandlerReadTest>());
    suite.addTest(std::make_unique<MemoryIOHandlerWholeElementsTest>());
    suite.addTest(std::make_unique<MemoryIOHandlerSeekTest>());
    suite.addTest(std::make_unique<MemoryIOHandlerFeedTest>());
    suite.addTest(std::make_unique<MemoryIOHandlerClosedTest>());
    suite.addTest(std::make_unique<IOHandlerErrorLogTest>());
    suite.addTest(std::make_unique<IOHandlerDefaultsTest>());
    suite.addTest(std::make_unique<PushbackIOHandlerUnreadTest>());
    suite.addTest(std::make_unique<PushbackIOHandlerCapacityTest>());
    suite.addTest(std::make_unique<PushbackIOHandlerEofTest>());
    suite.addTest(std::make_unique<PushbackIOHandlerNullSourceTest>());
    suite.addTest(std::make_unique<ByteReaderReadFullyTest>());
    suite.addTest(std::make_unique<ByteReaderSkipTest>());
    suite.addTest(std::make_unique<ByteReaderNullHandlerTest>());
    suite.addTest(std::make_unique<FileIOHandlerReadSeekTest>());
    suite.addTest(std::make_unique<FileIOHandlerMissingFileTest>());
    suite.addTest(std::make_unique<RAIIFileHandleOwnershipTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
