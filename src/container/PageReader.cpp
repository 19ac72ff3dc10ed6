/*
 * PageReader.cpp - Ogg page synchronization and reading
 * This file is part of OggFrame.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OggFrame is free software. You may redistribute and/or modify it under
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

#include "oggframe.h"

namespace OggFrame {
namespace Container {

using IO::ByteReader;

PageReader::PageReader(IO::IOHandler* handler)
    : m_handler(handler), m_skipped_bytes(0), m_pages_read(0) {
    if (!m_handler) {
        throw std::invalid_argument("PageReader: IOHandler cannot be null");
    }
}

Page PageReader::readPage() {
    uint8_t capture[4];
    ByteReader::readFully(m_handler, capture, sizeof(capture), "capture pattern");
    if (!Page::isCapturePattern(capture)) {
        throw NotAContainerPageException("Not an Ogg page: capture pattern not found at the read position");
    }
    return readPageAfterCapturePattern();
}

Page PageReader::readNextPage() {
    uint8_t window[4];
    size_t got = ByteReader::readUpTo(m_handler, window, sizeof(window));
    if (got < sizeof(window)) {
        m_skipped_bytes += got;
        throw UnexpectedEndOfDataException("End of data reached while searching for an Ogg page");
    }

    uint64_t skipped = 0;
    while (!Page::isCapturePattern(window)) {
        uint8_t next = 0;
        if (ByteReader::readUpTo(m_handler, &next, 1) == 0) {
            m_skipped_bytes += skipped + sizeof(window);
            Debug::log("ogg", "PageReader::readNextPage() no capture pattern after ", skipped + sizeof(window), " bytes");
            throw UnexpectedEndOfDataException("End of data reached while searching for an Ogg page");
        }
        std::memmove(window, window + 1, 3);
        window[3] = next;
        skipped++;
    }

    if (skipped > 0) {
        m_skipped_bytes += skipped;
        Debug::log("ogg", "PageReader::readNextPage() skipped ", skipped, " bytes to reach the next page");
    }

    return readPageAfterCapturePattern();
}

Page PageReader::readPageAfterCapturePattern() {
    std::vector<uint8_t> buffer(Page::HEADER_SIZE);
    std::memcpy(buffer.data(), Page::CAPTURE_PATTERN, 4);
    ByteReader::readFully(m_handler, buffer.data() + 4, Page::HEADER_SIZE - 4, "page header");

    // Reject a foreign version before trusting the segment count
    if (buffer[4] != Page::VERSION) {
        throw NotAContainerPageException("Unsupported Ogg page version " + std::to_string(buffer[4]));
    }

    size_t segment_count = buffer[26];
    buffer.resize(Page::HEADER_SIZE + segment_count);
    ByteReader::readFully(m_handler, buffer.data() + Page::HEADER_SIZE, segment_count, "segment table");

    size_t body_size = 0;
    for (size_t i = 0; i < segment_count; i++) {
        body_size += buffer[Page::HEADER_SIZE + i];
    }

    size_t header_size = buffer.size();
    buffer.resize(header_size + body_size);
    ByteReader::readFully(m_handler, buffer.data() + header_size, body_size, "page body");

    Page page = Page::fromBytes(buffer);
    m_pages_read++;

    DEBUG_LOG_LAZY("ogg", "page ", page.getPageNumber().value_or(0),
                   " serial ", page.getSerialNumber().value_or(0),
                   " granule ", page.getGranulePosition().value_or(0),
                   " segments ", page.getSegmentCount(),
                   " header type ", static_cast<unsigned>(page.getHeaderType()));
    return page;
}

std::vector<Page> PageReader::readPages(bool searchForNextPage) {
    std::vector<Page> pages;
    pages.push_back(searchForNextPage ? readNextPage() : readPage());
    while (pages.back().contentContinuesInNextPage()) {
        pages.push_back(readPage());
    }
    return pages;
}

std::vector<Packet> PageReader::readPackets(bool searchForNextPage) {
    return packetsFromPages(readPages(searchForNextPage));
}

std::vector<Packet> PageReader::packetsFromPages(const std::vector<Page>& pages) {
    PacketAssembler assembler;
    for (const auto& page : pages) {
        assembler.addPage(page);
    }
    if (assembler.hasPendingData()) {
        Debug::log("ogg", "PageReader::packetsFromPages() dropping unfinished packet of ",
                   assembler.getPendingSize(), " bytes");
    }
    return assembler.takePackets();
}

bool PageReader::putBack(const uint8_t* data, size_t size) {
    if (m_handler->canSeek()) {
        return m_handler->seek(-static_cast<off_t>(size), SEEK_CUR) == 0;
    }
    return m_handler->unread(data, size) == size;
}

void PageReader::skipPage() {
    uint8_t window[4];
    ByteReader::readFully(m_handler, window, sizeof(window), "capture pattern");

    if (Page::isCapturePattern(window)) {
        uint8_t header[Page::HEADER_SIZE];
        std::memcpy(header, window, sizeof(window));
        ByteReader::readFully(m_handler, header + 4, Page::HEADER_SIZE - 4, "page header");

        size_t segment_count = header[26];
        std::vector<uint8_t> lacing = ByteReader::readBytes(m_handler, segment_count, "segment table");
        size_t body_size = 0;
        for (uint8_t value : lacing) {
            body_size += value;
        }

        size_t skipped = ByteReader::skip(m_handler, body_size);
        if (skipped < body_size) {
            throw UnexpectedEndOfDataException("Unexpected end of data while skipping page body (needed " +
                                               std::to_string(body_size) + " bytes, got " +
                                               std::to_string(skipped) + ")");
        }
        return;
    }

    // Make sure the window can be handed back before any data is discarded
    if (!m_handler->canSeek()) {
        if (m_handler->unread(window, sizeof(window)) != sizeof(window)) {
            throw UnsupportedOperationException("Cannot resynchronize: source can neither seek nor push back data");
        }
        ByteReader::readFully(m_handler, window, sizeof(window), "capture pattern");
    }

    uint64_t skipped = 0;
    while (!Page::isCapturePattern(window)) {
        uint8_t next = 0;
        if (ByteReader::readUpTo(m_handler, &next, 1) == 0) {
            m_skipped_bytes += skipped + sizeof(window);
            throw UnexpectedEndOfDataException("End of data reached while searching for an Ogg page");
        }
        std::memmove(window, window + 1, 3);
        window[3] = next;
        skipped++;
    }

    m_skipped_bytes += skipped;
    Debug::log("ogg", "PageReader::skipPage() skipped ", skipped, " bytes to reach the next page");

    if (!putBack(window, sizeof(window))) {
        throw IOErrorException("Failed to reposition source on the capture pattern");
    }
}

void PageReader::seekTo(off_t position) {
    if (m_handler->seek(position, SEEK_SET) != 0) {
        throw IOErrorException("Seek to offset " + std::to_string(position) + " failed");
    }
}

off_t PageReader::findCapturePatternBackward(off_t start) {
    static constexpr off_t CHUNK_SIZE = 4096;
    std::vector<uint8_t> chunk;

    off_t high = start;
    while (high >= 0) {
        off_t low = std::max<off_t>(0, high - CHUNK_SIZE + 1);
        size_t length = static_cast<size_t>(high - low) + 4;

        seekTo(low);
        chunk.resize(length);
        size_t got = ByteReader::readUpTo(m_handler, chunk.data(), length);

        for (off_t candidate = high; candidate >= low; candidate--) {
            size_t index = static_cast<size_t>(candidate - low);
            if (index + 4 <= got && Page::isCapturePattern(chunk.data() + index)) {
                return candidate;
            }
        }
        high = low - 1;
    }
    return -1;
}

off_t PageReader::locateLastPage() {
    if (!m_handler->canSeek()) {
        throw UnsupportedOperationException("Locating the last page requires a seekable source");
    }

    off_t length = m_handler->getFileSize();
    if (length < static_cast<off_t>(Page::HEADER_SIZE)) {
        throw UnexpectedEndOfDataException("Source too short to hold an Ogg page (" +
                                           std::to_string(length < 0 ? 0 : length) + " bytes)");
    }

    off_t position = findCapturePatternBackward(length - static_cast<off_t>(Page::HEADER_SIZE));
    if (position < 0) {
        throw UnexpectedEndOfDataException("No Ogg page found in source");
    }

    seekTo(position);
    Debug::log("ogg", "PageReader::locateLastPage() last capture pattern at offset ", position);
    return position;
}

Page PageReader::readLastPage() {
    off_t position = locateLastPage();
    while (true) {
        try {
            return readPage();
        } catch (const NotAContainerPageException& e) {
            Debug::log("ogg", "PageReader::readLastPage() candidate at ", position, " rejected: ", e.what());
        } catch (const CorruptedPageException& e) {
            Debug::log("ogg", "PageReader::readLastPage() candidate at ", position, " rejected: ", e.what());
        } catch (const UnexpectedEndOfDataException& e) {
            Debug::log("ogg", "PageReader::readLastPage() candidate at ", position, " rejected: ", e.what());
        }

        if (position == 0) {
            throw UnexpectedEndOfDataException("No valid Ogg page found in source");
        }
        position = findCapturePatternBackward(position - 1);
        if (position < 0) {
            throw UnexpectedEndOfDataException("No valid Ogg page found in source");
        }
        seekTo(position);
    }
}

uint64_t PageReader::getLastGranulePosition() {
    off_t saved = m_handler->tell();
    Page last = readLastPage();
    if (saved >= 0) {
        seekTo(saved);
    }
    return last.getGranulePosition().value_or(Page::NO_GRANULE_POSITION);
}

bool PageReader::hasMoreData() {
    uint8_t byte = 0;
    if (ByteReader::readUpTo(m_handler, &byte, 1) == 0) {
        return false;
    }
    if (!putBack(&byte, 1)) {
        throw UnsupportedOperationException("Cannot peek: source can neither seek nor push back data");
    }
    return true;
}

} // namespace Container
} // namespace OggFrame
