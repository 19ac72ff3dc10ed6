/*
 * PacketReader.cpp - Sequential packet extraction
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

PacketReader::PacketReader(IO::IOHandler* handler, PacketReaderConfig config)
    : m_reader(handler), m_config(config), m_granule_position(0), m_opened(false),
      m_end_of_stream(false), m_drop_leading_continuation(false) {
}

bool PacketReader::isHeaderGroup(const std::vector<Page>& pages) {
    uint64_t granule = pages.front().getGranulePosition().value_or(0);
    // All ones marks a data page on which no packet finishes
    if (granule == Page::NO_GRANULE_POSITION) {
        return false;
    }
    return static_cast<int64_t>(granule) < 1;
}

void PacketReader::open(bool searchForNextPage) {
    m_header_pages.clear();
    m_queue.clear();
    m_assembler.reset();
    m_end_of_stream = false;

    bool search = searchForNextPage;
    while (true) {
        std::vector<Page> group;
        try {
            group = m_reader.readPages(search);
        } catch (const UnexpectedEndOfDataException& e) {
            if (m_header_pages.empty()) {
                throw;
            }
            Debug::log("ogg", "PacketReader::open() source ended after the header pages: ", e.what());
            m_end_of_stream = true;
            break;
        }
        search = false;

        if (isHeaderGroup(group)) {
            m_header_pages.insert(m_header_pages.end(), group.begin(), group.end());
            if (group.back().isEndOfStream()) {
                m_end_of_stream = true;
                break;
            }
            continue;
        }

        for (const auto& page : group) {
            addPage(page);
        }
        break;
    }

    m_opened = true;
    Debug::log("ogg", "PacketReader::open() ", m_header_pages.size(), " header pages, ",
               m_queue.size(), " data packets queued");
}

std::vector<Packet> PacketReader::getHeaderPackets() const {
    return PageReader::packetsFromPages(m_header_pages);
}

void PacketReader::addPage(const Page& page) {
    m_granule_position = page.getGranulePosition().value_or(0);

    if (m_drop_leading_continuation) {
        m_drop_leading_continuation = false;
        if (page.isContinuation()) {
            // The packet started before the resync point and cannot be completed
            const SegmentTable& segments = page.getSegmentTable();
            size_t first = 0;
            while (first < segments.size() && segments[first].size() == Packet::MAX_SEGMENT_SIZE) {
                first++;
            }
            if (first == segments.size()) {
                m_drop_leading_continuation = true;
            } else {
                for (size_t i = first + 1; i < segments.size(); i++) {
                    m_assembler.addSegment(segments[i]);
                }
            }
            queueCompleted();
            if (page.isEndOfStream()) {
                m_end_of_stream = true;
            }
            return;
        }
    }

    m_assembler.addPage(page);
    queueCompleted();
    if (page.isEndOfStream()) {
        m_end_of_stream = true;
    }
}

void PacketReader::queueCompleted() {
    for (auto& packet : m_assembler.takePackets()) {
        m_queue.push_back(std::move(packet));
    }
}

void PacketReader::refill() {
    try {
        addPage(m_reader.readPage());
    } catch (const UnexpectedEndOfDataException& e) {
        Debug::log("ogg", "PacketReader::refill() end of data: ", e.what());
        if (m_assembler.hasPendingData()) {
            Debug::log("ogg", "PacketReader::refill() dropping unfinished packet of ",
                       m_assembler.getPendingSize(), " bytes");
            m_assembler.discardPending();
        }
        m_end_of_stream = true;
    }
}

std::optional<Packet> PacketReader::nextPacket() {
    if (!m_opened) {
        throw InvalidContainerStateException("nextPacket() called before open()");
    }

    while (m_queue.size() < m_config.lowWaterMark && !m_end_of_stream) {
        refill();
    }

    if (m_queue.empty()) {
        return std::nullopt;
    }

    Packet packet = std::move(m_queue.front());
    m_queue.pop_front();
    return packet;
}

void PacketReader::skip(size_t bytes) {
    size_t skipped = IO::ByteReader::skip(m_reader.getIOHandler(), bytes);
    Debug::log("ogg", "PacketReader::skip() skipped ", skipped, " of ", bytes, " bytes");

    m_queue.clear();
    m_assembler.reset();
    m_end_of_stream = false;
    m_drop_leading_continuation = true;

    try {
        addPage(m_reader.readNextPage());
    } catch (const UnexpectedEndOfDataException& e) {
        Debug::log("ogg", "PacketReader::skip() no page after skip: ", e.what());
        m_end_of_stream = true;
    }
}

} // namespace Container
} // namespace OggFrame
