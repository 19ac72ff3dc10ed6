/*
 * StreamWriter.cpp - Logical stream writer
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

StreamWriter::StreamWriter(std::ostream& out, uint32_t serial, StreamWriterConfig config)
    : m_out(out), m_serial(serial), m_config(config), m_last_granule(0), m_next_page_number(0),
      m_bytes_written(0), m_header_written(false), m_data_started(false), m_finished(false) {
}

void StreamWriter::requireOpen(const char* operation) const {
    if (m_finished) {
        throw InvalidContainerStateException(std::string(operation) + " after the stream was finished");
    }
    if (!m_header_written) {
        throw InvalidContainerStateException(std::string(operation) + " before the stream header was written");
    }
}

void StreamWriter::writeHeader(const Packable& header) {
    if (m_header_written || m_next_page_number != 0 || m_finished) {
        throw InvalidContainerStateException("Stream header must be the first thing written");
    }
    if (!header.isValid()) {
        throw InvalidPacketException("Refusing to write an invalid stream header");
    }

    std::vector<Page> pages = Paginator::toPages(m_serial, 0, { header.toPacket() }, 0);
    pages.front().setBeginningOfStream(true);
    writePages(pages);
    m_header_written = true;
}

void StreamWriter::writeTags(const Packable& tags) {
    requireOpen("writeTags()");
    if (m_data_started) {
        throw InvalidContainerStateException("Comment header must precede data packets");
    }
    if (!tags.isValid()) {
        throw InvalidPacketException("Refusing to write an invalid comment header");
    }

    std::vector<Page> pages = Paginator::toPages(m_serial, m_next_page_number, { tags.toPacket() }, 0);
    writePages(pages);
}

void StreamWriter::writePages(std::vector<Page>& pages) {
    for (auto& page : pages) {
        emit(page, page.getGranulePosition().value_or(0));
    }
}

void StreamWriter::writePacket(const Packable& packable, uint64_t granule) {
    requireOpen("writePacket()");
    if (!packable.isValid()) {
        throw InvalidPacketException("Refusing to write an invalid packet");
    }
    m_data_started = true;

    if (m_page.getTotalSegmentSize() > m_config.maxPageContentSize ||
        m_page.getSegmentCount() > m_config.maxPageSegments) {
        flush();
    }

    Page::Overplus overplus = m_page.addPacket(packable);
    while (!overplus.empty()) {
        bool continues = m_page.contentContinuesInNextPage();
        flush();
        m_page.setContinuation(continues);
        overplus = m_page.addSegments(overplus);
    }
    m_last_granule = granule;
}

void StreamWriter::flush() {
    // A page on which no packet finishes has no meaningful granule position
    uint64_t granule = (m_page.getPacketCount() > 0 || m_page.getSegmentCount() == 0)
                           ? m_last_granule
                           : Page::NO_GRANULE_POSITION;
    emit(m_page, granule);
    m_page = Page();
}

void StreamWriter::finish() {
    if (m_finished) {
        Debug::log("ogg", "StreamWriter::finish() stream ", m_serial, " already finished");
        return;
    }
    requireOpen("finish()");

    m_page.setEndOfStream(true);
    flush();
    m_finished = true;

    Debug::log("ogg", "StreamWriter::finish() serial ", m_serial, " wrote ", m_next_page_number,
               " pages, ", m_bytes_written, " bytes");
}

void StreamWriter::emit(Page& page, uint64_t granule) {
    Paginator::seal(page, m_serial, m_next_page_number, granule);
    std::vector<uint8_t> bytes = page.getBytes();

    m_out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!m_out) {
        throw IOErrorException("Failed to write page " + std::to_string(m_next_page_number) +
                               " of stream " + std::to_string(m_serial));
    }

    m_next_page_number++;
    m_bytes_written += bytes.size();
}

} // namespace Container
} // namespace OggFrame
