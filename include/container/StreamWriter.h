/*
 * StreamWriter.h - Logical stream writer
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

#ifndef OGGFRAME_CONTAINER_STREAMWRITER_H
#define OGGFRAME_CONTAINER_STREAMWRITER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief Page size limits applied to data pages.
 *
 * A pending page is flushed before the next packet is added once its
 * content exceeds maxPageContentSize bytes or it holds more than
 * maxPageSegments segments.
 */
struct StreamWriterConfig {
    size_t maxPageContentSize = 4250;
    size_t maxPageSegments = 240;
};

/**
 * @brief Writes one logical Ogg stream to an output stream.
 *
 * Call order: writeHeader(), optionally writeTags(), any number of
 * writePacket(), then finish(). The header goes alone on the first page,
 * flagged beginning-of-stream, and the last page is flagged end-of-stream.
 */
class StreamWriter {
public:
    StreamWriter(std::ostream& out, uint32_t serial, StreamWriterConfig config = StreamWriterConfig());

    // Prevent copying
    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;

    /**
     * @brief Write the identification header as page 0, granule 0.
     * @throws InvalidContainerStateException if anything was written before
     * @throws InvalidPacketException if header.isValid() is false
     */
    void writeHeader(const Packable& header);

    /**
     * @brief Write the comment header on its own page(s), granule 0.
     * @throws InvalidContainerStateException unless it directly follows the header
     */
    void writeTags(const Packable& tags);

    /**
     * @brief Queue a data packet.
     * @param granule Granule position at the end of this packet
     *
     * Pages on which no packet finishes are written with
     * Page::NO_GRANULE_POSITION.
     */
    void writePacket(const Packable& packet, uint64_t granule);

    /**
     * @brief Flush the pending page flagged end-of-stream.
     *
     * Writes an empty end-of-stream page if nothing is pending.
     */
    void finish();

    uint64_t getBytesWritten() const { return m_bytes_written; }
    uint32_t getPageCount() const { return m_next_page_number; }
    uint32_t getSerialNumber() const { return m_serial; }
    bool isFinished() const { return m_finished; }

private:
    void requireOpen(const char* operation) const;
    void writePages(std::vector<Page>& pages);
    void flush();
    void emit(Page& page, uint64_t granule);

    std::ostream& m_out;
    uint32_t m_serial;
    StreamWriterConfig m_config;

    Page m_page;
    uint64_t m_last_granule;
    uint32_t m_next_page_number;
    uint64_t m_bytes_written;
    bool m_header_written;
    bool m_data_started;
    bool m_finished;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_STREAMWRITER_H
