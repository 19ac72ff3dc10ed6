/*
 * PacketReader.h - Sequential packet extraction
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

#ifndef OGGFRAME_CONTAINER_PACKETREADER_H
#define OGGFRAME_CONTAINER_PACKETREADER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

struct PacketReaderConfig {
    // Refill from the source whenever fewer packets than this are queued
    size_t lowWaterMark = 8;
};

/**
 * @brief Sequential packet extraction from a single logical stream.
 *
 * open() collects the leading header pages: page groups whose first page
 * has a granule position below 1 when read as a signed value, other than
 * the all-ones value that marks a page with no finished packet. Data packets
 * are then handed out in page order by nextPacket() until the source runs
 * out or an end-of-stream page has been consumed.
 */
class PacketReader {
public:
    explicit PacketReader(IO::IOHandler* handler, PacketReaderConfig config = PacketReaderConfig());

    /**
     * @brief Read the header pages and queue the first data packets.
     * @throws UnexpectedEndOfDataException if the source holds no page at all
     */
    void open(bool searchForNextPage = false);

    const std::vector<Page>& getHeaderPages() const { return m_header_pages; }

    std::vector<Packet> getHeaderPackets() const;

    /**
     * @brief Next data packet, or std::nullopt once the stream is exhausted.
     *
     * Corrupted pages and other read errors propagate.
     */
    std::optional<Packet> nextPacket();

    /**
     * @brief Discard bytes from the source and resynchronize on the next page.
     *
     * Queued packets are dropped, as is the tail of a packet the new page
     * starts in the middle of.
     */
    void skip(size_t bytes);

    bool isEndOfStream() const { return m_end_of_stream; }

    /**
     * @brief Granule position of the most recently read page.
     */
    uint64_t getGranulePosition() const { return m_granule_position; }

    PageReader& getPageReader() { return m_reader; }

private:
    static bool isHeaderGroup(const std::vector<Page>& pages);
    void refill();
    void addPage(const Page& page);
    void queueCompleted();

    PageReader m_reader;
    PacketReaderConfig m_config;
    PacketAssembler m_assembler;
    std::vector<Page> m_header_pages;
    std::deque<Packet> m_queue;
    uint64_t m_granule_position;
    bool m_opened;
    bool m_end_of_stream;
    bool m_drop_leading_continuation;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PACKETREADER_H
