/*
 * PageReader.h - Ogg page synchronization and reading
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

#ifndef OGGFRAME_CONTAINER_PAGEREADER_H
#define OGGFRAME_CONTAINER_PAGEREADER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief Reads Ogg pages from a byte source.
 *
 * The reader borrows the IOHandler; the caller keeps it alive. Two read
 * modes exist: strict, where the source must be positioned exactly on a
 * capture pattern, and resynchronizing, where bytes are discarded one at
 * a time until a capture pattern shows up. Every parsed page has its
 * checksum verified.
 */
class PageReader {
public:
    /**
     * @throws std::invalid_argument if handler is null
     */
    explicit PageReader(IO::IOHandler* handler);

    // Prevent copying
    PageReader(const PageReader&) = delete;
    PageReader& operator=(const PageReader&) = delete;

    /**
     * @brief Read the page at the current position.
     * @throws NotAContainerPageException if the next four bytes are not "OggS"
     * @throws UnexpectedEndOfDataException if the source ends first
     * @throws CorruptedPageException on a checksum mismatch
     */
    Page readPage();

    /**
     * @brief Read the next page, discarding any bytes in front of it.
     * @throws UnexpectedEndOfDataException if no capture pattern is found
     */
    Page readNextPage();

    /**
     * @brief Read one page plus the pages its last packet continues into.
     *
     * Only the first page is located by resynchronization when requested;
     * follow-up pages must come back to back.
     */
    std::vector<Page> readPages(bool searchForNextPage = false);

    /**
     * @brief Packets completed by the page group readPages() returns.
     */
    std::vector<Packet> readPackets(bool searchForNextPage = false);

    /**
     * @brief Move past one page without parsing its data.
     *
     * If the source is positioned on a capture pattern, the whole page is
     * skipped without checksum validation. Otherwise the source is advanced
     * up to the next capture pattern and left positioned on it, which needs
     * a source that can seek or take back four bytes.
     * @throws UnsupportedOperationException if it can do neither
     */
    void skipPage();

    /**
     * @brief Position the source on the capture pattern of the last page.
     * @return Offset of the page
     * @throws UnsupportedOperationException if the source cannot seek
     * @throws UnexpectedEndOfDataException if the source is shorter than a
     *         page header or holds no capture pattern
     */
    off_t locateLastPage();

    /**
     * @brief Read the last valid page of the source.
     *
     * Candidates that turn out not to be pages (a capture pattern inside
     * packet data, a truncated tail) are skipped in favour of earlier ones.
     */
    Page readLastPage();

    /**
     * @brief Granule position of the last page. The read position is
     *        restored afterwards.
     */
    uint64_t getLastGranulePosition();

    /**
     * @brief Rebuild the packets finishing inside a group of pages.
     *
     * A trailing packet that never finishes is dropped.
     */
    static std::vector<Packet> packetsFromPages(const std::vector<Page>& pages);

    /**
     * @brief True if at least one more byte can be read.
     */
    bool hasMoreData();

    uint64_t getSkippedBytes() const { return m_skipped_bytes; }
    uint64_t getPagesRead() const { return m_pages_read; }
    IO::IOHandler* getIOHandler() const { return m_handler; }

private:
    Page readPageAfterCapturePattern();
    bool putBack(const uint8_t* data, size_t size);
    off_t findCapturePatternBackward(off_t start);
    void seekTo(off_t position);

    IO::IOHandler* m_handler;
    uint64_t m_skipped_bytes;
    uint64_t m_pages_read;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PAGEREADER_H
