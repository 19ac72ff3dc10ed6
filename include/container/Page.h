/*
 * Page.h - Ogg page model and wire format
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

#ifndef OGGFRAME_CONTAINER_PAGE_H
#define OGGFRAME_CONTAINER_PAGE_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief One physical Ogg page (RFC 3533 section 6).
 *
 * Wire layout, all integers little-endian:
 *
 *   0  "OggS"          4  version (0)       5  header type
 *   6  granule (8)     14 serial (4)        18 page number (4)
 *   22 CRC (4)         26 segment count N   27 N lacing values, then data
 *
 * Granule position, serial number and page number start out unset and
 * must be assigned before the page can be serialized.
 */
class Page {
public:
    static constexpr size_t HEADER_SIZE = 27;
    static constexpr size_t CRC_OFFSET = 22;
    static constexpr size_t MAX_SIZE = HEADER_SIZE + SegmentTable::CAPACITY * (1 + Packet::MAX_SEGMENT_SIZE);
    static constexpr uint8_t VERSION = 0;

    static constexpr uint8_t FLAG_CONTINUATION = 0x01;
    static constexpr uint8_t FLAG_BEGINNING_OF_STREAM = 0x02;
    static constexpr uint8_t FLAG_END_OF_STREAM = 0x04;

    static constexpr uint8_t CAPTURE_PATTERN[4] = { 'O', 'g', 'g', 'S' };

    // All ones: no packet finishes on the page
    static constexpr uint64_t NO_GRANULE_POSITION = 0xFFFFFFFFFFFFFFFFULL;

    // Segments that did not fit, in their original order
    using Overplus = std::vector<Segment>;

    Page();

    // Header type flags
    bool isContinuation() const { return m_continuation; }
    void setContinuation(bool continuation) { m_continuation = continuation; }
    bool isBeginningOfStream() const { return m_beginning_of_stream; }
    void setBeginningOfStream(bool bos) { m_beginning_of_stream = bos; }
    bool isEndOfStream() const { return m_end_of_stream; }
    void setEndOfStream(bool eos) { m_end_of_stream = eos; }

    uint8_t getHeaderType() const;

    /**
     * @brief Set all three flags from a header type byte.
     *
     * Bits above bit 2 carry no meaning and are dropped.
     */
    void setHeaderType(uint8_t type);

    std::optional<uint64_t> getGranulePosition() const { return m_granule_position; }
    void setGranulePosition(uint64_t granule) { m_granule_position = granule; }

    std::optional<uint32_t> getSerialNumber() const { return m_serial_number; }
    void setSerialNumber(uint32_t serial) { m_serial_number = serial; }

    std::optional<uint32_t> getPageNumber() const { return m_page_number; }
    void setPageNumber(uint32_t number) { m_page_number = number; }

    std::optional<uint32_t> getCrcChecksum() const { return m_crc_checksum; }
    void setCrcChecksum(uint32_t crc) { m_crc_checksum = crc; }

    // ========================================================================
    // Content
    // ========================================================================

    /**
     * @brief Append one segment.
     * @return false if the page already holds 255 segments (page unchanged)
     * @throws InvalidSegmentException for segments longer than 255 bytes
     */
    bool addSegment(Segment segment);

    /**
     * @brief Append segments in order until the page is full.
     * @return The segments that did not fit
     */
    Overplus addSegments(const std::vector<Segment>& segments);

    /**
     * @brief Append as much of a packet as fits.
     *
     * The split point is computed before the page is touched. The returned
     * overplus starts at the first rejected segment; it is empty when the
     * whole packet fit.
     * @throws InvalidPacketException if packable.isValid() is false
     */
    Overplus addPacket(const Packable& packable);

    /**
     * @brief addPacket() for each argument, overplus concatenated in order.
     */
    template <typename... Packables>
    Overplus addPackets(const Packables&... packables) {
        Overplus overplus;
        (appendOverplus(overplus, addPacket(packables)), ...);
        return overplus;
    }

    Overplus addPackets(const std::vector<Packet>& packets);

    /**
     * @brief True if the last segment is 255 bytes long, meaning the last
     * packet goes on in the next page.
     */
    bool contentContinuesInNextPage() const;

    size_t getTotalSegmentSize() const { return m_segments.totalSize(); }
    size_t getSegmentCount() const { return m_segments.size(); }

    /**
     * @brief Number of packets that finish on this page.
     */
    size_t getPacketCount() const;

    /**
     * @brief Size of the serialized page in bytes.
     */
    size_t getSize() const;

    const SegmentTable& getSegmentTable() const { return m_segments; }

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Serialize the page.
     * @param includeCrc Write the stored checksum; when false the checksum
     *        field is written as zero and need not be set
     * @throws InvalidContainerStateException if a required field is unset
     */
    std::vector<uint8_t> getBytes(bool includeCrc = true) const;

    void computeAndSetCrcChecksum();

    /**
     * @brief Compare the stored checksum with the one computed from content.
     * @return false if no checksum is stored or the two differ
     */
    bool isCrcChecksumValid() const;

    /**
     * @brief Parse one page from the start of a buffer.
     *
     * @param consumed Receives the serialized size of the parsed page
     * @param validateCrc Reject pages whose checksum does not match
     * @throws UnexpectedEndOfDataException if the buffer ends inside the page
     * @throws NotAContainerPageException on a bad capture pattern or version
     * @throws CorruptedPageException on a checksum mismatch
     */
    static Page fromBytes(const uint8_t* data, size_t size, size_t* consumed = nullptr, bool validateCrc = true);
    static Page fromBytes(const std::vector<uint8_t>& data, size_t* consumed = nullptr, bool validateCrc = true);

    static bool isCapturePattern(const uint8_t* data);

private:
    static void appendOverplus(Overplus& into, Overplus&& from);
    void requireField(bool present, const char* name) const;

    bool m_continuation;
    bool m_beginning_of_stream;
    bool m_end_of_stream;
    std::optional<uint64_t> m_granule_position;
    std::optional<uint32_t> m_serial_number;
    std::optional<uint32_t> m_page_number;
    std::optional<uint32_t> m_crc_checksum;
    SegmentTable m_segments;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PAGE_H
