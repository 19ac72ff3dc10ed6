/*
 * Packet.h - Ogg packet and segment lacing
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

#ifndef OGGFRAME_CONTAINER_PACKET_H
#define OGGFRAME_CONTAINER_PACKET_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief One segment of a page: 0 to 255 bytes of packet data.
 */
using Segment = std::vector<uint8_t>;

/**
 * @brief An immutable, arbitrarily long unit of codec data.
 *
 * A packet is carried in a page as a run of segments. Every segment except
 * the last is 255 bytes long; the last one is shorter, and may be empty
 * when the content length is a multiple of 255.
 */
class Packet : public Packable {
public:
    static constexpr size_t MAX_SEGMENT_SIZE = 255;

    Packet() = default;
    explicit Packet(std::vector<uint8_t> content);
    Packet(const uint8_t* data, size_t size);

    /**
     * @brief Build a packet by concatenating segments in order.
     */
    static Packet fromSegments(const std::vector<Segment>& segments);

    size_t getSize() const { return m_content.size(); }
    const std::vector<uint8_t>& getContent() const { return m_content; }

    /**
     * @brief Split the content into lacing segments.
     *
     * 255-byte slices are taken while more than 255 bytes remain. A
     * remainder of exactly 255 bytes is followed by an empty terminating
     * segment, so a 510-byte packet yields {255, 255, 0} and an empty
     * packet yields a single empty segment.
     */
    std::vector<Segment> getSegments() const;

    /**
     * @brief Number of segments getSegments() produces.
     */
    size_t getSegmentCount() const;

    /**
     * @brief True if the content starts with the given bytes.
     */
    bool headerMatches(const std::vector<uint8_t>& prefix) const;
    bool headerMatches(const uint8_t* prefix, size_t length) const;

    Packet toPacket() const override;

    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const;

private:
    std::vector<uint8_t> m_content;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PACKET_H
