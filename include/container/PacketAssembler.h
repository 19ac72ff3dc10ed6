/*
 * PacketAssembler.h - Packet reassembly across pages
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

#ifndef OGGFRAME_CONTAINER_PACKETASSEMBLER_H
#define OGGFRAME_CONTAINER_PACKETASSEMBLER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief Rebuilds packets from a stream of segments.
 *
 * Segments are concatenated until one shorter than 255 bytes arrives, which
 * completes the packet. An unfinished packet is kept across addPage() calls
 * so packets spanning several pages come out whole.
 */
class PacketAssembler {
public:
    PacketAssembler();

    void addSegment(const Segment& segment);

    /**
     * @brief Feed every segment of a page.
     *
     * The page's continuation flag is compared with the assembler state and
     * a disagreement is logged; reassembly itself follows the lacing values.
     */
    void addPage(const Page& page);

    /**
     * @brief Remove and return the completed packets, oldest first.
     */
    std::vector<Packet> takePackets();

    size_t getCompletedCount() const { return m_completed.size(); }

    bool hasPendingData() const { return m_has_pending; }
    size_t getPendingSize() const { return m_pending.size(); }

    /**
     * @brief Drop completed packets and any unfinished one.
     */
    void reset();

    /**
     * @brief Drop only the unfinished packet.
     */
    void discardPending();

private:
    std::vector<uint8_t> m_pending;
    bool m_has_pending;
    std::vector<Packet> m_completed;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PACKETASSEMBLER_H
