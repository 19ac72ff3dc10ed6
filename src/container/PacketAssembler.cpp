/*
 * PacketAssembler.cpp - Packet reassembly across pages
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

PacketAssembler::PacketAssembler() : m_has_pending(false) {
}

void PacketAssembler::addSegment(const Segment& segment) {
    m_pending.insert(m_pending.end(), segment.begin(), segment.end());
    if (segment.size() < Packet::MAX_SEGMENT_SIZE) {
        m_completed.emplace_back(std::move(m_pending));
        m_pending.clear();
        m_has_pending = false;
    } else {
        m_has_pending = true;
    }
}

void PacketAssembler::addPage(const Page& page) {
    if (page.isContinuation() != m_has_pending) {
        Debug::log("ogg", "PacketAssembler::addPage() continuation flag is ", page.isContinuation(),
                   " but ", m_has_pending ? "a packet is" : "no packet is", " pending (page ",
                   page.getPageNumber().value_or(0), ")");
    }

    for (const auto& segment : page.getSegmentTable()) {
        addSegment(segment);
    }
}

std::vector<Packet> PacketAssembler::takePackets() {
    std::vector<Packet> packets;
    packets.swap(m_completed);
    return packets;
}

void PacketAssembler::reset() {
    m_completed.clear();
    discardPending();
}

void PacketAssembler::discardPending() {
    m_pending.clear();
    m_has_pending = false;
}

} // namespace Container
} // namespace OggFrame
