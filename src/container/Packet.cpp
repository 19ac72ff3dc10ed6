/*
 * Packet.cpp - Ogg packet and segment lacing
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

Packet::Packet(std::vector<uint8_t> content) : m_content(std::move(content)) {
}

Packet::Packet(const uint8_t* data, size_t size) {
    if (data && size > 0) {
        m_content.assign(data, data + size);
    }
}

Packet Packet::fromSegments(const std::vector<Segment>& segments) {
    size_t total = 0;
    for (const auto& segment : segments) {
        total += segment.size();
    }

    std::vector<uint8_t> content;
    content.reserve(total);
    for (const auto& segment : segments) {
        content.insert(content.end(), segment.begin(), segment.end());
    }
    return Packet(std::move(content));
}

std::vector<Segment> Packet::getSegments() const {
    std::vector<Segment> segments;
    segments.reserve(getSegmentCount());

    size_t offset = 0;
    size_t remaining = m_content.size();
    while (remaining > MAX_SEGMENT_SIZE) {
        segments.emplace_back(m_content.begin() + offset, m_content.begin() + offset + MAX_SEGMENT_SIZE);
        offset += MAX_SEGMENT_SIZE;
        remaining -= MAX_SEGMENT_SIZE;
    }

    segments.emplace_back(m_content.begin() + offset, m_content.end());
    if (remaining == MAX_SEGMENT_SIZE) {
        segments.emplace_back();
    }
    return segments;
}

size_t Packet::getSegmentCount() const {
    return m_content.size() / MAX_SEGMENT_SIZE + 1;
}

bool Packet::headerMatches(const std::vector<uint8_t>& prefix) const {
    return headerMatches(prefix.data(), prefix.size());
}

bool Packet::headerMatches(const uint8_t* prefix, size_t length) const {
    if (length > m_content.size()) {
        return false;
    }
    if (length == 0) {
        return true;
    }
    return std::memcmp(m_content.data(), prefix, length) == 0;
}

Packet Packet::toPacket() const {
    return *this;
}

bool Packet::operator==(const Packet& other) const {
    return m_content == other.m_content;
}

bool Packet::operator!=(const Packet& other) const {
    return !(*this == other);
}

} // namespace Container
} // namespace OggFrame
