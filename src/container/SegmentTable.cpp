/*
 * SegmentTable.cpp - Bounded segment table of an Ogg page
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

SegmentTable::SegmentTable() {
    m_segments.reserve(CAPACITY);
}

bool SegmentTable::push(Segment segment) {
    if (segment.size() > Packet::MAX_SEGMENT_SIZE) {
        throw InvalidSegmentException("Segment of " + std::to_string(segment.size()) +
                                      " bytes exceeds the 255 byte limit");
    }
    if (full()) {
        return false;
    }
    m_segments.push_back(std::move(segment));
    return true;
}

size_t SegmentTable::totalSize() const {
    size_t total = 0;
    for (const auto& segment : m_segments) {
        total += segment.size();
    }
    return total;
}

std::vector<uint8_t> SegmentTable::lacingValues() const {
    std::vector<uint8_t> values;
    values.reserve(m_segments.size());
    for (const auto& segment : m_segments) {
        values.push_back(static_cast<uint8_t>(segment.size()));
    }
    return values;
}

void SegmentTable::clear() {
    m_segments.clear();
}

} // namespace Container
} // namespace OggFrame
