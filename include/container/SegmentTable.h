/*
 * SegmentTable.h - Bounded segment table of an Ogg page
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

#ifndef OGGFRAME_CONTAINER_SEGMENTTABLE_H
#define OGGFRAME_CONTAINER_SEGMENTTABLE_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief Bounded sequence of at most 255 segments, each at most 255 bytes.
 *
 * The lacing values of a page are the sizes of its segments, so the table
 * stores the segments themselves and derives the lacing values on demand.
 */
class SegmentTable {
public:
    static constexpr size_t CAPACITY = 255;

    using const_iterator = std::vector<Segment>::const_iterator;

    SegmentTable();

    /**
     * @brief Append a segment.
     * @return false if the table already holds CAPACITY segments
     * @throws InvalidSegmentException if the segment is longer than 255 bytes
     */
    bool push(Segment segment);

    size_t size() const { return m_segments.size(); }
    bool empty() const { return m_segments.empty(); }
    bool full() const { return m_segments.size() >= CAPACITY; }
    size_t remaining() const { return CAPACITY - m_segments.size(); }

    const Segment& operator[](size_t index) const { return m_segments[index]; }
    const Segment& back() const { return m_segments.back(); }

    const_iterator begin() const { return m_segments.begin(); }
    const_iterator end() const { return m_segments.end(); }

    /**
     * @brief Sum of all segment sizes.
     */
    size_t totalSize() const;

    std::vector<uint8_t> lacingValues() const;

    void clear();

private:
    std::vector<Segment> m_segments;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_SEGMENTTABLE_H
