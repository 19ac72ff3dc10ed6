/*
 * Paginator.h - Packet to page layout
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

#ifndef OGGFRAME_CONTAINER_PAGINATOR_H
#define OGGFRAME_CONTAINER_PAGINATOR_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

/**
 * @brief Lays a list of packets out on consecutive pages.
 */
class Paginator {
public:
    /**
     * @brief Paginate packets into sealed pages.
     *
     * Pages are numbered from firstPageNumber, all carry the same serial
     * number and granule position, and each has its checksum set. A packet
     * that does not fit goes on in the next page, which is flagged as a
     * continuation when the previous page ended on a 255-byte segment.
     * An empty packet list yields one empty page.
     */
    static std::vector<Page> toPages(uint32_t serial, uint32_t firstPageNumber,
                                     const std::vector<Packet>& packets, uint64_t granule = 0);

    /**
     * @brief Assign serial, page number and granule, then compute the checksum.
     */
    static void seal(Page& page, uint32_t serial, uint32_t pageNumber, uint64_t granule);
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PAGINATOR_H
