/*
 * Paginator.cpp - Packet to page layout
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

void Paginator::seal(Page& page, uint32_t serial, uint32_t pageNumber, uint64_t granule) {
    page.setSerialNumber(serial);
    page.setPageNumber(pageNumber);
    page.setGranulePosition(granule);
    page.computeAndSetCrcChecksum();
}

std::vector<Page> Paginator::toPages(uint32_t serial, uint32_t firstPageNumber,
                                     const std::vector<Packet>& packets, uint64_t granule) {
    std::vector<Page> pages;
    Page current;

    for (const auto& packet : packets) {
        Page::Overplus overplus = current.addPacket(packet);
        while (!overplus.empty()) {
            bool continues = current.contentContinuesInNextPage();
            pages.push_back(std::move(current));
            current = Page();
            current.setContinuation(continues);
            overplus = current.addSegments(overplus);
        }
    }

    if (current.getSegmentCount() > 0 || pages.empty()) {
        pages.push_back(std::move(current));
    }

    for (size_t i = 0; i < pages.size(); i++) {
        seal(pages[i], serial, firstPageNumber + static_cast<uint32_t>(i), granule);
    }

    Debug::log("ogg", "Paginator::toPages() ", packets.size(), " packets on ", pages.size(),
               " pages for serial ", serial);
    return pages;
}

} // namespace Container
} // namespace OggFrame
