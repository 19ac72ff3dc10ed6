/*
 * Page.cpp - Ogg page model and wire format
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

using Core::ByteOrder::readLE32;
using Core::ByteOrder::readLE64;

Page::Page()
    : m_continuation(false), m_beginning_of_stream(false), m_end_of_stream(false) {
}

uint8_t Page::getHeaderType() const {
    uint8_t type = 0;
    if (m_continuation) type |= FLAG_CONTINUATION;
    if (m_beginning_of_stream) type |= FLAG_BEGINNING_OF_STREAM;
    if (m_end_of_stream) type |= FLAG_END_OF_STREAM;
    return type;
}

void Page::setHeaderType(uint8_t type) {
    m_continuation = (type & FLAG_CONTINUATION) != 0;
    m_beginning_of_stream = (type & FLAG_BEGINNING_OF_STREAM) != 0;
    m_end_of_stream = (type & FLAG_END_OF_STREAM) != 0;
}

bool Page::addSegment(Segment segment) {
    return m_segments.push(std::move(segment));
}

Page::Overplus Page::addSegments(const std::vector<Segment>& segments) {
    Overplus overplus;
    for (size_t i = 0; i < segments.size(); i++) {
        if (!addSegment(segments[i])) {
            overplus.assign(segments.begin() + static_cast<std::ptrdiff_t>(i), segments.end());
            break;
        }
    }
    return overplus;
}

Page::Overplus Page::addPacket(const Packable& packable) {
    if (!packable.isValid()) {
        throw InvalidPacketException("Refusing to add an invalid packet to a page");
    }

    std::vector<Segment> segments = packable.toPacket().getSegments();
    size_t fit = std::min(segments.size(), m_segments.remaining());

    for (size_t i = 0; i < fit; i++) {
        m_segments.push(std::move(segments[i]));
    }

    Overplus overplus;
    if (fit < segments.size()) {
        overplus.reserve(segments.size() - fit);
        std::move(segments.begin() + static_cast<std::ptrdiff_t>(fit), segments.end(),
                  std::back_inserter(overplus));
    }
    return overplus;
}

Page::Overplus Page::addPackets(const std::vector<Packet>& packets) {
    Overplus overplus;
    for (const auto& packet : packets) {
        appendOverplus(overplus, addPacket(packet));
    }
    return overplus;
}

void Page::appendOverplus(Overplus& into, Overplus&& from) {
    std::move(from.begin(), from.end(), std::back_inserter(into));
}

bool Page::contentContinuesInNextPage() const {
    return !m_segments.empty() && m_segments.back().size() == Packet::MAX_SEGMENT_SIZE;
}

size_t Page::getPacketCount() const {
    size_t count = 0;
    for (const auto& segment : m_segments) {
        if (segment.size() < Packet::MAX_SEGMENT_SIZE) {
            count++;
        }
    }
    return count;
}

size_t Page::getSize() const {
    return HEADER_SIZE + m_segments.size() + m_segments.totalSize();
}

void Page::requireField(bool present, const char* name) const {
    if (!present) {
        throw InvalidContainerStateException(std::string("Cannot serialize page: ") + name + " is not set");
    }
}

std::vector<uint8_t> Page::getBytes(bool includeCrc) const {
    requireField(m_granule_position.has_value(), "granule position");
    requireField(m_serial_number.has_value(), "serial number");
    requireField(m_page_number.has_value(), "page number");
    if (includeCrc) {
        requireField(m_crc_checksum.has_value(), "CRC checksum");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(getSize());

    bytes.insert(bytes.end(), CAPTURE_PATTERN, CAPTURE_PATTERN + 4);
    bytes.push_back(VERSION);
    bytes.push_back(getHeaderType());
    Core::ByteOrder::appendLE64(bytes, *m_granule_position);
    Core::ByteOrder::appendLE32(bytes, *m_serial_number);
    Core::ByteOrder::appendLE32(bytes, *m_page_number);
    Core::ByteOrder::appendLE32(bytes, includeCrc ? *m_crc_checksum : 0);
    bytes.push_back(static_cast<uint8_t>(m_segments.size()));

    std::vector<uint8_t> lacing = m_segments.lacingValues();
    bytes.insert(bytes.end(), lacing.begin(), lacing.end());
    for (const auto& segment : m_segments) {
        bytes.insert(bytes.end(), segment.begin(), segment.end());
    }

    return bytes;
}

void Page::computeAndSetCrcChecksum() {
    m_crc_checksum = CRC32::compute(getBytes(false));
}

bool Page::isCrcChecksumValid() const {
    if (!m_crc_checksum) {
        return false;
    }
    return CRC32::compute(getBytes(false)) == *m_crc_checksum;
}

bool Page::isCapturePattern(const uint8_t* data) {
    return std::memcmp(data, CAPTURE_PATTERN, 4) == 0;
}

Page Page::fromBytes(const uint8_t* data, size_t size, size_t* consumed, bool validateCrc) {
    if (!data || size < HEADER_SIZE) {
        throw UnexpectedEndOfDataException("Unexpected end of data while reading page header (needed " +
                                           std::to_string(HEADER_SIZE) + " bytes, got " +
                                           std::to_string(data ? size : 0) + ")");
    }
    if (!isCapturePattern(data)) {
        throw NotAContainerPageException("Not an Ogg page: capture pattern not found");
    }
    if (data[4] != VERSION) {
        throw NotAContainerPageException("Unsupported Ogg page version " + std::to_string(data[4]));
    }

    size_t segment_count = data[26];
    size_t header_size = HEADER_SIZE + segment_count;
    if (size < header_size) {
        throw UnexpectedEndOfDataException("Unexpected end of data while reading segment table");
    }

    const uint8_t* lacing = data + HEADER_SIZE;
    size_t body_size = 0;
    for (size_t i = 0; i < segment_count; i++) {
        body_size += lacing[i];
    }
    size_t total_size = header_size + body_size;
    if (size < total_size) {
        throw UnexpectedEndOfDataException("Unexpected end of data while reading page body (needed " +
                                           std::to_string(body_size) + " bytes, got " +
                                           std::to_string(size - header_size) + ")");
    }

    Page page;
    page.setHeaderType(data[5]);
    page.setGranulePosition(readLE64(data + 6));
    page.setSerialNumber(readLE32(data + 14));
    page.setPageNumber(readLE32(data + 18));
    page.setCrcChecksum(readLE32(data + CRC_OFFSET));

    const uint8_t* body = data + header_size;
    for (size_t i = 0; i < segment_count; i++) {
        page.m_segments.push(Segment(body, body + lacing[i]));
        body += lacing[i];
    }

    if (validateCrc) {
        uint32_t stored = *page.m_crc_checksum;
        static const uint8_t zero_crc[4] = { 0, 0, 0, 0 };
        uint32_t computed = CRC32::extend(0, data, CRC_OFFSET);
        computed = CRC32::extend(computed, zero_crc, 4);
        computed = CRC32::extend(computed, data + CRC_OFFSET + 4, total_size - CRC_OFFSET - 4);
        if (computed != stored) {
            std::ostringstream oss;
            oss << "Page checksum mismatch (stored 0x" << std::hex << std::setw(8) << std::setfill('0') << stored
                << ", computed 0x" << std::setw(8) << computed << ")";
            throw CorruptedPageException(oss.str());
        }
    }

    if (consumed) {
        *consumed = total_size;
    }
    return page;
}

Page Page::fromBytes(const std::vector<uint8_t>& data, size_t* consumed, bool validateCrc) {
    return fromBytes(data.data(), data.size(), consumed, validateCrc);
}

} // namespace Container
} // namespace OggFrame
