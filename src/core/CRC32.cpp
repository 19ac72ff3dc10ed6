/*
 * CRC32.cpp - Page checksum implementation
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
namespace Core {

namespace {

std::array<uint32_t, 256> buildTable() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t r = i << 24;
        for (int bit = 0; bit < 8; bit++) {
            if (r & 0x80000000u) {
                r = (r << 1) ^ CRC32::POLYNOMIAL;
            } else {
                r <<= 1;
            }
        }
        table[i] = r & 0xFFFFFFFFu;
    }
    return table;
}

} // anonymous namespace

const std::array<uint32_t, 256>& CRC32::table() {
    // Function-local static: initialized exactly once, thread-safe since C++11
    static const std::array<uint32_t, 256> s_table = buildTable();
    return s_table;
}

CRC32::CRC32() : m_crc(0) {
}

uint32_t CRC32::compute(const uint8_t* data, size_t length) {
    return extend(0, data, length);
}

uint32_t CRC32::compute(const std::vector<uint8_t>& data) {
    return extend(0, data.data(), data.size());
}

uint32_t CRC32::extend(uint32_t crc, const uint8_t* data, size_t length) {
    const auto& t = table();
    for (size_t i = 0; i < length; i++) {
        crc = (crc << 8) ^ t[((crc >> 24) & 0xFF) ^ data[i]];
    }
    return crc;
}

void CRC32::reset() {
    m_crc = 0;
}

void CRC32::update(uint8_t byte) {
    m_crc = (m_crc << 8) ^ table()[((m_crc >> 24) & 0xFF) ^ byte];
}

void CRC32::update(const uint8_t* data, size_t length) {
    m_crc = extend(m_crc, data, length);
}

uint32_t CRC32::getCRC() const {
    return m_crc;
}

} // namespace Core
} // namespace OggFrame
