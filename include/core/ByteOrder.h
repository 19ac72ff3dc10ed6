/*
 * ByteOrder.h - Fixed-width little-endian integer helpers
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

#ifndef OGGFRAME_CORE_BYTEORDER_H
#define OGGFRAME_CORE_BYTEORDER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Core {
namespace ByteOrder {

// Callers guarantee that enough bytes are available at data.

inline uint16_t readLE16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(data[1]) << 8);
}

inline uint32_t readLE32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

inline uint64_t readLE64(const uint8_t* data) {
    return static_cast<uint64_t>(readLE32(data)) |
           (static_cast<uint64_t>(readLE32(data + 4)) << 32);
}

inline void writeLE16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

inline void writeLE32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

inline void writeLE64(uint8_t* data, uint64_t value) {
    writeLE32(data, static_cast<uint32_t>(value & 0xFFFFFFFFu));
    writeLE32(data + 4, static_cast<uint32_t>(value >> 32));
}

inline void appendLE32(std::vector<uint8_t>& out, uint32_t value) {
    uint8_t bytes[4];
    writeLE32(bytes, value);
    out.insert(out.end(), bytes, bytes + 4);
}

inline void appendLE64(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t bytes[8];
    writeLE64(bytes, value);
    out.insert(out.end(), bytes, bytes + 8);
}

} // namespace ByteOrder
} // namespace Core
} // namespace OggFrame

#endif // OGGFRAME_CORE_BYTEORDER_H
