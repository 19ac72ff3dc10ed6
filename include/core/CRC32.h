/*
 * CRC32.h - Page checksum (CRC-32, polynomial 0x04C11DB7, non-reflected)
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

#ifndef OGGFRAME_CORE_CRC32_H
#define OGGFRAME_CORE_CRC32_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Core {

/**
 * @brief Table-driven CRC-32 as used by Ogg pages.
 *
 * Polynomial 0x04C11DB7, MSB-first (left shifting), initial register 0 and
 * no final XOR. This is NOT the reflected zlib CRC-32 and the two must not
 * be substituted for each other.
 *
 * The lookup table is built once on first use and is read-only afterwards,
 * so concurrent use from several threads is safe.
 */
class CRC32 {
public:
    static constexpr uint32_t POLYNOMIAL = 0x04C11DB7;

    CRC32();
    ~CRC32() = default;

    // ========================================================================
    // One-shot CRC computation
    // ========================================================================

    /**
     * Compute the checksum of a data buffer.
     *
     * @param data Pointer to data buffer
     * @param length Number of bytes to process
     * @return 32-bit checksum
     */
    static uint32_t compute(const uint8_t* data, size_t length);

    static uint32_t compute(const std::vector<uint8_t>& data);

    /**
     * Continue a checksum over more data.
     *
     * @param crc Register value returned by a previous call (0 to start)
     * @param data Pointer to data buffer
     * @param length Number of bytes to process
     * @return Updated register value
     */
    static uint32_t extend(uint32_t crc, const uint8_t* data, size_t length);

    // ========================================================================
    // Incremental CRC computation (for streaming)
    // ========================================================================

    void reset();
    void update(uint8_t byte);
    void update(const uint8_t* data, size_t length);
    uint32_t getCRC() const;

private:
    static const std::array<uint32_t, 256>& table();

    uint32_t m_crc;
};

} // namespace Core
} // namespace OggFrame

#endif // OGGFRAME_CORE_CRC32_H
