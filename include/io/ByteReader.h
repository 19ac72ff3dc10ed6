/*
 * ByteReader.h - Exact-length reads over an IOHandler
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

#ifndef BYTEREADER_H
#define BYTEREADER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace IO {

/**
 * @brief Primitive reads with end-of-data detection
 *
 * IOHandler::read() may return short counts. These helpers loop until the
 * requested number of bytes arrived and turn a short read into an
 * exception: UnexpectedEndOfDataException when the source simply ran out,
 * IOErrorException when it reported an error.
 */
class ByteReader {
public:
    /**
     * @brief Read up to size bytes, stopping early only at end of data
     * @return Number of bytes read
     * @throws IOErrorException if the source reports an error
     */
    static size_t readUpTo(IOHandler* handler, uint8_t* buffer, size_t size);

    /**
     * @brief Read exactly size bytes
     * @param what Description of the structure being read, for the message
     */
    static void readFully(IOHandler* handler, uint8_t* buffer, size_t size, const char* what);

    static uint8_t readByte(IOHandler* handler, const char* what);

    static std::vector<uint8_t> readBytes(IOHandler* handler, size_t size, const char* what);

    /**
     * @brief Advance the source by size bytes
     *
     * Seeks on random-access sources, reads and discards otherwise.
     * @return Number of bytes actually skipped (less than size at end of data)
     */
    static size_t skip(IOHandler* handler, size_t size);
};

} // namespace IO
} // namespace OggFrame

#endif // BYTEREADER_H
