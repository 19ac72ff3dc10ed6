/*
 * ByteReader.cpp - Exact-length reads over an IOHandler
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
namespace IO {

size_t ByteReader::readUpTo(IOHandler* handler, uint8_t* buffer, size_t size) {
    if (!handler) {
        throw std::invalid_argument("ByteReader: IOHandler cannot be null");
    }

    size_t total = 0;
    while (total < size) {
        size_t got = handler->read(buffer + total, 1, size - total);
        if (got == 0) {
            int error = handler->getLastError();
            if (error != 0) {
                throw IOErrorException("Read failed: " + std::string(strerror(error)));
            }
            break;
        }
        total += got;
    }
    return total;
}

void ByteReader::readFully(IOHandler* handler, uint8_t* buffer, size_t size, const char* what) {
    size_t got = readUpTo(handler, buffer, size);
    if (got < size) {
        std::ostringstream oss;
        oss << "Unexpected end of data while reading " << what
            << " (needed " << size << " bytes, got " << got << ")";
        throw UnexpectedEndOfDataException(oss.str());
    }
}

uint8_t ByteReader::readByte(IOHandler* handler, const char* what) {
    uint8_t byte = 0;
    readFully(handler, &byte, 1, what);
    return byte;
}

std::vector<uint8_t> ByteReader::readBytes(IOHandler* handler, size_t size, const char* what) {
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        readFully(handler, bytes.data(), size, what);
    }
    return bytes;
}

size_t ByteReader::skip(IOHandler* handler, size_t size) {
    if (!handler) {
        throw std::invalid_argument("ByteReader: IOHandler cannot be null");
    }

    if (handler->canSeek()) {
        off_t position = handler->tell();
        off_t length = handler->getFileSize();
        if (position >= 0 && length >= 0) {
            off_t target = position + static_cast<off_t>(size);
            if (target > length) {
                target = length;
            }
            if (handler->seek(target, SEEK_SET) == 0) {
                return static_cast<size_t>(target - position);
            }
        }
    }

    uint8_t scratch[4096];
    size_t skipped = 0;
    while (skipped < size) {
        size_t chunk = std::min(sizeof(scratch), size - skipped);
        size_t got = readUpTo(handler, scratch, chunk);
        skipped += got;
        if (got < chunk) {
            break;
        }
    }
    return skipped;
}

} // namespace IO
} // namespace OggFrame
