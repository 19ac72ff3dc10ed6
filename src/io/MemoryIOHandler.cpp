/*
 * MemoryIOHandler.cpp - Memory-backed I/O handler implementation
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

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_own_buffer(copy), m_pos(0), m_discarded_bytes(0) {
    if (copy) {
        if (data && size > 0) {
            m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
        }
    } else {
        m_external_data = static_cast<const uint8_t*>(data);
        m_external_size = size;
    }
}

MemoryIOHandler::MemoryIOHandler(const std::vector<uint8_t>& data)
    : m_buffer(data), m_own_buffer(true), m_pos(0), m_discarded_bytes(0) {
}

MemoryIOHandler::MemoryIOHandler()
    : m_own_buffer(true), m_pos(0), m_discarded_bytes(0) {
}

MemoryIOHandler::~MemoryIOHandler() {
}

size_t MemoryIOHandler::availableSize() const {
    return m_own_buffer ? m_buffer.size() : m_external_size;
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    // We override read() completely to ensure exclusive access because we update m_pos
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    updateErrorState(0);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }

    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t available = 0;
    const uint8_t* source = nullptr;

    if (m_pos < availableSize()) {
        available = availableSize() - m_pos;
        source = (m_own_buffer ? m_buffer.data() : m_external_data) + m_pos;
    }

    // fread semantics: only whole elements are transferred
    size_t to_read = std::min(bytes_requested, available);
    to_read -= to_read % size;

    if (to_read > 0) {
        std::memcpy(buffer, source, to_read);
        m_pos += to_read;
        updatePosition(static_cast<off_t>(m_pos + m_discarded_bytes));
    }

    updateEofState(m_pos >= availableSize());

    return to_read / size;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    updateErrorState(0);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }

    // Virtual file size is accumulated discarded + current buffer size
    size_t logical_size = availableSize() + m_discarded_bytes;

    // Current logical position
    off_t logical_pos = static_cast<off_t>(m_pos + m_discarded_bytes);
    off_t new_logical_pos = logical_pos;

    switch (whence) {
        case SEEK_SET:
            new_logical_pos = offset;
            break;
        case SEEK_CUR:
            new_logical_pos = logical_pos + offset;
            break;
        case SEEK_END:
            new_logical_pos = static_cast<off_t>(logical_size) + offset;
            break;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (new_logical_pos < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    if (static_cast<size_t>(new_logical_pos) < m_discarded_bytes) {
        // Seeking before the current window is invalid for a discarded stream.
        updateErrorState(EINVAL, "Cannot seek to discarded data");
        return -1;
    }

    // It is valid to seek past end of buffer (read will return 0)
    m_pos = static_cast<size_t>(new_logical_pos) - m_discarded_bytes;

    updatePosition(new_logical_pos);
    updateEofState(m_pos >= availableSize());

    return 0;
}

off_t MemoryIOHandler::tell() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    // Return logical position
    return static_cast<off_t>(m_pos + m_discarded_bytes);
}

int MemoryIOHandler::close() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    m_closed.store(true);
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_external_data = nullptr;
    m_external_size = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_closed.load() || m_pos >= availableSize();
}

off_t MemoryIOHandler::getFileSize() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return static_cast<off_t>(availableSize() + m_discarded_bytes);
}

bool MemoryIOHandler::canSeek() const {
    return true;
}

size_t MemoryIOHandler::write(const void* data, size_t size) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (!m_own_buffer) {
        // Cannot write to external buffer reference
        return 0;
    }

    if (size == 0 || !data) return 0;

    const uint8_t* p = static_cast<const uint8_t*>(data);
    m_buffer.insert(m_buffer.end(), p, p + size);

    // If we were at EOF, we might not be anymore
    updateEofState(m_pos >= m_buffer.size());

    return size;
}

void MemoryIOHandler::discardRead() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (!m_own_buffer || m_buffer.empty() || m_pos == 0) return;

    // We want to discard m_pos bytes (the ones already read)
    size_t to_remove = std::min(m_pos, m_buffer.size());

    m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(to_remove));

    m_discarded_bytes += to_remove;
    m_pos -= to_remove;

    // Logical position remains the same (we are just shifting the window)
}

void MemoryIOHandler::clear() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    if (m_own_buffer) {
        m_buffer.clear();
    }
    m_pos = 0;
    m_discarded_bytes = 0;
    updatePosition(0);
    updateEofState(true);
}

} // namespace IO
} // namespace OggFrame
