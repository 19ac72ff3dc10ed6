/*
 * PushbackIOHandler.cpp - Forward-only I/O handler with bounded pushback
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

PushbackIOHandler::PushbackIOHandler(std::unique_ptr<IOHandler> source, size_t capacity)
    : m_source(std::move(source)), m_capacity(capacity) {
    if (!m_source) {
        throw std::invalid_argument("PushbackIOHandler: source cannot be null");
    }
    m_pushback.reserve(m_capacity);
}

PushbackIOHandler::~PushbackIOHandler() {
}

size_t PushbackIOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);

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

    uint8_t* out = static_cast<uint8_t*>(buffer);
    size_t delivered = 0;

    while (delivered < bytes_requested && !m_pushback.empty()) {
        out[delivered++] = m_pushback.back();
        m_pushback.pop_back();
    }

    if (delivered < bytes_requested) {
        delivered += m_source->read(out + delivered, 1, bytes_requested - delivered);
        if (m_source->getLastError() != 0) {
            updateErrorState(m_source->getLastError());
        }
    }

    // Bytes belonging to an incomplete trailing element go back to the buffer
    size_t partial = delivered % size;
    for (size_t i = 0; i < partial; i++) {
        m_pushback.push_back(out[delivered - 1 - i]);
    }
    delivered -= partial;

    m_consumed += static_cast<off_t>(delivered);
    updatePosition(m_consumed);
    updateEofState(m_pushback.empty() && m_source->eof());

    return delivered / size;
}

int PushbackIOHandler::seek(off_t offset, int whence) {
    (void)offset;
    (void)whence;
    updateErrorState(ESPIPE);
    return -1;
}

off_t PushbackIOHandler::tell() {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);
    return m_consumed;
}

int PushbackIOHandler::close() {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);
    m_pushback.clear();
    updateClosedState(true);
    return m_source->close();
}

bool PushbackIOHandler::eof() {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);
    return m_closed.load() || (m_pushback.empty() && m_source->eof());
}

off_t PushbackIOHandler::getFileSize() {
    return -1;
}

int PushbackIOHandler::getLastError() const {
    return m_error.load();
}

bool PushbackIOHandler::canSeek() const {
    return false;
}

size_t PushbackIOHandler::unread(const void* buffer, size_t size) {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);

    if (m_closed.load() || !buffer || size == 0) {
        return 0;
    }

    if (m_pushback.size() + size > m_capacity) {
        Debug::log("io", "PushbackIOHandler::unread() - ", size, " bytes exceed pushback capacity ", m_capacity);
        return 0;
    }

    const uint8_t* in = static_cast<const uint8_t*>(buffer);
    for (size_t i = size; i > 0; i--) {
        m_pushback.push_back(in[i - 1]);
    }

    m_consumed -= static_cast<off_t>(size);
    updatePosition(m_consumed < 0 ? 0 : m_consumed);
    updateEofState(false);

    return size;
}

size_t PushbackIOHandler::getCapacity() const {
    return m_capacity;
}

size_t PushbackIOHandler::getPushbackSize() const {
    std::lock_guard<std::mutex> lock(m_pushback_mutex);
    return m_pushback.size();
}

} // namespace IO
} // namespace OggFrame
