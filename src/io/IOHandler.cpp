/*
 * IOHandler.cpp - Base I/O handler interface implementation
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

IOHandler::IOHandler() {
}

IOHandler::~IOHandler() {
}

bool IOHandler::eof() {
    // True if at end of stream or closed
    return m_closed.load() || m_eof.load();
}

off_t IOHandler::getFileSize() {
    // Base implementation doesn't know the size
    return -1;
}

int IOHandler::getLastError() const {
    return m_error.load();
}

bool IOHandler::canSeek() const {
    return false;
}

size_t IOHandler::unread(const void* buffer, size_t size) {
    (void)buffer;
    (void)size;
    return 0;
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message = context.empty() ? std::string() : context + ": ";
    const char* error_str = strerror(error_code);
    return message + (error_str ? error_str : "Unknown error " + std::to_string(error_code));
}

std::string IOHandler::normalizePath(const std::string& path) {
    std::string normalized;
    normalized.reserve(path.size());
    for (char c : path) {
        char sep = (c == '\\') ? '/' : c;
        if (sep == '/' && !normalized.empty() && normalized.back() == '/') {
            continue;
        }
        normalized += sep;
    }
    return normalized;
}

bool IOHandler::updatePosition(off_t new_position) {
    if (new_position < 0) {
        Debug::log("io", "IOHandler::updatePosition() - Negative position rejected: ", new_position);
        return false;
    }

    m_position.store(new_position);
    return true;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error.store(error_code);

    if (!error_message.empty()) {
        DEBUG_LOG("io", "Error ", error_code, ": ", error_message);
    }
}

void IOHandler::updateEofState(bool eof_state) {
    m_eof.store(eof_state);
}

void IOHandler::updateClosedState(bool closed_state) {
    m_closed.store(closed_state);
    Debug::log("io", "IOHandler::updateClosedState() - Closed state updated to: ", closed_state);
}

} // namespace IO
} // namespace OggFrame
