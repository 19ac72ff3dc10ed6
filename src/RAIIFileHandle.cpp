/*
 * RAIIFileHandle.cpp - RAII wrapper for FILE* handles
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

RAIIFileHandle::RAIIFileHandle() noexcept : m_file(nullptr), m_owns_handle(false) {
}

RAIIFileHandle::RAIIFileHandle(FILE* file, bool take_ownership) noexcept
    : m_file(file), m_owns_handle(take_ownership) {
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(other.m_file), m_owns_handle(other.m_owns_handle) {
    other.m_file = nullptr;
    other.m_owns_handle = false;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close(); // Close current handle if owned
        m_file = other.m_file;
        m_owns_handle = other.m_owns_handle;
        other.m_file = nullptr;
        other.m_owns_handle = false;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const char* filename, const char* mode) noexcept {
    close(); // Close any existing handle

    if (!filename || !mode) {
        Debug::log("io", "RAIIFileHandle::open() - Invalid parameters");
        return false;
    }

    m_file = fopen(filename, mode);
    m_owns_handle = (m_file != nullptr);

    if (!m_file) {
        Debug::log("io", "RAIIFileHandle::open() - Failed to open ", filename, ": ", strerror(errno));
    }

    return m_file != nullptr;
}

int RAIIFileHandle::close() noexcept {
    int result = 0;

    if (m_file && m_owns_handle) {
        result = fclose(m_file);
        if (result != 0) {
            Debug::log("io", "RAIIFileHandle::close() - Error closing file: ", strerror(errno));
        }
    }

    m_file = nullptr;
    m_owns_handle = false;
    return result;
}

FILE* RAIIFileHandle::get() const noexcept {
    return m_file;
}

bool RAIIFileHandle::is_valid() const noexcept {
    return m_file != nullptr;
}

bool RAIIFileHandle::owns_handle() const noexcept {
    return m_owns_handle;
}

RAIIFileHandle::operator bool() const noexcept {
    return is_valid();
}

} // namespace IO
} // namespace OggFrame
