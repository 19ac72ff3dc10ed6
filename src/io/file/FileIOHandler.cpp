/*
 * FileIOHandler.cpp - Local file I/O handler implementation
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
namespace File {

/**
 * @brief Constructs a FileIOHandler for a given local file path.
 *
 * This opens the specified file in binary read mode.
 *
 * @param path The file path to open
 * @throws IOErrorException if the file cannot be opened
 */
FileIOHandler::FileIOHandler(const TagLib::String& path) : m_file_path(path) {
    updateClosedState(false);
    updateEofState(false);
    updatePosition(0);
    updateErrorState(0);

    std::string normalized_path = normalizePath(path.to8Bit(true));
    Debug::log("io", "FileIOHandler::FileIOHandler() - Normalized path: ", normalized_path);

    if (!m_file_handle.open(normalized_path.c_str(), "rb")) {
        m_error = errno;
        std::string errorMsg = getErrorMessage(errno, "Could not open file: " + normalized_path);
        Debug::log("io", "FileIOHandler::FileIOHandler() - ", errorMsg);
        throw IOErrorException(errorMsg);
    }

    Debug::log("io", "FileIOHandler::FileIOHandler() - Successfully opened file: ", normalized_path);
}

/**
 * @brief Destroys the FileIOHandler object.
 *
 * This ensures the underlying file handle is closed properly.
 */
FileIOHandler::~FileIOHandler() {
    close();
}

size_t FileIOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_file_mutex);
    return read_unlocked(buffer, size, count);
}

size_t FileIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed.load() || !m_file_handle) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    size_t items = fread(buffer, size, count, m_file_handle.get());

    if (items < count) {
        if (ferror(m_file_handle.get())) {
            updateErrorState(errno != 0 ? errno : EIO,
                             getErrorMessage(errno, "Read failed on " + m_file_path.to8Bit(true)));
            clearerr(m_file_handle.get());
        } else {
            updateEofState(true);
        }
    }

    off_t position = ftello(m_file_handle.get());
    if (position >= 0) {
        updatePosition(position);
    }

    return items;
}

/**
 * @brief Seeks to a position in the file.
 *
 * Clears the end-of-file condition on success.
 *
 * @return 0 on success, -1 on failure
 */
int FileIOHandler::seek(off_t offset, int whence) {
    std::lock_guard<std::mutex> lock(m_file_mutex);
    return seek_unlocked(offset, whence);
}

int FileIOHandler::seek_unlocked(off_t offset, int whence) {
    updateErrorState(0);

    if (m_closed.load() || !m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    if (whence != SEEK_SET && whence != SEEK_CUR && whence != SEEK_END) {
        updateErrorState(EINVAL);
        return -1;
    }

    if (fseeko(m_file_handle.get(), offset, whence) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "Seek failed"));
        return -1;
    }

    off_t position = ftello(m_file_handle.get());
    if (position < 0 || !updatePosition(position)) {
        updateErrorState(EINVAL);
        return -1;
    }

    updateEofState(false);
    return 0;
}

off_t FileIOHandler::tell() {
    std::lock_guard<std::mutex> lock(m_file_mutex);
    return tell_unlocked();
}

off_t FileIOHandler::tell_unlocked() {
    if (m_closed.load() || !m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t position = ftello(m_file_handle.get());
    if (position < 0) {
        updateErrorState(errno);
    }
    return position;
}

int FileIOHandler::close() {
    std::lock_guard<std::mutex> lock(m_file_mutex);
    return close_unlocked();
}

int FileIOHandler::close_unlocked() {
    if (m_closed.load()) {
        return 0;
    }

    int result = m_file_handle.close();
    updateClosedState(true);
    updateEofState(true);

    if (result != 0) {
        updateErrorState(errno, getErrorMessage(errno, "Close failed"));
    }
    return result;
}

bool FileIOHandler::eof() {
    return m_closed.load() || m_eof.load();
}

/**
 * @brief Returns the size of the file in bytes.
 * @return Size in bytes, or -1 if it cannot be determined
 */
off_t FileIOHandler::getFileSize() {
    std::lock_guard<std::mutex> lock(m_file_mutex);

    if (m_closed.load() || !m_file_handle) {
        return -1;
    }

    struct stat st;
    if (fstat(fileno(m_file_handle.get()), &st) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fstat failed"));
        return -1;
    }
    return static_cast<off_t>(st.st_size);
}

bool FileIOHandler::canSeek() const {
    return true;
}

const TagLib::String& FileIOHandler::getPath() const {
    return m_file_path;
}

} // namespace File
} // namespace IO
} // namespace OggFrame
