/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef OGGFRAME_IO_IOHANDLER_H
#define OGGFRAME_IO_IOHANDLER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace IO {

/**
 * @brief Base IOHandler interface for unified I/O operations
 *
 * Byte source consumed by the page reader. A source is either random-access
 * (canSeek() returns true; seek/tell/getFileSize work) or forward-only, in
 * which case it may still offer a small pushback buffer through unread().
 * All concrete implementations must provide virtual destructor for proper cleanup.
 */
class IOHandler {
public:
    IOHandler();
    virtual ~IOHandler();

    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of whole elements read; short at end of data
     */
    virtual size_t read(void* buffer, size_t size, size_t count) = 0;

    /**
     * @brief Seek to a position in the source
     * @param offset Offset to seek to (off_t for large file support)
     * @param whence SEEK_SET, SEEK_CUR, or SEEK_END positioning mode
     * @return 0 on success, -1 on failure
     */
    virtual int seek(off_t offset, int whence) = 0;

    /**
     * @brief Get current byte offset position
     * @return Current position, -1 on failure
     */
    virtual off_t tell() = 0;

    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close() = 0;

    /**
     * @brief Check if at end-of-stream condition
     */
    virtual bool eof();

    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown
     */
    virtual off_t getFileSize();

    /**
     * @brief Get the last error code
     * @return Error code (0 = no error)
     */
    virtual int getLastError() const;

    /**
     * @brief Whether seek() can reposition the source arbitrarily
     *
     * Sources are forward-only unless they say otherwise.
     */
    virtual bool canSeek() const;

    /**
     * @brief Push bytes back so that the next read() returns them first
     *
     * Bytes are pushed as a block: after unread("abcd", 4) the next reads
     * return 'a', 'b', 'c', 'd' and then continue with the original data.
     *
     * @param buffer Bytes to push back
     * @param size Number of bytes
     * @return Number of bytes accepted; 0 when pushback is not supported or
     *         the pushback capacity would be exceeded
     */
    virtual size_t unread(const void* buffer, size_t size);

protected:
    /**
     * @brief Convert error code to a message with optional context
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");

    /**
     * @brief Collapse duplicate separators and use '/' throughout
     */
    static std::string normalizePath(const std::string& path);

    // State shared by the concrete sources
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_eof{false};
    std::atomic<off_t> m_position{0};
    std::atomic<int> m_error{0};

    // Taken by sources that are not otherwise serialized
    mutable std::shared_mutex m_operation_mutex;

    /**
     * @brief Record the logical position
     * @return false (position unchanged) if new_position is negative
     */
    bool updatePosition(off_t new_position);

    /**
     * @brief Record the last error; a non-empty message is logged on "io"
     */
    void updateErrorState(int error_code, const std::string& error_message = "");

    void updateEofState(bool eof_state);
    void updateClosedState(bool closed_state);
};

} // namespace IO
} // namespace OggFrame

#endif // OGGFRAME_IO_IOHANDLER_H
