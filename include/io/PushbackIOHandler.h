/*
 * PushbackIOHandler.h - Forward-only I/O handler with bounded pushback
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

#ifndef PUSHBACKIOHANDLER_H
#define PUSHBACKIOHANDLER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace IO {

/**
 * @brief Forward-only view of another IOHandler with a small pushback buffer
 *
 * Models pipes, sockets and other sources that cannot seek. The wrapped
 * source is only ever read forward, even if it could seek. unread() accepts
 * up to getCapacity() bytes, enough to put back one capture-pattern window.
 */
class PushbackIOHandler : public IOHandler {
public:
    static constexpr size_t DEFAULT_CAPACITY = 5;

    /**
     * @param source Source to take ownership of (must not be null)
     * @param capacity Maximum number of bytes held for pushback
     * @throws std::invalid_argument if source is null
     */
    explicit PushbackIOHandler(std::unique_ptr<IOHandler> source, size_t capacity = DEFAULT_CAPACITY);
    ~PushbackIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;

    /**
     * @brief Always fails with ESPIPE
     */
    int seek(off_t offset, int whence) override;

    /**
     * @brief Number of bytes consumed so far, net of pushed-back bytes
     */
    off_t tell() override;

    int close() override;
    bool eof() override;
    off_t getFileSize() override;
    int getLastError() const override;
    bool canSeek() const override;
    size_t unread(const void* buffer, size_t size) override;

    size_t getCapacity() const;
    size_t getPushbackSize() const;

private:
    std::unique_ptr<IOHandler> m_source;
    std::vector<uint8_t> m_pushback;  // Next byte to read is at the back
    size_t m_capacity;
    off_t m_consumed = 0;
    mutable std::mutex m_pushback_mutex;
};

} // namespace IO
} // namespace OggFrame

#endif // PUSHBACKIOHANDLER_H
