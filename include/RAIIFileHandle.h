/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace IO {

/**
 * @brief RAII wrapper for FILE* handles with automatic cleanup
 *
 * Ensures the handle is closed on every exit path, including when a page
 * reader throws while the file is open.
 */
class RAIIFileHandle {
public:
    /**
     * @brief Default constructor - creates empty handle
     */
    RAIIFileHandle() noexcept;

    /**
     * @brief Constructor that takes ownership of a FILE* handle
     * @param file FILE* handle to manage (can be nullptr)
     * @param take_ownership Whether to take ownership and close on destruction
     */
    explicit RAIIFileHandle(FILE* file, bool take_ownership = true) noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    /**
     * @brief Destructor - automatically closes file if owned
     */
    ~RAIIFileHandle() noexcept;

    // Delete copy constructor and copy assignment to prevent accidental copying
    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file with RAII management
     * @param filename Path to the file to open
     * @param mode File open mode (e.g., "rb", "wb", etc.)
     * @return true if file was opened successfully, false otherwise
     */
    bool open(const char* filename, const char* mode) noexcept;

    /**
     * @brief Close the file handle if owned
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    /**
     * @brief Get the raw FILE* handle
     * @return FILE* handle (may be nullptr)
     */
    FILE* get() const noexcept;

    bool is_valid() const noexcept;
    bool owns_handle() const noexcept;

    explicit operator bool() const noexcept;

private:
    FILE* m_file;
    bool m_owns_handle;
};

} // namespace IO
} // namespace OggFrame

#endif // RAIIFILEHANDLE_H
