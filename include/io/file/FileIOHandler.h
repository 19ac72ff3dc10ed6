/*
 * FileIOHandler.h - Local file I/O handler
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

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace IO {
namespace File {

/**
 * @brief Concrete IOHandler implementation for local file access
 *
 * Random-access source for container files on disk. Large files are
 * supported through off_t positioning.
 */
class FileIOHandler : public IOHandler {
public:
    /**
     * @brief Constructs a FileIOHandler for a given local file path
     * @param path The file path to open
     * @throws IOErrorException if the file cannot be opened
     */
    explicit FileIOHandler(const TagLib::String& path);

    /**
     * @brief Destroys the FileIOHandler and closes the file
     */
    ~FileIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;
    bool canSeek() const override;

    /**
     * @brief Path the handler was opened with
     */
    const TagLib::String& getPath() const;

private:
    size_t read_unlocked(void* buffer, size_t size, size_t count);
    int seek_unlocked(off_t offset, int whence);
    off_t tell_unlocked();
    int close_unlocked();

    RAIIFileHandle m_file_handle;   // RAII-managed file handle for I/O operations
    TagLib::String m_file_path;     // Original file path for error reporting

    // Thread safety for file operations
    mutable std::mutex m_file_mutex;
};

} // namespace File
} // namespace IO
} // namespace OggFrame

#endif // FILEIOHANDLER_H
