/*
 * exceptions.h - Container and I/O exception classes.
 * This file is part of OggFrame.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Core {

/**
 * @brief Classification of hard failures raised by the library.
 *
 * "Page full" and "metadata could not be decoded" are not listed here:
 * they are reported through return values and Tag::Tags::isValid().
 */
enum class ErrorCode {
    NotAContainerPage,      ///< Capture pattern or version byte mismatch
    CorruptedPage,          ///< Stored checksum disagrees with the recomputed one
    UnexpectedEndOfData,    ///< Source exhausted in the middle of a structure
    InvalidSegment,         ///< Segment longer than 255 bytes
    InvalidPacket,          ///< Packet failed its own validity check
    InvalidContainerState,  ///< Serialization before required fields were set
    UnsupportedOperation,   ///< Capability not offered by a provider or source
    IOError                 ///< Underlying source or sink reported an error
};

/**
 * @brief Returns a short human readable name for an error code.
 */
const char *errorCodeName(ErrorCode code) noexcept;

// Base class for everything thrown by the container layer.
class OggFrameException : public std::exception
{
    public:
        OggFrameException(ErrorCode code, TagLib::String why);
        ~OggFrameException() noexcept override = default;
        const char *what() const noexcept override;
        ErrorCode code() const noexcept;
    protected:
    private:
        ErrorCode m_code;
        TagLib::String m_why;
};

// Capture pattern or version byte did not match.
class NotAContainerPageException : public OggFrameException
{
    public:
        NotAContainerPageException(TagLib::String why);
};

// Checksum mismatch.
class CorruptedPageException : public OggFrameException
{
    public:
        CorruptedPageException(TagLib::String why);
};

// Ran out of bytes while reading a page or while searching for one.
class UnexpectedEndOfDataException : public OggFrameException
{
    public:
        UnexpectedEndOfDataException(TagLib::String why);
};

class InvalidSegmentException : public OggFrameException
{
    public:
        InvalidSegmentException(TagLib::String why);
};

class InvalidPacketException : public OggFrameException
{
    public:
        InvalidPacketException(TagLib::String why);
};

// A page was serialized before granule, serial, page number or checksum were set.
class InvalidContainerStateException : public OggFrameException
{
    public:
        InvalidContainerStateException(TagLib::String why);
};

class UnsupportedOperationException : public OggFrameException
{
    public:
        UnsupportedOperationException(TagLib::String why);
};

// Read or write failure reported by an IOHandler or output stream.
class IOErrorException : public OggFrameException
{
    public:
        IOErrorException(TagLib::String why);
};

} // namespace Core
} // namespace OggFrame

using OggFrame::Core::ErrorCode;
using OggFrame::Core::OggFrameException;
using OggFrame::Core::NotAContainerPageException;
using OggFrame::Core::CorruptedPageException;
using OggFrame::Core::UnexpectedEndOfDataException;
using OggFrame::Core::InvalidSegmentException;
using OggFrame::Core::InvalidPacketException;
using OggFrame::Core::InvalidContainerStateException;
using OggFrame::Core::UnsupportedOperationException;
using OggFrame::Core::IOErrorException;

#endif // EXCEPTIONS_H
