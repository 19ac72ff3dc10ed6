/*
 * exceptions.cpp - Exception classes code
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

#include "oggframe.h"

namespace OggFrame {
namespace Core {

const char *errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::NotAContainerPage:
    return "NotAContainerPage";
  case ErrorCode::CorruptedPage:
    return "CorruptedPage";
  case ErrorCode::UnexpectedEndOfData:
    return "UnexpectedEndOfData";
  case ErrorCode::InvalidSegment:
    return "InvalidSegment";
  case ErrorCode::InvalidPacket:
    return "InvalidPacket";
  case ErrorCode::InvalidContainerState:
    return "InvalidContainerState";
  case ErrorCode::UnsupportedOperation:
    return "UnsupportedOperation";
  case ErrorCode::IOError:
    return "IOError";
  }
  return "Unknown";
}

/**
 * @brief Constructs an OggFrameException.
 *
 * Base of every exception thrown by the container layer. Callers that only
 * care about the category can catch this type and inspect code().
 * @param code The failure category.
 * @param why A string describing the reason for the failure.
 */
OggFrameException::OggFrameException(ErrorCode code, TagLib::String why)
    : std::exception(), m_code(code), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the failure.
 */
const char *OggFrameException::what() const noexcept {
  return m_why.toCString(true); // Return UTF-8 C-string representation
}

/**
 * @brief Returns the failure category.
 */
ErrorCode OggFrameException::code() const noexcept { return m_code; }

/**
 * @brief Constructs a NotAContainerPageException.
 *
 * Thrown when the bytes at the read position do not start with the "OggS"
 * capture pattern followed by stream structure version 0.
 * @param why A string describing the mismatch.
 */
NotAContainerPageException::NotAContainerPageException(TagLib::String why)
    : OggFrameException(ErrorCode::NotAContainerPage, why) {
  // ctor
}

/**
 * @brief Constructs a CorruptedPageException.
 *
 * Thrown when a page parsed correctly but its stored checksum does not match
 * the checksum computed over its bytes.
 * @param why A string describing the corruption.
 */
CorruptedPageException::CorruptedPageException(TagLib::String why)
    : OggFrameException(ErrorCode::CorruptedPage, why) {
  // ctor
}

/**
 * @brief Constructs an UnexpectedEndOfDataException.
 * @param why A string describing what was being read when data ran out.
 */
UnexpectedEndOfDataException::UnexpectedEndOfDataException(TagLib::String why)
    : OggFrameException(ErrorCode::UnexpectedEndOfData, why) {
  // ctor
}

InvalidSegmentException::InvalidSegmentException(TagLib::String why)
    : OggFrameException(ErrorCode::InvalidSegment, why) {
  // ctor
}

InvalidPacketException::InvalidPacketException(TagLib::String why)
    : OggFrameException(ErrorCode::InvalidPacket, why) {
  // ctor
}

/**
 * @brief Constructs an InvalidContainerStateException.
 *
 * Thrown when a page is serialized while one of its mandatory header fields
 * is still unset.
 * @param why A string naming the missing field.
 */
InvalidContainerStateException::InvalidContainerStateException(TagLib::String why)
    : OggFrameException(ErrorCode::InvalidContainerState, why) {
  // ctor
}

UnsupportedOperationException::UnsupportedOperationException(TagLib::String why)
    : OggFrameException(ErrorCode::UnsupportedOperation, why) {
  // ctor
}

/**
 * @brief Constructs an IOErrorException.
 *
 * This exception is used when the underlying byte source or sink reports a
 * failure, as opposed to simply running out of data.
 * @param why A string describing the I/O error.
 */
IOErrorException::IOErrorException(TagLib::String why)
    : OggFrameException(ErrorCode::IOError, why) {
  // ctor
}

} // namespace Core
} // namespace OggFrame
