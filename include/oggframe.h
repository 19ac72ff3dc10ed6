/*
 * oggframe.h - main include for all other source files.
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

#ifndef __OGGFRAME_H__
#define __OGGFRAME_H__

#include <cstdint>
#include <ostream>

// defines
#define OGGFRAME_VERSION "1.0.0"
#define OGGFRAME_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

#include <algorithm>
#include <array>
#include <atomic>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>
#include <optional>
#include <chrono>
#include <limits>

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#ifndef _WIN32
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include <taglib/tstring.h>

#include "debug.h"
#include "exceptions.h"

// Core primitives
#include "core/CRC32.h"
#include "core/ByteOrder.h"
#include "core/utility/UTF8Util.h"

using OggFrame::Core::CRC32;

// I/O Handler subsystem
#include "RAIIFileHandle.h"
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/file/FileIOHandler.h"
#include "io/PushbackIOHandler.h"
#include "io/ByteReader.h"

// Using declarations for I/O classes for convenience
using OggFrame::IO::IOHandler;
using OggFrame::IO::MemoryIOHandler;
using OggFrame::IO::PushbackIOHandler;
using OggFrame::IO::File::FileIOHandler;

// Container framing
#include "container/Packable.h"
#include "container/Packet.h"
#include "container/SegmentTable.h"
#include "container/Page.h"
#include "container/PacketAssembler.h"
#include "container/PageReader.h"
#include "container/Paginator.h"
#include "container/PacketReader.h"
#include "container/StreamWriter.h"

// Comment metadata
#include "tag/TagKeys.h"
#include "tag/Tags.h"

// Payload provider boundary
#include "provider/FormatProvider.h"
#include "provider/StreamEncoder.h"

#endif // __OGGFRAME_H__
