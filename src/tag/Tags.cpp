/*
 * Tags.cpp - Comment metadata packet codec
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
namespace Tag {

using Core::ByteOrder::appendLE32;
using Core::ByteOrder::readLE32;
using Core::Utility::UTF8Util;

Tags::Tags(TagsConfig config) : m_config(std::move(config)), m_valid(true) {
}

std::string Tags::normalizeKey(const std::string& key) {
    std::string normalized;
    normalized.reserve(key.size());

    for (char c : key) {
        normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    return normalized;
}

void Tags::clear() {
    m_vendor.clear();
    m_keys.clear();
    m_comments.clear();
    m_valid = true;
}

void Tags::addValue(const std::string& key, std::string value) {
    auto it = m_comments.find(key);
    if (it == m_comments.end()) {
        m_keys.push_back(key);
        it = m_comments.emplace(key, std::vector<std::string>()).first;
    }
    it->second.push_back(std::move(value));
}

void Tags::add(const std::string& key, const std::string& value) {
    if (value.find(';') != std::string::npos) {
        std::vector<std::string> pieces;
        size_t start = 0;
        while (true) {
            size_t end = value.find(';', start);
            if (end == std::string::npos) {
                pieces.push_back(value.substr(start));
                break;
            }
            pieces.push_back(value.substr(start, end - start));
            start = end + 1;
        }
        while (!pieces.empty() && pieces.back().empty()) {
            pieces.pop_back();
        }
        addAll(key, pieces);
        return;
    }

    addValue(normalizeKey(key), UTF8Util::trim(value));
}

void Tags::addAll(const std::string& key, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        add(key, value);
    }
}

void Tags::removeAll(const std::string& key) {
    std::string normalized = normalizeKey(key);
    if (m_comments.erase(normalized) > 0) {
        m_keys.erase(std::remove(m_keys.begin(), m_keys.end(), normalized), m_keys.end());
    }
}

std::vector<std::string> Tags::getKeys() const {
    return m_keys;
}

std::vector<std::string> Tags::getList(const std::string& key) const {
    auto it = m_comments.find(normalizeKey(key));
    if (it == m_comments.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> Tags::getString(const std::string& key) const {
    auto it = m_comments.find(normalizeKey(key));
    if (it == m_comments.end()) {
        return std::nullopt;
    }

    std::string joined;
    for (size_t i = 0; i < it->second.size(); i++) {
        if (i > 0) {
            joined += "; ";
        }
        joined += it->second[i];
    }
    return joined;
}

void Tags::writeIntoMap(std::map<std::string, std::string>& properties) const {
    for (const auto& key : m_keys) {
        auto value = getString(key);
        if (value) {
            properties[key] = *value;
        }
    }
}

std::string Tags::getVendor() const {
    return UTF8Util::trim(m_vendor).empty() ? m_config.defaultVendor : m_vendor;
}

void Tags::setVendor(const std::string& vendor) {
    m_vendor = vendor;
}

void Tags::fromPacket(const Container::Packet& packet) {
    clear();
    m_valid = decode(packet.getContent());
    Debug::log("tag", "Tags::fromPacket() vendor='", m_vendor, "', ", m_keys.size(), " keys, ",
               m_valid ? "valid" : "invalid");
}

bool Tags::decode(const std::vector<uint8_t>& content) {
    const std::string& header = m_config.packetHeader;
    size_t size = content.size();
    size_t offset = 0;

    if (!header.empty()) {
        if (size < header.size() || std::memcmp(content.data(), header.data(), header.size()) != 0) {
            Debug::log("tag", "Tags: packet header mismatch");
            return false;
        }
        offset = header.size();
    }

    if (size - offset < 4) {
        Debug::log("tag", "Tags: Insufficient data for vendor length");
        return false;
    }
    uint32_t vendor_len = readLE32(content.data() + offset);
    offset += 4;

    if (vendor_len > size - offset) {
        Debug::log("tag", "Tags: Vendor string length ", vendor_len,
                   " exceeds remaining data ", (size - offset));
        return false;
    }
    m_vendor = UTF8Util::decode(content.data() + offset, vendor_len);
    offset += vendor_len;

    if (size - offset < 4) {
        Debug::log("tag", "Tags: Insufficient data for comment count");
        return false;
    }
    uint32_t count = readLE32(content.data() + offset);
    offset += 4;

    for (uint32_t i = 0; i < count; i++) {
        if (size - offset < 4) {
            Debug::log("tag", "Tags: Insufficient data for comment ", i, " length");
            return false;
        }
        uint32_t entry_len = readLE32(content.data() + offset);
        offset += 4;

        if (entry_len > size - offset) {
            Debug::log("tag", "Tags: Comment ", i, " length ", entry_len,
                       " exceeds remaining data ", (size - offset));
            return false;
        }
        std::string entry = UTF8Util::decode(content.data() + offset, entry_len);
        offset += entry_len;

        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            Debug::log("tag", "Tags: Comment ", i, " missing '=' separator");
            return false;
        }
        addValue(normalizeKey(entry.substr(0, eq_pos)), entry.substr(eq_pos + 1));
    }

    if (m_config.includeFramingBit) {
        if (size - offset != 1 || content[offset] != 0x01) {
            Debug::log("tag", "Tags: framing bit missing or followed by data");
            return false;
        }
    } else if (offset != size) {
        Debug::log("tag", "Tags: ", (size - offset), " trailing bytes after comments");
        return false;
    }

    return true;
}

Container::Packet Tags::toPacket() const {
    std::vector<uint8_t> content(m_config.packetHeader.begin(), m_config.packetHeader.end());

    auto appendField = [&content](const std::string& field) {
        appendLE32(content, static_cast<uint32_t>(field.size()));
        content.insert(content.end(), field.begin(), field.end());
    };

    appendField(getVendor());

    size_t count = 0;
    for (const auto& key : m_keys) {
        count += m_comments.at(key).size();
    }
    appendLE32(content, static_cast<uint32_t>(count));

    for (const auto& key : m_keys) {
        for (const auto& value : m_comments.at(key)) {
            appendField(key + "=" + value);
        }
    }

    if (m_config.includeFramingBit) {
        content.push_back(0x01);
    }

    return Container::Packet(std::move(content));
}

} // namespace Tag
} // namespace OggFrame
