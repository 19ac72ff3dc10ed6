/*
 * Tags.h - Comment metadata packet codec
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

#ifndef OGGFRAME_TAG_TAGS_H
#define OGGFRAME_TAG_TAGS_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Tag {

/**
 * @brief Per-format layout of a comment packet.
 */
struct TagsConfig {
    // Literal bytes in front of the comment block, e.g. "\x03vorbis" or "OpusTags"
    std::string packetHeader;

    // Whether a single 0x01 byte closes the packet
    bool includeFramingBit = false;

    // Written when no vendor was set
    std::string defaultVendor = "OggFrame - Ogg Container Library";
};

/**
 * @brief Comment metadata block carried in one packet.
 *
 * Packet layout, integers little-endian:
 *
 *   [packet header]
 *   u32 vendor length, vendor string
 *   u32 comment count
 *   count x (u32 length, "KEY=value")
 *   [0x01 framing byte]
 *
 * Keys are case-insensitive and stored in upper case. A key keeps its
 * values in the order they were added, and keys are encoded in the order
 * they first appeared.
 *
 * fromPacket() never throws on malformed input; it clears isValid()
 * instead, so a packet can be probed against several layouts.
 */
class Tags : public Container::Packable {
public:
    explicit Tags(TagsConfig config = TagsConfig());

    /**
     * @brief Replace the contents with those decoded from a packet.
     *
     * Values are stored as found, without splitting or trimming.
     */
    void fromPacket(const Container::Packet& packet);

    Container::Packet toPacket() const override;

    /**
     * @brief False if the last fromPacket() found a malformed block.
     */
    bool isValid() const override { return m_valid; }

    /**
     * @brief Add a value under a key.
     *
     * A value containing ';' is split there and each piece is added on its
     * own; empty pieces at the end are dropped. Stored values are trimmed.
     */
    void add(const std::string& key, const std::string& value);

    void addAll(const std::string& key, const std::vector<std::string>& values);

    void removeAll(const std::string& key);

    std::vector<std::string> getKeys() const;

    /**
     * @brief All values of a key, empty if the key is absent.
     */
    std::vector<std::string> getList(const std::string& key) const;

    /**
     * @brief All values of a key joined with "; ".
     */
    std::optional<std::string> getString(const std::string& key) const;

    /**
     * @brief Copy every key with its getString() value into a property map.
     */
    void writeIntoMap(std::map<std::string, std::string>& properties) const;

    /**
     * @brief The stored vendor, or the configured default if it is blank.
     */
    std::string getVendor() const;
    void setVendor(const std::string& vendor);

    const std::string& getPacketHeader() const { return m_config.packetHeader; }
    bool isIncludeFramingBit() const { return m_config.includeFramingBit; }
    const TagsConfig& getConfig() const { return m_config; }

    bool isEmpty() const { return m_keys.empty(); }

    static std::string normalizeKey(const std::string& key);

private:
    void clear();
    void addValue(const std::string& key, std::string value);
    bool decode(const std::vector<uint8_t>& content);

    TagsConfig m_config;
    std::string m_vendor;
    std::vector<std::string> m_keys;  // First-insertion order
    std::map<std::string, std::vector<std::string>> m_comments;
    bool m_valid;
};

} // namespace Tag
} // namespace OggFrame

#endif // OGGFRAME_TAG_TAGS_H
