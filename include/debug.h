/*
 * debug.h - Debug output system header
 * This file is part of OggFrame.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OggFrame is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {

/**
 * @brief Channel-based debug logger
 *
 * Channels are enabled by name through init(); the special channel "all"
 * enables every channel. Messages go to the log file when one was opened,
 * stdout otherwise. Channels used by the library: "ogg", "tag", "io",
 * "provider".
 */
class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    // Check if a debug channel is enabled (O(1) lookup)
    static bool isChannelEnabled(const std::string& channel);

    // Basic logging without location info
    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, "", 0, ss.str());
        }
    }

    // Logging with function and line number
    template<typename... Args>
    static inline void log(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, function, line, ss.str());
        }
    }

private:
    static void write(const std::string& channel, const std::string& function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_log_to_file;
};

} // namespace OggFrame

// Convenience macro for logging with location info
#define DEBUG_LOG(channel, ...) ::OggFrame::Debug::log(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

// Lazy evaluation macro - checks if channel is enabled before evaluating arguments
#define DEBUG_LOG_LAZY(channel, ...) \
    do { \
        if (::OggFrame::Debug::isChannelEnabled(channel)) { \
            ::OggFrame::Debug::log(channel, __VA_ARGS__); \
        } \
    } while(0)

#endif // DEBUG_H
