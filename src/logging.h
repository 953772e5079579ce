// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_LOGGING_H
#define BIP380_LOGGING_H

#include <util/string.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

static const bool DEFAULT_LOGTIMESTAMPS = false;

namespace BCLog {
    using CategoryMask = uint64_t;
    enum LogFlags : CategoryMask {
        NONE        = CategoryMask{0},
        DESCRIPTOR  = (CategoryMask{1} <<  0),
        BIP32       = (CategoryMask{1} <<  1),
        KEYS        = (CategoryMask{1} <<  2),
        ALL         = ~NONE,
    };
    enum class Level {
        Trace = 0, // High-volume or detailed logging for development/debugging
        Debug,     // Reasonably noisy logging, but still usable in production
        Info,      // Default
        Warning,
        Error,
    };
    constexpr auto DEFAULT_LOG_LEVEL{Level::Debug};

    class Logger
    {
    public:
        using Callback = std::function<void(const std::string&)>;

    private:
        mutable std::mutex m_cs;

        std::list<Callback> m_print_callbacks;

        /** Log categories bitfield. */
        std::atomic<CategoryMask> m_categories{BCLog::NONE};

        /** Minimum log level for enabled categories. */
        std::atomic<Level> m_category_log_level{DEFAULT_LOG_LEVEL};

        std::string LogTimestampStr(std::string_view str) const;

    public:
        bool m_print_to_console = false;
        bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

        /** Send a string to the log output */
        void LogPrintStr(std::string_view str, std::string_view logging_function, LogFlags category, Level level);

        /** Connect a slot to the print signal and return the connection */
        std::list<Callback>::iterator PushBackCallback(Callback fun)
        {
            std::lock_guard<std::mutex> lock(m_cs);
            m_print_callbacks.push_back(std::move(fun));
            return --m_print_callbacks.end();
        }

        /** Delete a connection */
        void DeleteCallback(std::list<Callback>::iterator it)
        {
            std::lock_guard<std::mutex> lock(m_cs);
            m_print_callbacks.erase(it);
        }

        void SetLogLevel(Level level) { m_category_log_level = level; }
        Level LogLevel() const { return m_category_log_level.load(); }

        void EnableCategory(LogFlags flag);
        bool EnableCategory(std::string_view str);
        void DisableCategory(LogFlags flag);

        CategoryMask GetCategoryMask() const { return m_categories.load(); }

        bool WillLogCategory(LogFlags category) const;
        bool WillLogCategoryLevel(LogFlags category, Level level) const;

        /** Returns a string with the log categories in alphabetical order. */
        std::string LogCategoriesString() const;
    };

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category, at the specified level. */
static inline bool LogAcceptCategory(BCLog::LogFlags category, BCLog::Level level)
{
    return LogInstance().WillLogCategoryLevel(category, level);
}

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, std::string_view str);

template <typename... Args>
inline void LogPrintFormatInternal(std::string_view logging_function, const BCLog::LogFlags flag, const BCLog::Level level, const char* fmt, const Args&... args)
{
    if (LogInstance().m_print_to_console || LogAcceptCategory(flag, level)) {
        std::string log_msg;
        try {
            log_msg = strprintf(fmt, args...);
        } catch (tinyformat::format_error& fmterr) {
            log_msg = "Error \"" + std::string{fmterr.what()} + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg, logging_function, flag, level);
    }
}

#define LogPrintLevel_(category, level, ...) LogPrintFormatInternal(__func__, category, level, __VA_ARGS__)

// Log unconditionally.
#define LogInfo(...) LogPrintLevel_(BCLog::LogFlags::ALL, BCLog::Level::Info, __VA_ARGS__)
#define LogWarning(...) LogPrintLevel_(BCLog::LogFlags::ALL, BCLog::Level::Warning, __VA_ARGS__)
#define LogError(...) LogPrintLevel_(BCLog::LogFlags::ALL, BCLog::Level::Error, __VA_ARGS__)

// Deprecated unconditional logging.
#define LogPrintf(...) LogInfo(__VA_ARGS__)

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.

// Log conditionally, prefixing the output with the passed category name and severity level.
#define LogPrintLevel(category, level, ...)               \
    do {                                                  \
        if (LogAcceptCategory((category), (level))) {     \
            LogPrintLevel_(category, level, __VA_ARGS__); \
        }                                                 \
    } while (0)

// Log conditionally, prefixing the output with the passed category name.
#define LogDebug(category, ...) LogPrintLevel(category, BCLog::Level::Debug, __VA_ARGS__)
#define LogTrace(category, ...) LogPrintLevel(category, BCLog::Level::Trace, __VA_ARGS__)

#endif // BIP380_LOGGING_H
