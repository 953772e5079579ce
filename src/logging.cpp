// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>

BCLog::Logger& LogInstance()
{
/**
 * NOTE: the logger instance is leaked on exit. This is ugly, but will be
 * cleaned up by the OS/libc. Defining a logger as a global object doesn't work
 * since the order of destruction of static/global objects is undefined.
 * Consider if the logger gets destroyed, and then some later destructor calls
 * LogPrintf, maybe indirectly, and you get a core dump at shutdown trying to
 * access the logger. When the shutdown sequence is fully audited and tested,
 * explicit destruction of these objects can be implemented by changing this
 * from a raw pointer to a std::unique_ptr.
 *
 * This method of initialization was originally introduced in
 * ee3374234c60aba2cc4c5cd5cac1c0aefc2d817c.
 */
    static BCLog::Logger* g_logger{new BCLog::Logger()};
    return *g_logger;
}

namespace {

struct CLogCategoryDesc {
    BCLog::LogFlags flag;
    std::string_view category;
};

constexpr std::array<CLogCategoryDesc, 5> LogCategories{{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::DESCRIPTOR, "descriptor"},
    {BCLog::BIP32, "bip32"},
    {BCLog::KEYS, "keys"},
}};

std::string_view LogCategoryToStr(BCLog::LogFlags category)
{
    if (category == BCLog::ALL) return "";
    for (const auto& desc : LogCategories) {
        if (desc.flag == category && desc.flag != BCLog::NONE) return desc.category;
    }
    return "unknown";
}

std::string_view LogLevelToStr(BCLog::Level level)
{
    switch (level) {
    case BCLog::Level::Trace: return "trace";
    case BCLog::Level::Debug: return "debug";
    case BCLog::Level::Info: return "info";
    case BCLog::Level::Warning: return "warning";
    case BCLog::Level::Error: return "error";
    }
    return "";
}

} // namespace

bool GetLogCategory(BCLog::LogFlags& flag, std::string_view str)
{
    if (str.empty() || str == "1" || str == "all") {
        flag = BCLog::ALL;
        return true;
    }
    for (const auto& desc : LogCategories) {
        if (desc.category == str) {
            flag = desc.flag;
            return true;
        }
    }
    return false;
}

void BCLog::Logger::EnableCategory(BCLog::LogFlags flag)
{
    m_categories |= flag;
}

bool BCLog::Logger::EnableCategory(std::string_view str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void BCLog::Logger::DisableCategory(BCLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool BCLog::Logger::WillLogCategory(BCLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

bool BCLog::Logger::WillLogCategoryLevel(BCLog::LogFlags category, BCLog::Level level) const
{
    // Log messages at Info, Warning and Error level unconditionally, so that
    // important troubleshooting information doesn't get lost.
    if (level >= BCLog::Level::Info) return true;

    if (!WillLogCategory(category)) return false;

    return level >= m_category_log_level.load();
}

std::string BCLog::Logger::LogCategoriesString() const
{
    std::vector<std::string_view> names;
    for (const auto& desc : LogCategories) {
        if (desc.flag != BCLog::NONE) names.push_back(desc.category);
    }
    std::sort(names.begin(), names.end());
    return util::Join(names, ", ", [](std::string_view s) { return std::string{s}; });
}

std::string BCLog::Logger::LogTimestampStr(std::string_view str) const
{
    std::string strStamped;

    if (!m_log_timestamps)
        return std::string{str};

    const auto now = std::chrono::system_clock::now();
    const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    strStamped = buf;
    strStamped += ' ';
    strStamped += str;
    return strStamped;
}

void BCLog::Logger::LogPrintStr(std::string_view str, std::string_view logging_function, BCLog::LogFlags category, BCLog::Level level)
{
    std::lock_guard<std::mutex> lock(m_cs);

    std::string str_prefixed;
    if (category != BCLog::ALL || level != BCLog::Level::Info) {
        str_prefixed = "[";
        const auto category_str = LogCategoryToStr(category);
        str_prefixed += category_str;
        if (level != BCLog::Level::Info) {
            if (!category_str.empty()) str_prefixed += ':';
            str_prefixed += LogLevelToStr(level);
        }
        str_prefixed += "] ";
    }
    str_prefixed += str;
    if (str_prefixed.empty() || str_prefixed.back() != '\n') str_prefixed += '\n';
    str_prefixed = LogTimestampStr(str_prefixed);

    if (m_print_to_console) {
        // print to console
        fwrite(str_prefixed.data(), 1, str_prefixed.size(), stderr);
        fflush(stderr);
    }
    for (const auto& cb : m_print_callbacks) {
        cb(str_prefixed);
    }
}
