#include <chrono>
#include <iostream>
#include <optional>
#include <stdarg.h>
#include <string.h>
#include <strings.h>
#include <time.h>
#include "logger.h"
#include "loggerFile.h"
#include "loggerConsole.h"
#include "../stringUtils.h"

namespace
{
// in sync with the xpLogLevel enum
const char* const kLevelShortNames[xpLogLevelMax + 1] = { NULL, "ERR", "WRN", "nfo", "vrb", "dbg" };
const char* const kLevelNames[xpLogLevelMax + 1] = { "off", "error", "warn", "info", "verbose", "debug" };
}

namespace xmpres
{
Logger::Logger(unsigned aFlags, const char* timeFmt)
    : mTimeFmt(timeFmt), mFlags(aFlags)
{
    setup();
    setupFromEnvVar();
}

Logger::~Logger()
{
    LockGuard lock(mMutex);
    mUserLoggers.clear();
}

void Logger::logToConsole(bool enable)
{
    LockGuard lock(mMutex);
    if (!enable)
        mConsoleLogger.reset();
    else if (!mConsoleLogger)
        mConsoleLogger.reset(new ConsoleLogger());
}

void Logger::logToConsoleUseColors(bool useColors)
{
    LockGuard lock(mMutex);
    if (mConsoleLogger)
        mConsoleLogger->setUseColors(useColors);
}

void Logger::logToFile(const char* fileName, size_t rotateSizeKb)
{
    LockGuard lock(mMutex);
    mFileLogger.reset();
    if (fileName)
        mFileLogger.reset(new FileLogger(fileName, rotateSizeKb * 1024));
}

void Logger::configureLevels(const char* config)
{
    std::map<std::string, std::string> values;
    parseNameValues(config, " ,;:", '=', values);

    // validate everything first, so that a bad entry doesn't leave the
    // channels half-configured
    std::map<size_t, xpLogLevel> levels;
    std::optional<xpLogLevel> all;
    for (auto& item: values)
    {
        auto level = xpLogLevelStrToNum(item.second.c_str());
        if (level == (xpLogLevel)-1)
            throw std::runtime_error("Unknown log level '"+item.second+"' for '"+item.first+"'");
        if (item.first == "all")
        {
            all = level;
            continue;
        }
        size_t n = 0;
        while (n < xpLogChannelLast && item.first != logChannels[n].id)
            n++;
        if (n == xpLogChannelLast)
            throw std::runtime_error("Unknown log channel '"+item.first+"'");
        levels[n] = level;
    }

    LockGuard lock(mMutex);
    if (all)
    {
        for (size_t n = 0; n < xpLogChannelLast; n++)
            logChannels[n].logLevel = *all;
    }
    for (auto& item: levels)
        logChannels[item.first].logLevel = item.second;
}

void Logger::setupFromEnvVar()
{
    const char* config = getenv("XMPRES_LOG");
    if (!config)
        return;
    try
    {
        configureLevels(config);
    }
    catch (std::exception& e)
    {
        log("LOGGER", xpLogLevelError, 0, "Error in XMPRES_LOG env variable, ignoring it: %s\n", e.what());
        return;
    }
    if (mFlags & xpLogQuietConfig)
        return;
    std::string summary;
    for (size_t n = 0; n < xpLogChannelLast; n++)
    {
        if (n)
            summary.append(", ");
        summary.append(logChannels[n].id).append("=").append(xpLogLevelToStr(logChannels[n].logLevel));
    }
    log("LOGGER", xpLogLevelInfo, 0, "Log levels from XMPRES_LOG: %s\n", summary.c_str());
}

std::string Logger::header(const char* prefix, xpLogLevel level, unsigned flags) const
{
    std::string result;
    if ((flags & xpLogNoTimestamps) == 0)
    {
        auto now = std::chrono::system_clock::now();
        time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        struct tm tmbuf;
        gmtime_r(&secs, &tmbuf);
        char buf[64];
        size_t len = strftime(buf, sizeof(buf), mTimeFmt.c_str(), &tmbuf);
        snprintf(buf + len, sizeof(buf) - len, ".%03d", static_cast<int>(ms));
        result.append("[").append(buf).append("]");
    }
    bool showLevel = ((flags & xpLogNoLevel) == 0) || (level <= xpLogLevelWarn);
    if (showLevel && level <= xpLogLevelMax && kLevelShortNames[level])
        result.append("[").append(kLevelShortNames[level]).append("]");
    if (prefix)
        result.append("[").append(prefix).append("]");
    if (!result.empty())
        result.push_back(' ');
    return result;
}

void Logger::logv(const char* prefix, xpLogLevel level, unsigned flags, const char* fmtString,
    va_list aVaList)
{
    flags |= (mFlags & xpGlobalFlagMask);
    std::string msg = header(prefix, level, flags);
    size_t headerLen = msg.size();

    char buf[1024];
    va_list vaList;
    va_copy(vaList, aVaList);
    int len = vsnprintf(buf, sizeof(buf), fmtString, vaList);
    va_end(vaList);
    if (len < 0)
        return;
    if (static_cast<size_t>(len) < sizeof(buf))
    {
        msg.append(buf, static_cast<size_t>(len));
    }
    else
    {
        // didn't fit, format again directly into the message
        msg.resize(headerLen + static_cast<size_t>(len) + 1);
        va_copy(vaList, aVaList);
        vsnprintf(&msg[headerLen], static_cast<size_t>(len) + 1, fmtString, vaList);
        va_end(vaList);
        msg.resize(headerLen + static_cast<size_t>(len));
    }
    output(level, msg, flags);
}

void Logger::output(xpLogLevel level, const std::string& msg, unsigned flags)
{
    try
    {
        LockGuard lock(mMutex);
        if (mConsoleLogger && ((flags & xpLogNoConsole) == 0))
            mConsoleLogger->logString(level, msg.c_str(), flags);
        if (mFileLogger && ((flags & xpLogNoFile) == 0))
            mFileLogger->write(msg.data(), msg.size(), (flags & xpLogNoAutoFlush) == 0);
        for (auto& item: mUserLoggers)
        {
            auto& backend = *item.second;
            if (level <= backend.maxLogLevel)
                backend.log(level, msg.c_str(), msg.size(), flags);
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Failed to log message: " << e.what() << std::endl;
    }
}

void Logger::log(const char* prefix, xpLogLevel level, unsigned flags,
                const char* fmtString, ...)
{
    va_list vaList;
    va_start(vaList, fmtString);
    logv(prefix, level, flags, fmtString, vaList);
    va_end(vaList);
}

void Logger::addUserLogger(const char* tag, ILoggerBackend* logger)
{
    LockGuard lock(mMutex);
    mUserLoggers[tag].reset(logger);
}

Logger::ILoggerBackend* Logger::removeUserLogger(const char* tag)
{
    LockGuard lock(mMutex);
    auto it = mUserLoggers.find(tag);
    if (it == mUserLoggers.end())
        return nullptr;
    auto ret = it->second.release();
    mUserLoggers.erase(it);
    return ret;
}

Logger gLogger;
}

extern "C"
{
XmpresLogChannel* xpLoggerChannels = xmpres::gLogger.logChannels;

xpLogLevel xpLogLevelStrToNum(const char* str)
{
    for (xpLogLevel n = 0; n <= xpLogLevelMax; ++n)
    {
        if (strcasecmp(str, kLevelNames[n]) == 0
         || (kLevelShortNames[n] && strcasecmp(str, kLevelShortNames[n]) == 0))
            return n;
    }
    return (xpLogLevel)-1;
}

const char* xpLogLevelToStr(xpLogLevel level)
{
    return (level <= xpLogLevelMax) ? kLevelNames[level] : "(invalid)";
}

void xpLoggerLog(xpLogChannelNo channel, xpLogLevel level, const char* fmtString, ...)
{
    va_list vaList;
    va_start(vaList, fmtString);
    auto& chan = xmpres::gLogger.logChannels[channel];
    xmpres::gLogger.logv(chan.display, level, chan.flags, fmtString, vaList);
    va_end(vaList);
}
}
