#ifndef XMPRES_LOGGER_H_INCLUDED
#define XMPRES_LOGGER_H_INCLUDED
#include <stdlib.h> //abort()
#include <stdio.h>
#include <stdarg.h>

typedef unsigned short xpLogLevel;
enum
{
//0 disables a channel completely
    xpLogLevelError = 1,
    xpLogLevelWarn,
    xpLogLevelInfo,
    xpLogLevelVerbose,
    xpLogLevelDebug,
    xpLogLevelMax = xpLogLevelDebug
};

enum
{
    xpLogColorMask = 0x0F,
    xpLogNoAutoFlush = 1 << 4,
    xpLogNoTimestamps = 1 << 5,
    xpLogNoLevel = 1 << 6,  //severity is still shown for errors and warnings
    xpLogNoFile = 1 << 7,
    xpLogNoConsole = 1 << 8,
    xpLogQuietConfig = 1 << 9, //don't log the env variable overrides
    xpGlobalFlagMask = xpLogNoAutoFlush|xpLogNoLevel|xpLogNoTimestamps ///global flags that are added to every channel's flags
};
typedef unsigned char xpLogChannelNo;
typedef struct _XmpresLogChannel
{
    const char* id;
    const char* display;
    xpLogLevel logLevel;
    unsigned flags;
} XmpresLogChannel;

enum { xpLogChannelCount = 16 };

#ifdef __cplusplus

#include <string>
#include <memory>
#include <mutex>
#include <map>

namespace xmpres
{
class FileLogger;
class ConsoleLogger;

/** @brief Process-wide logger with per-channel levels.
 *
 * Channels are declared in loggerChannelConfig.h. Every message goes to the
 * console (if enabled), to the log file (if enabled) and to all registered
 * user backends whose max level admits it.
 */
class Logger
{
public:
    class ILoggerBackend
    {
    public:
        xpLogLevel maxLogLevel;
        virtual void log(xpLogLevel level, const char* msg, size_t len, unsigned flags) = 0;
        ILoggerBackend(xpLogLevel maxLevel=xpLogLevelMax): maxLogLevel(maxLevel) {}
        virtual ~ILoggerBackend() {}
    };
    typedef std::lock_guard<std::recursive_mutex> LockGuard;

protected:
    std::recursive_mutex mMutex;
    std::string mTimeFmt;
    unsigned mFlags;
    std::unique_ptr<FileLogger> mFileLogger;
    std::unique_ptr<ConsoleLogger> mConsoleLogger;
    std::map<std::string, std::unique_ptr<ILoggerBackend>> mUserLoggers;
    inline void setup();
    void setupFromEnvVar();
    std::string header(const char* prefix, xpLogLevel level, unsigned flags) const;
    void output(xpLogLevel level, const std::string& msg, unsigned flags);

public:
    XmpresLogChannel logChannels[xpLogChannelCount];

    Logger(unsigned flags=0, const char* timeFmt="%m-%d %H:%M:%S");
    ~Logger();
    unsigned flags() const { return mFlags; }
    void setFlags(unsigned flags)
    {
        LockGuard lock(mMutex);
        mFlags = flags;
    }
    void setTimestampFmt(const char* fmt)
    {
        LockGuard lock(mMutex);
        mTimeFmt = fmt;
    }
    void logToConsole(bool enable=true);
    void logToConsoleUseColors(bool useColors);
    /** @brief Appends to \c fileName, or disables file logging if it is NULL.
     * When the file exceeds \c rotateSizeKb, its older half is dropped.
     * @throws std::runtime_error if the file can't be opened
     */
    void logToFile(const char* fileName, size_t rotateSizeKb);

    /** @brief Applies level overrides in the form "all=warn,roster=debug".
     * "all" applies to every channel, and named channels override it
     * regardless of their order.
     * @throws std::runtime_error on unknown channels or level names. In that
     * case no level is changed
     */
    void configureLevels(const char* config);

    void logv(const char* prefix, xpLogLevel level, unsigned flags, const char* fmtString, va_list aVaList);
    void log(const char* prefix, xpLogLevel level, unsigned flags, const char* fmtString, ...);

    /** @brief Registers a user backend under \c tag, taking ownership of it.
     * An existing backend with the same tag is replaced and deleted.
     */
    void addUserLogger(const char* tag, ILoggerBackend* logger);

    /** @brief Unregisters the backend with the specified tag and gives
     * ownership back to the caller. Returns \c nullptr if there is none.
     */
    ILoggerBackend* removeUserLogger(const char* tag);
};

extern Logger gLogger;
}

#endif //C++


#define __XP_DEFINE_LOGCHANNELS_ENUM(...)                                           \
    enum { xpLogChannel_default = 0, ##__VA_ARGS__, xpLogChannelLast }
#ifdef __cplusplus

#define XP_LOGGER_CONFIG_START(...)                                                 \
    __XP_DEFINE_LOGCHANNELS_ENUM(__VA_ARGS__);                                      \
    static_assert(xpLogChannelLast <= xpLogChannelCount, "Too many log channels");  \
    inline void xmpres::Logger::setup() {                                           \
        unsigned configured = 0;

#define XP_LOGCHANNEL(id, display, level, flags)                                    \
        logChannels[xpLogChannel_##id] = {#id, display, xpLogLevel##level, flags};  \
        configured |= (1u << xpLogChannel_##id);

#define XP_LOGGER_CONFIG(...) __VA_ARGS__;

#define XP_LOGGER_CONFIG_END()                                                      \
        if (configured != ((1u << xpLogChannelLast) - 1)) {                         \
            fprintf(stderr, "xmpres::Logger: Some log channels are not configured in loggerChannelConfig.h\n"); \
            abort();                                                                \
        }                                                                           \
}
#else
#define XP_LOGGER_CONFIG_START(...)  __XP_DEFINE_LOGCHANNELS_ENUM(__VA_ARGS__);
#define XP_LOGCHANNEL(id, display, level, flags)
#define XP_LOGGER_CONFIG(...)
#define XP_LOGGER_CONFIG_END()
#endif


#include "loggerChannelConfig.h"

//The code below is plain C

#ifdef __cplusplus
extern "C" {
#endif
extern XmpresLogChannel* xpLoggerChannels;
void xpLoggerLog(xpLogChannelNo channel, xpLogLevel level, const char* fmtString, ...);
/** Accepts both the short ("wrn") and the long ("warn") level names, case
 * insensitive. Returns (xpLogLevel)-1 for unknown names */
xpLogLevel xpLogLevelStrToNum(const char* str);
/** The long name of a level, i.e. "verbose" */
const char* xpLogLevelToStr(xpLogLevel level);
#ifdef __cplusplus
}
#endif

#define XMPRES_LOG(channel, level, fmtString,...)   \
    ((level <= xpLoggerChannels[channel].logLevel) ?  \
       xpLoggerLog(channel, level, fmtString "\n", ##__VA_ARGS__): void(0))

#ifdef __cplusplus
#define XMPRES_LOG_DEBUG(channel, fmtString,...) XMPRES_LOG(channel, xpLogLevelDebug, fmtString, ##__VA_ARGS__)
#define XMPRES_LOG_VERBOSE(channel, fmtString,...) XMPRES_LOG(channel, xpLogLevelVerbose, fmtString, ##__VA_ARGS__)
#define XMPRES_LOG_INFO(channel, fmtString,...) XMPRES_LOG(channel, xpLogLevelInfo, fmtString, ##__VA_ARGS__)
#define XMPRES_LOG_WARNING(channel, fmtString,...) XMPRES_LOG(channel, xpLogLevelWarn, fmtString, ##__VA_ARGS__)
#define XMPRES_LOG_ERROR(channel, fmtString,...) XMPRES_LOG(channel, xpLogLevelError, fmtString, ##__VA_ARGS__)
#endif //C++
#endif
