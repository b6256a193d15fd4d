#ifndef XMPRES_LOGGERCONSOLE_H
#define XMPRES_LOGGERCONSOLE_H

#include "logger.h"
#include <unistd.h>

namespace xmpres
{
/** Writes errors and warnings to stderr, everything else to stdout.
 * Colors are only emitted when the stream is a terminal */
class ConsoleLogger
{
protected:
    bool mColorStdout;
    bool mColorStderr;
    static const char* colorEscape(unsigned flags)
    {
        static const char* escapes[xpLogColorMask+1] =
        {
            "\033[30m", "\033[31m", "\033[32m", "\033[33m", "\033[34m", "\033[35m", "\033[36m", "\033[37m",
            "\033[1;30m", "\033[1;31m", "\033[1;32m", "\033[1;33m", "\033[1;34m", "\033[1;35m", "\033[1;36m", "\033[1;37m"
        };
        return escapes[flags & xpLogColorMask];
    }
    static void writeTo(FILE* stream, bool color, const char* escape, const char* msg, unsigned flags)
    {
        if (color)
            fprintf(stream, "%s%s\033[0m", escape, msg);
        else
            fputs(msg, stream);
        if ((flags & xpLogNoAutoFlush) == 0)
            fflush(stream);
    }

public:
    ConsoleLogger(bool useColors = true)
    {
        setUseColors(useColors);
    }
    void setUseColors(bool useColors)
    {
        mColorStdout = useColors && isatty(1);
        mColorStderr = useColors && isatty(2);
    }
    void logString(unsigned level, const char* msg, unsigned flags)
    {
        if (level == xpLogLevelError)
            writeTo(stderr, mColorStderr, "\033[1;31m", msg, flags);
        else if (level == xpLogLevelWarn)
            writeTo(stderr, mColorStderr, "\033[1;33m", msg, flags);
        else
            writeTo(stdout, mColorStdout, colorEscape(flags), msg, flags);
    }
};
}
#endif // XMPRES_LOGGERCONSOLE_H
