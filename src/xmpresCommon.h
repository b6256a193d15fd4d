#ifndef XMPRESCOMMON_H
#define XMPRESCOMMON_H

#include <stdint.h>
#include <functional>
#include <string>
#include <stdexcept>
#include "base/logger.h"

/** @cond PRIVATE */

#define XP_LOG_DEBUG(fmtString,...) XMPRES_LOG_DEBUG(xpLogChannel_default, fmtString, ##__VA_ARGS__)
#define XP_LOG_INFO(fmtString,...) XMPRES_LOG_INFO(xpLogChannel_default, fmtString, ##__VA_ARGS__)
#define XP_LOG_WARNING(fmtString,...)  XMPRES_LOG_WARNING(xpLogChannel_default, fmtString, ##__VA_ARGS__)
#define XP_LOG_ERROR(fmtString,...) XMPRES_LOG_ERROR(xpLogChannel_default, fmtString, ##__VA_ARGS__)

#define XP_CHECK_EMPTYARG(name) \
    do { \
      if ((name).empty())\
        throw std::invalid_argument(std::string(__FUNCTION__)+": Argument '"+#name+"' is empty"); \
    } while(0)

/** Invokes a method of mListener, if there is one. Exceptions thrown by the
 * listener are logged on \c logChannel and never propagate into our state */
#define XP_CALL_LISTENER(logChannel, methodName,...)                                           \
    do {                                                                                        \
      if (!mListener)                                                                           \
          break;                                                                                \
      try {                                                                                     \
          mListener->methodName(__VA_ARGS__);                                                   \
      } catch(std::exception& e) {                                                              \
          XMPRES_LOG_WARNING(logChannel, "Exception thrown from Listener::" #methodName "():\n%s", e.what());\
      }                                                                                         \
    } while(0)

/** @endcond PRIVATE */

namespace xmpres
{
/** Milliseconds since the unix epoch */
typedef int64_t Timestamp;

/** Source of the current time. Injectable so that tests can drive the clock */
typedef std::function<Timestamp()> Clock;

/** @brief Current wall-clock time in milliseconds */
Timestamp timestampMs();

/** @brief Returns the bare part (user@domain) of a full or bare JID */
std::string jidToBare(const std::string& jid);

/** @brief Returns the resource part of a full JID, or an empty string if the
 * JID has no resource */
std::string jidToResource(const std::string& jid);
}
#endif
