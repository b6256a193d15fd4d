#include "xmpresCommon.h"
#include <chrono>

namespace xmpres
{
Timestamp timestampMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// The resource is everything after the first slash, and may itself contain slashes
std::string jidToBare(const std::string& jid)
{
    auto pos = jid.find('/');
    return (pos == std::string::npos) ? jid : jid.substr(0, pos);
}

std::string jidToResource(const std::string& jid)
{
    auto pos = jid.find('/');
    return (pos == std::string::npos) ? std::string() : jid.substr(pos+1);
}
}
