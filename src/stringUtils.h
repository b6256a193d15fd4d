#ifndef XMPRES_STRINGUTILS_H
#define XMPRES_STRINGUTILS_H

#include <stdexcept>
#include <string.h>
#include <string>
#include <vector>

namespace xmpres
{
template<class Cont>
static inline void tokenize(const char* src, const char* delims, Cont& cont)
{
    const char* start = src;
    for (;;)
    {
        while (*start && strchr(delims, *start)) //skip leading delims
            start++;
        if (!*start)
            return;
        const char* pos = start+1;
        while (*pos && !strchr(delims, *pos))
            pos++;
        cont.emplace_back(start, pos-start);
        if (!*pos)
            return;
        start = pos+1;
    }
}

static inline std::string trim(const std::string& str, const char* trimChars=" \t")
{
    size_t start = str.find_first_not_of(trimChars);
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(trimChars);
    return str.substr(start, end-start+1);
}

/** Parses "name1=val1,name2=val2" style strings into a map-like container.
 * Names and values are trimmed. Throws if a pair has no delimiter or no name */
template <class Cont>
inline static void parseNameValues(const char* str, const char* pairDelims, char nvDelim,
                                   Cont& cont)
{
    std::vector<std::string> pairs;
    tokenize(str, pairDelims, pairs);
    for (auto& pair: pairs)
    {
        if (trim(pair).empty())
            continue;
        size_t eq = pair.find(nvDelim);
        if (eq == std::string::npos)
            throw std::runtime_error("parseNameValues: No name-value delimiter in '"+pair+"'");
        auto name = trim(pair.substr(0, eq));
        if (name.empty())
            throw std::runtime_error("parseNameValues: No value name in '"+pair+"'");
        cont.emplace(typename Cont::value_type(name, trim(pair.substr(eq+1))));
    }
}
}
#endif
