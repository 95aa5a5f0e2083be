// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <ctime>
#include <vector>
#include "i18n.h"
#include "zstring.h"


namespace zen
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_INFO    ? stats.info :
           entry.type == MSG_TYPE_WARNING ? stats.warning : stats.error);
    return stats;
}


const char formatTimeTag    [] = "%H:%M:%S";
const char formatDateTimeTag[] = "%Y-%m-%d %H:%M:%S";

//strftime() format in local time; empty on failure
inline
std::string formatLocalTime(const char* format, time_t time)
{
    struct tm tmLocal = {};
    if (!::localtime_r(&time, &tmLocal))
        return {};

    char buf[64] = {};
    return std::string(buf, std::strftime(buf, sizeof(buf), format, &tmLocal));
}


//"[12:34:56]  Warning:  first line"; continuation lines are indented below the message start, blank lines dropped
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::wstring typeLabel = entry.type == MSG_TYPE_INFO    ? _("Info") :
                                   entry.type == MSG_TYPE_WARNING ? _("Warning") : _("Error");

    const std::string prefix = '[' + formatLocalTime(formatTimeTag, entry.time) + "]  " + utfTo<std::string>(typeLabel) + ":  ";
    const std::string indent(prefix.size(), ' '); //prefix is ASCII

    std::string output;
    for (const std::string& line : splitCpy(trimCpy(entry.message), '\n', SplitOnEmpty::skip))
        output += (output.empty() ? prefix : '\n' + indent) + line;

    if (output.empty())
        output = prefix;
    return output + '\n';
}
}

#endif //ERROR_LOG_H_8917590832147915
