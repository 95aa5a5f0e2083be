// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "log_file.h"
#include <algorithm>
#include <zen/file_io.h>
#include <zen/format_unit.h>

using namespace zen;
using namespace cymo;


namespace
{
const size_t LOG_PREVIEW_MAX = 25;
const size_t SEPARATION_LINE_LEN = 40;
const char TAB_SPACE[] = "    ";
}


UploadResult cymo::getUploadResult(const UploadReport& report)
{
    return report.filesFailed == 0 ? UploadResult::finishedSuccess : UploadResult::finishedError;
}


std::string cymo::generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    const time_t startTime = std::chrono::system_clock::to_time_t(s.startTime);

    std::string headerLine = "Cymo " + formatLocalTime(formatDateTimeTag, startTime) + "  " + s.server + ':' + s.remoteRootPath; //"host:path", relative path: login folder

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    summary.push_back(TAB_SPACE + utfTo<std::string>(getFinalStatusLabel(s.result)));
    summary.emplace_back();

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(TAB_SPACE + utfTo<std::string>(_("Errors:")   + L' ' + formatNumber(logCount.error)));
    if (logCount.warning > 0) summary.push_back(TAB_SPACE + utfTo<std::string>(_("Warnings:") + L' ' + formatNumber(logCount.warning)));

    summary.push_back(TAB_SPACE + utfTo<std::string>(_("Files found:") + L' ' + formatNumber(s.report.filesFound)));
    summary.push_back(TAB_SPACE + utfTo<std::string>(_("Uploaded:")    + L' ' + formatNumber(s.report.filesUploaded) +
                                                     L" (" + formatFilesizeShort(static_cast<int64_t>(s.report.bytesUploaded)) + L')'));
    if (s.report.filesFailed > 0)
        summary.push_back(TAB_SPACE + utfTo<std::string>(_("Failed:") + L' ' + formatNumber(s.report.filesFailed)));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    summary.push_back(TAB_SPACE + utfTo<std::string>(_("Total time:") + L' ' + formatTimeSpan(totalTimeSec)));

    size_t sepLineLen = 0; //calculate max width: summary text is ASCII except for the file paths
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + "\n\n";

    //------------ failed files ----------------
    if (!s.report.failedTasks.empty())
    {
        output += '\n' + utfTo<std::string>(_("Failed files:")) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + '\n';

        size_t previewCount = 0;
        for (const UploadTask& task : s.report.failedTasks)
        {
            if (previewCount++ >= LOG_PREVIEW_MAX)
                break;
            output += TAB_SPACE + task.relPath + '\n';
        }

        if (s.report.failedTasks.size() > previewCount)
            output += "  [...]  " + utfTo<std::string>(replaceCpy(_P("Showing %y of 1 item", "Showing %y of %x items", s.report.failedTasks.size()), //%x used as plural form placeholder!
                                                                  L"%y", formatNumber(previewCount))) + '\n';
        output += std::string(SEPARATION_LINE_LEN, '_') + "\n\n\n";
    }
    return output;
}


void cymo::saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const ErrorLog& log) //throw FileError
{
    std::string content = generateLogHeader(summary, log);

    for (const LogEntry& entry : log)
        content += formatMessage(entry);

    setFileContent(logFilePath, content); //throw FileError
}
