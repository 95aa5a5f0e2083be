// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef GENERATE_LOGFILE_H_931726432167489732164
#define GENERATE_LOGFILE_H_931726432167489732164

#include <chrono>
#include <zen/error_log.h>
#include "return_codes.h"
#include "base/upload_task.h"


namespace cymo
{
struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    UploadResult result = UploadResult::finishedError;
    Zstring server;
    Zstring remoteRootPath;
    UploadReport report;
    std::chrono::milliseconds totalTime{};
};

UploadResult getUploadResult(const UploadReport& report);

std::string generateLogHeader(const ProcessSummary& summary, const zen::ErrorLog& log);

//summary header followed by all log entries; overwrites existing file
void saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const zen::ErrorLog& log); //throw FileError
}

#endif //GENERATE_LOGFILE_H_931726432167489732164
