// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include <chrono>
#include <clocale>
#include <iostream>
#include <unistd.h>
#include <libcurl/curl_wrap.h>
#include <zen/format_unit.h>
#include <zen/thread.h>
#include "afs/ftp.h"
#include "base/orchestrator.h"
#include "command_line.h"
#include "console_status_handler.h"
#include "log_file.h"
#include "return_codes.h"
#include "version/version.h"

using namespace zen;
using namespace cymo;


namespace
{
void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


std::wstring formatSummary(const UploadReport& report)
{
    std::wstring output = _("Files found:") + L' ' + numberTo<std::wstring>(report.filesFound)    + L"  " +
                          _("Uploaded:")    + L' ' + numberTo<std::wstring>(report.filesUploaded) + L"  " +
                          _("Failed:")      + L' ' + numberTo<std::wstring>(report.filesFailed)   + L'\n';

    if (!report.failedTasks.empty())
    {
        output += _("Failed files:") + L'\n';
        for (const UploadTask& task : report.failedTasks)
            output += L"    " + utfTo<std::wstring>(task.relPath) + L'\n';
    }
    return output;
}


CymoReturnCode runUploadJob(const CommandLineRequest& req) //throw SysError
{
    const LibcurlScope curlScope; //throw SysError

    const std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now();
    const auto startTimeSteady = std::chrono::steady_clock::now();

    CymoReturnCode rc = CYMO_RC_SUCCESS;
    UploadReport report;
    ErrorLog errorLog;
    {
        ConsoleStatusHandler statusHandler(::isatty(STDERR_FILENO) != 0);

        statusHandler.logMessage(replaceCpy(replaceCpy(replaceCpy(_("Uploading %x to %y on server %z"),
                                                                  L"%x", fmtPath(req.cfg.localRootPath)),
                                                       L"%y", fmtPath(req.cfg.remoteRootPath)),
                                            L"%z", fmtPath(req.cfg.login.server)), PhaseCallback::MsgType::info);

        const std::unique_ptr<FtpConnector> connector = createFtpConnector();

        const TextSniffingClassifier textSniffer;
        const BinaryOnlyClassifier binaryOnly;
        const TransferModeClassifier& classifier = req.cfg.binaryOnly ? static_cast<const TransferModeClassifier&>(binaryOnly) : textSniffer;
        try
        {
            report = runUpload(req.cfg, *connector, classifier, statusHandler); //throw FileError
        }
        catch (const FileError& e)
        {
            statusHandler.logMessage(e.toString(), PhaseCallback::MsgType::error);
            raiseReturnCode(rc, CYMO_RC_ERROR);
        }
        errorLog = statusHandler.getErrorLog();
    }

    std::cout << '\n' << utfTo<std::string>(formatSummary(report)) << std::flush;

    if (!req.logFilePath.empty())
    {
        ProcessSummary summary;
        summary.startTime      = startTime;
        summary.result         = rc == CYMO_RC_SUCCESS ? getUploadResult(report) : UploadResult::finishedError;
        summary.server         = req.cfg.login.server;
        summary.remoteRootPath = req.cfg.remoteRootPath;
        summary.report         = report;
        summary.totalTime      = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTimeSteady);
        try
        {
            saveLogFile(req.logFilePath, summary, errorLog); //throw FileError
        }
        catch (const FileError& e) { notifyAppError(e.toString()); }
    }
    return rc;
}
}


int main(int argc, char* argv[])
{
    std::setlocale(LC_ALL, ""); //thousands separator, local time format

    try
    {
        CommandLineRequest req;
        try
        {
            req = parseCommandLine(std::vector<Zstring>(argv + 1, argv + argc)); //throw FileError
        }
        catch (const FileError& e)
        {
            notifyAppError(e.toString());
            std::cerr << utfTo<std::string>(_("Use \"cymo --help\" to show the syntax.")) + '\n';
            return CYMO_RC_ERROR;
        }

        if (req.showHelp)
        {
            std::cout << utfTo<std::string>(getSyntaxHelp());
            return CYMO_RC_SUCCESS;
        }
        if (req.showVersion)
        {
            std::cout << "cymo " << cymoVersion << '\n';
            return CYMO_RC_SUCCESS;
        }

        return runUploadJob(req); //throw SysError
    }
    catch (const SysError& e)
    {
        notifyAppError(e.toString());
        return CYMO_RC_ERROR;
    }
    catch (const std::exception& e)
    {
        notifyAppError(utfTo<std::wstring>(std::string(e.what())));
        return CYMO_RC_EXCEPTION;
    }
}
