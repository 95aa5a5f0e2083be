// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "orchestrator.h"
#include <atomic>
#include <cassert>
#include <future>
#include <numeric>
#include <tuple>
#include <zen/scope_guard.h>
#include <zen/thread.h>
#include "path_enumerator.h"
#include "status_handler_impl.h"
#include "upload_session.h"
#include "work_partition.h"

using namespace zen;
using namespace cymo;


UploadReport cymo::runUpload(const UploadConfig& cfg,
                             FtpConnector& connector,
                             const TransferModeClassifier& classifier,
                             PhaseCallback& callback) //throw FileError, X
{
    callback.updateStatus(replaceCpy(_("Scanning %x..."), L"%x", fmtPath(cfg.localRootPath))); //throw X

    std::vector<UploadTask> tasks = listUploadTasks(cfg.localRootPath, [&](const FileError& e)
    {
        callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); //throw X
    }); //throw FileError, X

    UploadReport report;
    report.filesFound = tasks.size();

    const uint64_t bytesTotal = std::accumulate(tasks.begin(), tasks.end(), uint64_t(0),
    [](uint64_t sum, const UploadTask& task) { return sum + task.fileSize; });

    callback.updateDataTotal(static_cast<int>(tasks.size()), static_cast<int64_t>(bytesTotal)); //noexcept!

    if (tasks.empty())
    {
        callback.logMessage(replaceCpy(_("No files found in %x."), L"%x", fmtPath(cfg.localRootPath)), PhaseCallback::MsgType::info); //throw X
        return report; //[!] otherwise AsyncCallback::notifyAllDone() is never called!
    }

    std::vector<WorkShare> shares = partitionWork(std::move(tasks), getWorkerCount(cfg.threadCount));

    callback.logMessage(_P("Found 1 file.", "Found %x files.", report.filesFound) + L' ' +
                        _P("Starting 1 upload session...", "Starting %x upload sessions...", shares.size()), PhaseCallback::MsgType::info); //throw X

    AsyncCallback acb;                                   //manage life time: enclose worker threads!!!
    std::atomic<size_t> activeSessionCount(shares.size()); //
    Protected<std::pair<size_t /*uploaded*/, size_t /*failed*/>> totals;

    //hand over each share through a channel: sessions start connecting while the remaining ones are spawned
    std::vector<std::promise<WorkShare>> shareChannels(shares.size());
    std::vector<std::future<SessionOutcome>> sessionResults;

    ZEN_ON_SCOPE_FAIL
    (
        shareChannels.clear(); //=> broken promise for sessions still waiting
        for (std::future<SessionOutcome>& fut : sessionResults)
            fut.wait(); //sessions reference "acb": logging never blocks on the main thread
    );

    for (size_t i = 0; i < shares.size(); ++i)
        sessionResults.push_back(runAsync([&, sessionIdx = i, shareIn = shareChannels[i].get_future()]() mutable
    {
        setCurrentThreadName(Zstr("Upload session ") + numberTo<Zstring>(sessionIdx + 1));

        acb.notifySessionBegin(sessionIdx);
        ZEN_ON_SCOPE_EXIT
        (
            acb.notifySessionEnd();
            if (--activeSessionCount == 0)
                acb.notifyAllDone(); //noexcept
        );

        WorkShare share = shareIn.get(); //throw std::future_error

        UploadSession session(sessionIdx + 1, cfg, connector, classifier, acb);
        SessionOutcome outcome = session.run(std::move(share));

        totals.access([&](std::pair<size_t, size_t>& t)
        {
            t.first  += outcome.uploadedCount;
            t.second += outcome.failedTasks.size();
        });
        return outcome;
    }));

    for (size_t i = 0; i < shares.size(); ++i)
        shareChannels[i].set_value(std::move(shares[i]));

    acb.waitUntilDone(UI_UPDATE_INTERVAL / 2 /*every ~50 ms*/, callback); //throw X

    for (std::future<SessionOutcome>& fut : sessionResults)
    {
        SessionOutcome outcome = fut.get(); //rethrow unexpected errors of the worker
        report.bytesUploaded += outcome.bytesUploaded;
        report.failedTasks.insert(report.failedTasks.end(), outcome.failedTasks.begin(), outcome.failedTasks.end());
    }

    std::tie(report.filesUploaded, report.filesFailed) = totals.access([](const std::pair<size_t, size_t>& t) { return t; });
    assert(report.filesUploaded + report.filesFailed == report.filesFound);

    callback.updateStatus(std::wstring()); //throw X
    return report;
}
