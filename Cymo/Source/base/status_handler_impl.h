// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef STATUS_HANDLER_IMPL_H_07682758976
#define STATUS_HANDLER_IMPL_H_07682758976

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include <zen/error_log.h>
#include <zen/file_error.h>
#include <zen/i18n.h>
#include <zen/thread.h>
#include "process_callback.h"


namespace cymo
{
/*  sessions run on worker threads, the front end lives on the main thread:
    - log messages are queued and handed to the main thread in batches
    - status: one slot per running session, the main thread shows the first non-empty one
    - progress counters are lock-free                                                          */
class AsyncCallback : public PhaseCallback
{
public:
    AsyncCallback() {}

    //context of worker thread (and main thread, see reportStats())
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override //noexcept!
    {
        itemsDeltaProcessed_ += itemsDelta;
        bytesDeltaProcessed_ += bytesDelta;
    }
    void updateDataTotal(int itemsDelta, int64_t bytesDelta) override //noexcept!
    {
        itemsDeltaTotal_ += itemsDelta;
        bytesDeltaTotal_ += bytesDelta;
    }

    //context of worker thread
    void updateStatus(std::wstring&& msg) override
    {
        std::lock_guard dummy(lockSessions_);
        const auto it = findSession(std::this_thread::get_id());
        assert(it != activeSessions_.end());
        if (it != activeSessions_.end())
            it->statusMsg = std::move(msg);
    }

    //context of worker thread: does not wait for the main thread
    void logMessage(const std::wstring& msg, PhaseCallback::MsgType type) override
    {
        {
            std::lock_guard dummy(lockLog_);
            pendingLog_.push_back({msg, type});
        }
        conditionLogChanged_.notify_all();
    }

    //context of worker thread
    void notifySessionBegin(size_t sessionIdx) //noexcept
    {
        std::lock_guard dummy(lockSessions_);
        assert(findSession(std::this_thread::get_id()) == activeSessions_.end());

        //keep sorted by session index: status display prefers the first session
        const auto itPos = std::find_if(activeSessions_.begin(), activeSessions_.end(),
                                        [&](const SessionStatus& ss) { return ss.sessionIdx > sessionIdx; });
        activeSessions_.insert(itPos, {std::this_thread::get_id(), sessionIdx, std::wstring()});
    }

    //context of worker thread
    void notifySessionEnd() //noexcept
    {
        std::lock_guard dummy(lockSessions_);
        const auto it = findSession(std::this_thread::get_id());
        assert(it != activeSessions_.end());
        if (it != activeSessions_.end())
            activeSessions_.erase(it);
    }

    //context of worker thread: after the last session's final log message
    void notifyAllDone() //noexcept
    {
        {
            std::lock_guard dummy(lockLog_);
            allDone_ = true;
        }
        conditionLogChanged_.notify_all();
    }

    //context of main thread: forward log, status and progress until notifyAllDone()
    void waitUntilDone(std::chrono::milliseconds cbInterval, PhaseCallback& cb) //throw X
    {
        assert(zen::runningOnMainThread());
        for (;;)
        {
            std::vector<LogEntry> logBatch;
            bool allDone = false;
            {
                std::unique_lock dummy(lockLog_);
                conditionLogChanged_.wait_for(dummy, cbInterval, [this] { return !pendingLog_.empty() || allDone_; });
                logBatch.swap(pendingLog_);
                allDone = allDone_; //all messages of finished sessions are in "logBatch"
            }

            for (const LogEntry& entry : logBatch)
                cb.logMessage(entry.msg, entry.type); //throw X

            if (allDone)
            {
                reportStats(cb); //final numbers
                return;
            }
            cb.updateStatus(getCurrentStatus()); //throw X
            reportStats(cb);
        }
    }

private:
    AsyncCallback           (const AsyncCallback&) = delete;
    AsyncCallback& operator=(const AsyncCallback&) = delete;

    struct SessionStatus
    {
        std::thread::id threadId;
        size_t sessionIdx = 0;
        std::wstring statusMsg;
    };

    struct LogEntry
    {
        std::wstring msg;
        PhaseCallback::MsgType type = PhaseCallback::MsgType::error;
    };

    //call while holding "lockSessions_"
    std::vector<SessionStatus>::iterator findSession(std::thread::id threadId)
    {
        return std::find_if(activeSessions_.begin(), activeSessions_.end(), [&](const SessionStatus& ss) { return ss.threadId == threadId; });
    }

    //context of main thread
    void reportStats(PhaseCallback& cb)
    {
        //exchange(): workers may add more in the meantime
        const int     itemsProcessed = itemsDeltaProcessed_.exchange(0);
        const int64_t bytesProcessed = bytesDeltaProcessed_.exchange(0);
        if (itemsProcessed != 0 || bytesProcessed != 0)
            cb.updateDataProcessed(itemsProcessed, bytesProcessed); //noexcept!

        const int     itemsTotal = itemsDeltaTotal_.exchange(0);
        const int64_t bytesTotal = bytesDeltaTotal_.exchange(0);
        if (itemsTotal != 0 || bytesTotal != 0)
            cb.updateDataTotal(itemsTotal, bytesTotal); //noexcept!
    }

    //context of main thread
    std::wstring getCurrentStatus()
    {
        size_t sessionCount = 0;
        std::wstring statusMsg;
        {
            std::lock_guard dummy(lockSessions_);
            sessionCount = activeSessions_.size();

            for (const SessionStatus& ss : activeSessions_)
                if (!ss.statusMsg.empty())
                {
                    statusMsg = ss.statusMsg;
                    break;
                }
        }
        if (sessionCount < 2)
            return statusMsg;

        return L'[' + _P("1 session", "%x sessions", sessionCount) + L"] " + statusMsg;
    }

    std::mutex lockLog_;
    std::condition_variable conditionLogChanged_;
    std::vector<LogEntry> pendingLog_;
    bool allDone_ = false;

    std::mutex lockSessions_; //status updates must not wait for log hand-over
    std::vector<SessionStatus> activeSessions_; //sorted by session index

    std::atomic<int>     itemsDeltaProcessed_{0};
    std::atomic<int64_t> bytesDeltaProcessed_{0};
    std::atomic<int>     itemsDeltaTotal_    {0};
    std::atomic<int64_t> bytesDeltaTotal_    {0};
};

//=====================================================================================================================

//forward everything to another callback, with a fixed message prefix, e.g. "[Session 2] "
class PrefixedCallback : public PhaseCallback
{
public:
    PrefixedCallback(const std::wstring& msgPrefix, PhaseCallback& cb) : msgPrefix_(msgPrefix), cb_(cb) {}

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { cb_.updateDataProcessed(itemsDelta, bytesDelta); }
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override { cb_.updateDataTotal    (itemsDelta, bytesDelta); }

    void updateStatus(std::wstring&& msg) override { cb_.updateStatus(msgPrefix_ + msg); } //throw X
    void logMessage(const std::wstring& msg, MsgType type) override { cb_.logMessage(msgPrefix_ + msg, type); } //throw X

private:
    const std::wstring msgPrefix_;
    PhaseCallback& cb_;
};

//=====================================================================================================================

//sleep until "delayUntil", reporting the remaining whole seconds (rounded up) on the way
inline
void delayAndCountDown(std::chrono::steady_clock::time_point delayUntil, const std::function<void(const std::wstring& timeRemMsg)>& notifyStatus /*throw X*/) //throw X
{
    using std::chrono::steady_clock;

    for (steady_clock::time_point now = steady_clock::now(); now < delayUntil; now = steady_clock::now())
    {
        const steady_clock::duration timeRem = delayUntil - now;
        const int64_t secondsRem = std::chrono::ceil<std::chrono::seconds>(timeRem).count();
        notifyStatus(_P("1 sec", "%x sec", secondsRem)); //throw X

        std::this_thread::sleep_for(std::min<steady_clock::duration>(timeRem, UI_UPDATE_INTERVAL / 2));
    }
}


struct AutoRetry
{
    size_t count = 0;
    std::chrono::seconds delay{0};
};


template <class Function> inline //return error message if all attempts failed
std::wstring tryReportingError(Function cmd /*throw FileError*/, const AutoRetry& autoRetry, PhaseCallback& cb /*throw X*/) //throw X
{
    for (size_t retryNumber = 0;; ++retryNumber)
        try
        {
            cmd(); //throw FileError
            return std::wstring();
        }
        catch (const zen::FileError& e)
        {
            assert(!e.toString().empty());
            const auto failTime = std::chrono::steady_clock::now();

            if (retryNumber >= autoRetry.count)
            {
                cb.logMessage(e.toString(), PhaseCallback::MsgType::error); //throw X
                return e.toString();
            }

            cb.logMessage(e.toString() + L"\n-> " + _("Automatic retry"), PhaseCallback::MsgType::info); //throw X
            delayAndCountDown(failTime + autoRetry.delay,
                              [&, statusPrefix = _("Automatic retry") +
                                                 (retryNumber == 0 ? L"" : L' ' + zen::numberTo<std::wstring>(retryNumber + 1)) + L"... "](const std::wstring& timeRemMsg)
            { cb.updateStatus(statusPrefix + timeRemMsg); }); //throw X
        }
}
}

#endif //STATUS_HANDLER_IMPL_H_07682758976
