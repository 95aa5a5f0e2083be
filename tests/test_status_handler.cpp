// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "base/status_handler_impl.h"
#include "fake_ftp.h"

using namespace zen;
using namespace cymo;
using namespace cymo::test;
using ::testing::ElementsAre;
using ::testing::Pair;


namespace
{
constexpr std::chrono::milliseconds TEST_INTERVAL(10);


//releases the sessions once a given status line was shown
class StatusWatchCallback : public RecordingCallback
{
public:
    explicit StatusWatchCallback(const std::wstring& awaitedStatus) : awaitedStatus_(awaitedStatus) {}

    void updateStatus(std::wstring&& msg) override
    {
        if (!released_ && msg == awaitedStatus_)
        {
            released_ = true;
            release_.set_value();
        }
        RecordingCallback::updateStatus(std::move(msg));
    }

    std::shared_future<void> getReleaseSignal() { return release_.get_future().share(); }

private:
    const std::wstring awaitedStatus_;
    bool released_ = false;
    std::promise<void> release_;
};
}


TEST(AsyncCallback, LogAndProgressReachMainThreadInOrder)
{
    AsyncCallback acb;
    RecordingCallback callback;

    auto ftWorker = runAsync([&]
    {
        acb.notifySessionBegin(0);
        acb.updateDataTotal(2, 300);
        acb.logMessage(L"first", PhaseCallback::MsgType::info);
        acb.logMessage(L"second", PhaseCallback::MsgType::warning);
        acb.updateDataProcessed(2, 300);
        acb.logMessage(L"third", PhaseCallback::MsgType::error);
        acb.notifySessionEnd();
        acb.notifyAllDone();
    });

    acb.waitUntilDone(TEST_INTERVAL, callback);
    ftWorker.get();

    EXPECT_THAT(callback.log, ElementsAre(Pair(L"first",  PhaseCallback::MsgType::info),
                                          Pair(L"second", PhaseCallback::MsgType::warning),
                                          Pair(L"third",  PhaseCallback::MsgType::error)));
    EXPECT_EQ(callback.itemsTotal, 2);
    EXPECT_EQ(callback.bytesTotal, 300);
    EXPECT_EQ(callback.itemsProcessed, 2);
    EXPECT_EQ(callback.bytesProcessed, 300);
}


TEST(AsyncCallback, StatusShowsLowestSessionAndSessionCount)
{
    AsyncCallback acb;
    StatusWatchCallback callback(L"[2 sessions] first session");
    const std::shared_future<void> release = callback.getReleaseSignal();

    auto runSession = [&](size_t sessionIdx, const std::wstring& status)
    {
        return runAsync([&acb, release, sessionIdx, status]
        {
            acb.notifySessionBegin(sessionIdx);
            acb.updateStatus(std::wstring(status));
            release.wait();
            acb.notifySessionEnd();
        });
    };
    //started in reverse: display order follows the session index, not the start order
    auto ftSecond = runSession(1, L"second session");
    auto ftFirst  = runSession(0, L"first session");

    auto ftDone = runAsync([&]
    {
        ftSecond.get();
        ftFirst.get();
        acb.notifyAllDone();
    });

    acb.waitUntilDone(TEST_INTERVAL, callback); //returns only after the awaited status was shown
    ftDone.get();

    EXPECT_THAT(callback.statusMessages, ::testing::Contains(L"[2 sessions] first session"));
    EXPECT_EQ(callback.countMessages(PhaseCallback::MsgType::error), 0u);
}


TEST(AsyncCallback, SessionPrefixIsAddedToLogAndStatus)
{
    RecordingCallback callback;
    PrefixedCallback prefixed(L"[Session 3] ", callback);

    prefixed.logMessage(L"Uploading", PhaseCallback::MsgType::info);
    prefixed.updateStatus(L"Connecting");

    EXPECT_THAT(callback.log, ElementsAre(Pair(L"[Session 3] Uploading", PhaseCallback::MsgType::info)));
    EXPECT_THAT(callback.statusMessages, ElementsAre(L"[Session 3] Connecting"));
}


TEST(DelayAndCountDown, CountsWholeSecondsDown)
{
    std::vector<std::wstring> statusMsgs;

    const auto startTime = std::chrono::steady_clock::now();
    delayAndCountDown(startTime + std::chrono::milliseconds(1500), [&](const std::wstring& msg) { statusMsgs.push_back(msg); });

    EXPECT_GE(std::chrono::steady_clock::now() - startTime, std::chrono::milliseconds(1500));
    ASSERT_FALSE(statusMsgs.empty());
    EXPECT_EQ(statusMsgs.front(), L"2 sec");
    EXPECT_EQ(statusMsgs.back(), L"1 sec");
}


TEST(DelayAndCountDown, ElapsedDeadlineReturnsImmediately)
{
    size_t notifications = 0;
    delayAndCountDown(std::chrono::steady_clock::now() - std::chrono::seconds(1), [&](const std::wstring&) { ++notifications; });
    EXPECT_EQ(notifications, 0u);
}
