// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "base/orchestrator.h"
#include "fake_ftp.h"
#include "temp_folder.h"

using namespace zen;
using namespace cymo;
using namespace cymo::test;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;


namespace
{
struct OrchestratorTest : public ::testing::Test
{
    OrchestratorTest()
    {
        server.addFolder(Zstr("/up"));
        cfg.remoteRootPath = Zstr("/up");
        cfg.localRootPath  = tempFolder.getPath();
        cfg.login.server   = Zstr("ftp.example.com");
    }

    UploadReport run() { return runUpload(cfg, connector, TextSniffingClassifier(), callback); }

    static std::vector<Zstring> getRelPaths(const std::vector<UploadTask>& tasks)
    {
        std::vector<Zstring> relPaths;
        for (const UploadTask& task : tasks)
            relPaths.push_back(task.relPath);
        return relPaths;
    }

    const TempFolder tempFolder;
    FakeFtpServer server;
    FakeFtpConnector connector{server};
    RecordingCallback callback;
    UploadConfig cfg;
};
}


TEST_F(OrchestratorTest, Scenario1ThreeFilesTwoWorkers)
{
    tempFolder.createFile(Zstr("1.txt"), "one");
    tempFolder.createFile(Zstr("2.txt"), "two");
    tempFolder.createFile(Zstr("3.txt"), "three");
    cfg.threadCount = 2;

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound,    3u);
    EXPECT_EQ(report.filesUploaded, 3u);
    EXPECT_EQ(report.filesFailed,   0u);
    EXPECT_EQ(report.bytesUploaded, 11u);
    EXPECT_TRUE(report.failedTasks.empty());

    EXPECT_EQ(server.getConnectCount(), 2u);
    EXPECT_EQ(server.getCloseCount(), 2u);
    EXPECT_EQ(server.getFiles().size(), 3u);
    EXPECT_EQ(server.getFiles().at(Zstr("/up/3.txt")).content, "three");

    //statistics forwarded to the main thread
    EXPECT_EQ(callback.itemsTotal, 3);
    EXPECT_EQ(callback.bytesTotal, 11);
    EXPECT_EQ(callback.itemsProcessed, 3);
    EXPECT_EQ(callback.bytesProcessed, 11);
}


TEST_F(OrchestratorTest, SessionMessagesArePrefixed)
{
    tempFolder.createFile(Zstr("a.txt"), "a");
    tempFolder.createFile(Zstr("b.txt"), "b");
    cfg.threadCount = 2;

    run();

    auto hasPrefix = [&](const std::wstring& prefix)
    {
        return std::any_of(callback.log.begin(), callback.log.end(), [&](const auto& item) { return startsWith(item.first, prefix); });
    };
    EXPECT_TRUE(hasPrefix(L"[Session 1] "));
    EXPECT_TRUE(hasPrefix(L"[Session 2] "));
    EXPECT_FALSE(hasPrefix(L"[Session 3] "));
}


TEST_F(OrchestratorTest, Scenario3ConnectFailureFailsOneShare)
{
    for (int i = 0; i < 8; ++i)
        tempFolder.createFile(Zstr("f") + numberTo<Zstring>(i) + Zstr(".bin"), std::string(10, static_cast<char>(i)));
    cfg.threadCount = 2;
    server.failConnects(1); //the first session to connect, whichever it is

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound,    8u);
    EXPECT_EQ(report.filesUploaded, 4u);
    EXPECT_EQ(report.filesFailed,   4u);
    EXPECT_EQ(report.bytesUploaded, 40u);

    //failed: exactly one complete share, without any upload attempt
    const std::vector<Zstring> failed = getRelPaths(report.failedTasks);
    EXPECT_THAT(failed, ::testing::AnyOf(ElementsAre("f0.bin", "f1.bin", "f2.bin", "f3.bin"),
                                         ElementsAre("f4.bin", "f5.bin", "f6.bin", "f7.bin")));

    for (const Zstring& relPath : failed)
        EXPECT_EQ(server.getStoreAttempts(appendPath(Zstr("/up"), relPath)), 0u);

    EXPECT_EQ(server.getFiles().size(), 4u);
    EXPECT_EQ(callback.countMessages(PhaseCallback::MsgType::error), 1u);
}


TEST_F(OrchestratorTest, Scenario5EmptyRootSpawnsNoSession)
{
    std::filesystem::create_directories(appendPath(tempFolder.getPath(), Zstr("empty")));
    tempFolder.createFile(Zstr(".hidden"), "ignored");

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound,    0u);
    EXPECT_EQ(report.filesUploaded, 0u);
    EXPECT_EQ(report.filesFailed,   0u);
    EXPECT_EQ(server.getConnectCount(), 0u);
    EXPECT_TRUE(server.getCommandLog().empty());
}


TEST_F(OrchestratorTest, AggregationCountsEveryFileOnce)
{
    for (int i = 0; i < 17; ++i)
        tempFolder.createFile(Zstr("dir") + numberTo<Zstring>(i % 4) + Zstr("/file") + numberTo<Zstring>(i) + Zstr(".txt"), "content");

    server.failStores(Zstr("/up/dir1/file5.txt"),  static_cast<size_t>(-1));
    server.failStores(Zstr("/up/dir2/file10.txt"), static_cast<size_t>(-1));
    server.failStores(Zstr("/up/dir3/file15.txt"), 1);
    cfg.threadCount = 5;

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound, 17u);
    EXPECT_EQ(report.filesUploaded + report.filesFailed, report.filesFound);
    EXPECT_EQ(report.filesFailed, 3u);
    EXPECT_EQ(report.failedTasks.size(), report.filesFailed);
    EXPECT_EQ(server.getFiles().size(), 14u);
    EXPECT_EQ(server.getConnectCount(), 5u);

    EXPECT_THAT(getRelPaths(report.failedTasks), UnorderedElementsAre("dir1/file5.txt", "dir2/file10.txt", "dir3/file15.txt"));
}


TEST_F(OrchestratorTest, RetriesAcrossSessions)
{
    for (int i = 0; i < 6; ++i)
        tempFolder.createFile(Zstr("sub/file") + numberTo<Zstring>(i), "data");

    server.failStores(Zstr("/up/sub/file0"), 2);
    server.failStores(Zstr("/up/sub/file5"), 2);
    cfg.threadCount    = 3;
    cfg.autoRetryCount = 2;

    const UploadReport report = run();

    EXPECT_EQ(report.filesUploaded, 6u);
    EXPECT_EQ(report.filesFailed,   0u);
    EXPECT_EQ(server.getStoreAttempts(Zstr("/up/sub/file0")), 3u);
    EXPECT_EQ(server.getStoreAttempts(Zstr("/up/sub/file5")), 3u);
}


TEST_F(OrchestratorTest, WorkerCountClampedToTaskCount)
{
    tempFolder.createFile(Zstr("a.txt"), "a");
    tempFolder.createFile(Zstr("b.txt"), "b");
    cfg.threadCount = 8;

    const UploadReport report = run();

    EXPECT_EQ(report.filesUploaded, 2u);
    EXPECT_EQ(server.getConnectCount(), 2u);
}


TEST_F(OrchestratorTest, SingleFileRoot)
{
    cfg.localRootPath = tempFolder.createFile(Zstr("only.txt"), "only");

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound,    1u);
    EXPECT_EQ(report.filesUploaded, 1u);
    EXPECT_EQ(server.getFiles().at(Zstr("/up/only.txt")).content, "only");
}


TEST_F(OrchestratorTest, MissingLocalRootThrows)
{
    cfg.localRootPath = appendPath(tempFolder.getPath(), Zstr("missing"));

    EXPECT_THROW(run(), FileError);
    EXPECT_EQ(server.getConnectCount(), 0u);
}


TEST_F(OrchestratorTest, MissingRemoteRootFailsEverything)
{
    tempFolder.createFile(Zstr("a.txt"), "a");
    tempFolder.createFile(Zstr("b/c.txt"), "c");
    cfg.remoteRootPath = Zstr("/nowhere");
    cfg.threadCount = 2;

    const UploadReport report = run();

    EXPECT_EQ(report.filesFound,    2u);
    EXPECT_EQ(report.filesUploaded, 0u);
    EXPECT_EQ(report.filesFailed,   2u);
    EXPECT_EQ(callback.countMessages(PhaseCallback::MsgType::error), 2u);
}
