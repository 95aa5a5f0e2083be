// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include <gtest/gtest.h>
#include "base/dir_mirror.h"
#include "fake_ftp.h"

using namespace zen;
using namespace cymo;
using namespace cymo::test;


namespace
{
struct DirMirrorTest : public ::testing::Test
{
    DirMirrorTest()
    {
        server.addFolder(Zstr("/up"));
        dirState.currentDir = Zstr("/up");
        dirState.confirmedDirs.insert(Zstr("/up"));
    }

    size_t countCommand(const std::string& cmd) const
    {
        const std::vector<std::string> log = server.getCommandLog();
        return std::count(log.begin(), log.end(), cmd);
    }

    size_t countCommands(const std::string& prefix) const
    {
        const std::vector<std::string> log = server.getCommandLog();
        return std::count_if(log.begin(), log.end(), [&](const std::string& cmd) { return startsWith(cmd, prefix); });
    }

    FakeFtpServer server;
    FakeFtpTransport transport{server};
    RemoteDirectoryState dirState;
};
}


TEST_F(DirMirrorTest, CreatesNestedFoldersLevelByLevel)
{
    ensureRemotePath(transport, dirState, Zstr("a/b"), Zstr("/up"));

    const std::vector<std::string> expected
    {
        "CWD /up/a",
        "MKD /up/a",
        "CWD /up/a",
        "CWD /up/a/b",
        "MKD /up/a/b",
        "CWD /up/a/b",
    };
    EXPECT_EQ(server.getCommandLog(), expected);
    EXPECT_EQ(dirState.currentDir, "/up/a/b");
    EXPECT_TRUE(dirState.confirmedDirs.contains(Zstr("/up/a")));
    EXPECT_TRUE(dirState.confirmedDirs.contains(Zstr("/up/a/b")));
}


TEST_F(DirMirrorTest, RepeatedCallIsNoOp)
{
    ensureRemotePath(transport, dirState, Zstr("a/b"), Zstr("/up"));
    const size_t commandCount = server.getCommandLog().size();

    ensureRemotePath(transport, dirState, Zstr("a/b"), Zstr("/up"));

    EXPECT_EQ(server.getCommandLog().size(), commandCount);
    EXPECT_EQ(countCommands("MKD /up/a/b"), 1u);
}


TEST_F(DirMirrorTest, RootNeedsNoCommand)
{
    ensureRemotePath(transport, dirState, Zstr(""), Zstr("/up"));
    EXPECT_TRUE(server.getCommandLog().empty());
}


TEST_F(DirMirrorTest, ConfirmedAncestorsAreNotEnteredAgain)
{
    ensureRemotePath(transport, dirState, Zstr("a/b"), Zstr("/up"));
    ensureRemotePath(transport, dirState, Zstr("a/c"), Zstr("/up"));

    EXPECT_EQ(countCommand("CWD /up/a"), 2u); //first walk only
    EXPECT_EQ(countCommand("MKD /up/a"), 1u);
    EXPECT_EQ(countCommand("MKD /up/a/c"), 1u);
    EXPECT_EQ(dirState.currentDir, "/up/a/c");

    //back to a confirmed folder: only the final CWD
    const size_t commandCount = server.getCommandLog().size();
    ensureRemotePath(transport, dirState, Zstr("a"), Zstr("/up"));

    const std::vector<std::string> log = server.getCommandLog();
    ASSERT_EQ(log.size(), commandCount + 1);
    EXPECT_EQ(log.back(), "CWD /up/a");
    EXPECT_EQ(dirState.currentDir, "/up/a");
}


TEST_F(DirMirrorTest, ExistingFoldersAreEnteredNotCreated)
{
    server.addFolder(Zstr("/up/a/b"));

    ensureRemotePath(transport, dirState, Zstr("a/b"), Zstr("/up"));

    EXPECT_EQ(countCommands("MKD"), 0u);
    EXPECT_EQ(dirState.currentDir, "/up/a/b");
}


TEST_F(DirMirrorTest, FolderCreatedConcurrentlyBySomeoneElse)
{
    //another session creates the folder between our CWD and MKD
    struct RacingTransport : public FakeFtpTransport
    {
        explicit RacingTransport(FakeFtpServer& srv) : FakeFtpTransport(srv), srv_(srv) {}

        void makeDirectory(const Zstring& serverPath) override
        {
            srv_.addFolder(serverPath);
            FakeFtpTransport::makeDirectory(serverPath); //throw SysError: "550 File exists."
        }
        FakeFtpServer& srv_;
    } racingTransport(server);

    ensureRemotePath(racingTransport, dirState, Zstr("a"), Zstr("/up"));

    EXPECT_EQ(dirState.currentDir, "/up/a");
    EXPECT_TRUE(dirState.confirmedDirs.contains(Zstr("/up/a")));
}


TEST_F(DirMirrorTest, CreateFailureThrowsAndKeepsStateConsistent)
{
    server.failMakeDirectory(Zstr("/up/a/b"));

    EXPECT_THROW(ensureRemotePath(transport, dirState, Zstr("a/b/c"), Zstr("/up")), FileError);

    EXPECT_TRUE (dirState.confirmedDirs.contains(Zstr("/up/a")));
    EXPECT_FALSE(dirState.confirmedDirs.contains(Zstr("/up/a/b")));
    EXPECT_EQ(dirState.currentDir, "/up/a");
    EXPECT_EQ(countCommands("MKD /up/a/b/c"), 0u);
}
