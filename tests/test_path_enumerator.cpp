// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include <fcntl.h>
#include <gtest/gtest.h>
#include <zen/scope_guard.h>
#include "base/path_enumerator.h"
#include "temp_folder.h"

using namespace zen;
using namespace cymo;


namespace
{
struct PathEnumeratorTest : public ::testing::Test
{
    ~PathEnumeratorTest()
    {
        std::error_code ec; //restore permissions for clean up
        std::filesystem::permissions(appendPath(rootPath, Zstr("locked")), std::filesystem::perms::owner_all, ec);
    }

    void createFile(const Zstring& relPath, const std::string& content) { tempFolder.createFile(relPath, content); }

    static std::vector<Zstring> getRelPaths(const std::vector<UploadTask>& tasks)
    {
        std::vector<Zstring> relPaths;
        for (const UploadTask& task : tasks)
            relPaths.push_back(task.relPath);
        return relPaths;
    }

    //Linux PATH_MAX is 4096: the folder itself is still accessible, but its items can't be "lstat"ed
    Zstring createDeepFolder() const
    {
        Zstring folderPath = rootPath;
        while (folderPath.size() <= 3850)
            folderPath = appendPath(folderPath, Zstring(200, Zstr('d')));

        std::filesystem::create_directories(folderPath);
        return folderPath;
    }

    const test::TempFolder tempFolder;
    const Zstring rootPath = tempFolder.getPath();
};


//item name of maximum length: path exceeds PATH_MAX when placed inside createDeepFolder()
const Zstring longItemName(255, Zstr('x'));
}


TEST_F(PathEnumeratorTest, FilesBeforeSubfoldersSortedByName)
{
    createFile(Zstr("b.txt"), "b");
    createFile(Zstr("a.txt"), "a");
    createFile(Zstr("sub2/x.bin"), "x");
    createFile(Zstr("sub1/y.txt"), "y");
    createFile(Zstr("sub1/deep/z.txt"), "z");

    const std::vector<Zstring> expected
    {
        Zstr("a.txt"),
        Zstr("b.txt"),
        Zstr("sub1/y.txt"),
        Zstr("sub1/deep/z.txt"),
        Zstr("sub2/x.bin"),
    };
    EXPECT_EQ(getRelPaths(listUploadTasks(rootPath, nullptr)), expected);
}


TEST_F(PathEnumeratorTest, HiddenItemsAndSymlinksAreSkipped)
{
    createFile(Zstr("visible.txt"), "v");
    createFile(Zstr(".hidden"), "h");
    createFile(Zstr(".git/config"), "c");
    createFile(Zstr("dir/.profile"), "p");
    std::filesystem::create_symlink(appendPath(rootPath, Zstr("visible.txt")), appendPath(rootPath, Zstr("link.txt")));
    std::filesystem::create_directory_symlink(appendPath(rootPath, Zstr("dir")), appendPath(rootPath, Zstr("dirlink")));

    const std::vector<Zstring> expected{Zstr("visible.txt")};
    EXPECT_EQ(getRelPaths(listUploadTasks(rootPath, nullptr)), expected);
}


TEST_F(PathEnumeratorTest, RecordsFileSizeAndLocalPath)
{
    createFile(Zstr("data/blob.bin"), std::string(1234, 'x'));

    const std::vector<UploadTask> tasks = listUploadTasks(rootPath, nullptr);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].fileSize, 1234u);
    EXPECT_EQ(tasks[0].relPath, "data/blob.bin");
    EXPECT_EQ(tasks[0].localPath, appendPath(rootPath, Zstr("data/blob.bin")));
}


TEST_F(PathEnumeratorTest, SingleFileRoot)
{
    createFile(Zstr("report.pdf"), "%PDF");

    const std::vector<UploadTask> tasks = listUploadTasks(appendPath(rootPath, Zstr("report.pdf")), nullptr);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].relPath, "report.pdf");
    EXPECT_EQ(tasks[0].fileSize, 4u);
}


TEST_F(PathEnumeratorTest, EmptyRoot)
{
    std::filesystem::create_directories(appendPath(rootPath, Zstr("empty/nested")));
    EXPECT_TRUE(listUploadTasks(rootPath, nullptr).empty());
}


TEST_F(PathEnumeratorTest, MissingRootThrows)
{
    EXPECT_THROW(listUploadTasks(appendPath(rootPath, Zstr("does-not-exist")), nullptr), FileError);
}


TEST_F(PathEnumeratorTest, UnreadableSubfolderIsSkippedWithWarning)
{
    if (::geteuid() == 0)
        GTEST_SKIP() << "permissions are not enforced for root";

    createFile(Zstr("a.txt"), "a");
    createFile(Zstr("locked/secret.txt"), "s");
    createFile(Zstr("open/b.txt"), "b");
    std::filesystem::permissions(appendPath(rootPath, Zstr("locked")), std::filesystem::perms::none);

    std::vector<std::wstring> warnings;
    const std::vector<UploadTask> tasks = listUploadTasks(rootPath, [&](const FileError& e) { warnings.push_back(e.toString()); });

    const std::vector<Zstring> expected{Zstr("a.txt"), Zstr("open/b.txt")};
    EXPECT_EQ(getRelPaths(tasks), expected);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(contains(warnings[0], L"locked"));
}


TEST_F(PathEnumeratorTest, FolderVanishedBeforeTraversalIsSkippedWithWarning)
{
    createFile(Zstr("a.txt"), "a");
    createFile(Zstr("gone/b.txt"), "b");
    createFile(Zstr("kept/c.txt"), "c");

    std::vector<std::wstring> warnings;
    PathEnumerator enumerator(rootPath, [&](const FileError& e) { warnings.push_back(e.toString()); });

    std::filesystem::remove_all(appendPath(rootPath, Zstr("gone")));

    std::vector<UploadTask> tasks;
    while (std::optional<UploadTask> task = enumerator.getNext())
        tasks.push_back(std::move(*task));

    const std::vector<Zstring> expected{Zstr("a.txt"), Zstr("kept/c.txt")};
    EXPECT_EQ(getRelPaths(tasks), expected);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(contains(warnings[0], L"gone"));
}


TEST_F(PathEnumeratorTest, UnreadableItemKeepsItsSiblings)
{
    const Zstring deepPath = createDeepFolder();
    setFileContent(appendPath(deepPath, Zstr("a.txt")), "a"); //throw FileError
    setFileContent(appendPath(deepPath, Zstr("z.txt")), "z"); //throw FileError

    const int dirFd = ::open(deepPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    ASSERT_NE(dirFd, -1);
    ZEN_ON_SCOPE_EXIT(::close(dirFd));

    const int fileFd = ::openat(dirFd, longItemName.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    ASSERT_NE(fileFd, -1);
    ::close(fileFd);
    ZEN_ON_SCOPE_EXIT(::unlinkat(dirFd, longItemName.c_str(), 0)); //too long for a path-based clean up

    //item in a subfolder
    {
        std::vector<std::wstring> warnings;
        const std::vector<UploadTask> tasks = listUploadTasks(rootPath, [&](const FileError& e) { warnings.push_back(e.toString()); });

        ASSERT_EQ(tasks.size(), 2u);
        EXPECT_EQ(tasks[0].localPath, appendPath(deepPath, Zstr("a.txt")));
        EXPECT_EQ(tasks[1].localPath, appendPath(deepPath, Zstr("z.txt")));
        EXPECT_EQ(warnings.size(), 1u);
    }

    //item directly in the scan root
    {
        std::vector<std::wstring> warnings;
        const std::vector<UploadTask> tasks = listUploadTasks(deepPath, [&](const FileError& e) { warnings.push_back(e.toString()); });

        const std::vector<Zstring> expected{Zstr("a.txt"), Zstr("z.txt")};
        EXPECT_EQ(getRelPaths(tasks), expected);
        ASSERT_EQ(warnings.size(), 1u);
        EXPECT_TRUE(contains(warnings[0], L"xxxxxxxx"));
    }

    //no error handler: still skipped
    EXPECT_EQ(listUploadTasks(deepPath, nullptr).size(), 2u);
}


TEST_F(PathEnumeratorTest, LazyEnumeration)
{
    createFile(Zstr("one.txt"), "1");
    createFile(Zstr("sub/two.txt"), "2");

    PathEnumerator enumerator(rootPath, nullptr);

    std::optional<UploadTask> task = enumerator.getNext();
    ASSERT_TRUE(task);
    EXPECT_EQ(task->relPath, "one.txt");

    task = enumerator.getNext();
    ASSERT_TRUE(task);
    EXPECT_EQ(task->relPath, "sub/two.txt");

    EXPECT_FALSE(enumerator.getNext());
    EXPECT_FALSE(enumerator.getNext());
}
