// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef PATH_ENUMERATOR_H_7812390457102934
#define PATH_ENUMERATOR_H_7812390457102934

#include <deque>
#include <functional>
#include <optional>
#include <zen/file_error.h>
#include "upload_task.h"


namespace cymo
{
/*  lazy, iterative depth-first traversal of the upload root:
    - per folder: files first, then subfolders; both sorted by name
    - hidden items (name starting with '.') are skipped, so are symlinks and non-regular files
    - a root that is a file yields exactly one task
    - unreadable subfolders and items are reported and skipped; an unreadable root throws       */
class PathEnumerator
{
public:
    PathEnumerator(const Zstring& rootPath, const std::function<void(const zen::FileError& e)>& onItemSkipped /*optional*/); //throw FileError

    std::optional<UploadTask> getNext();

private:
    PathEnumerator           (const PathEnumerator&) = delete;
    PathEnumerator& operator=(const PathEnumerator&) = delete;

    struct PendingFolder
    {
        Zstring folderPath;
        Zstring relPath;
    };
    void readFolder(const PendingFolder& folder); //throw FileError

    const std::function<void(const zen::FileError& e)> onItemSkipped_;

    std::vector<PendingFolder> pendingFolders_; //stack: next folder at the back
    std::deque<UploadTask> pendingFiles_;
};


std::vector<UploadTask> listUploadTasks(const Zstring& rootPath, const std::function<void(const zen::FileError& e)>& onItemSkipped /*optional*/); //throw FileError

inline bool isHiddenItem(const Zstring& itemName) { return zen::startsWith(itemName, Zstr('.')); }
}

#endif //PATH_ENUMERATOR_H_7812390457102934
