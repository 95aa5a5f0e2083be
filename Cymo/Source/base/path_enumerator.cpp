// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "path_enumerator.h"
#include <algorithm>
#include <zen/file_access.h>
#include <zen/file_path.h>
#include <zen/file_traverser.h>

using namespace zen;
using namespace cymo;


PathEnumerator::PathEnumerator(const Zstring& rootPath, const std::function<void(const FileError& e)>& onItemSkipped) : //throw FileError
    onItemSkipped_(onItemSkipped)
{
    if (getItemType(rootPath) == ItemType::file) //throw FileError
        pendingFiles_.push_back({rootPath, getItemName(rootPath), getFileSize(rootPath)}); //throw FileError
    else //folder or symlink to a folder: opendir() follows symlinks
        readFolder({rootPath, Zstring()}); //throw FileError
}


void PathEnumerator::readFolder(const PendingFolder& folder) //throw FileError
{
    std::vector<FileInfo> files;
    std::vector<FolderInfo> subFolders;

    traverseFolder(folder.folderPath,
    [&](const FileInfo& fi)
    {
        if (!isHiddenItem(fi.itemName))
            files.push_back(fi);
    },
    [&](const FolderInfo& fi)
    {
        if (!isHiddenItem(fi.itemName))
            subFolders.push_back(fi);
    },
    nullptr /*onSymlink*/,
    [&](const FileError& e) //single item only: keep the rest of the folder
    {
        if (onItemSkipped_)
            onItemSkipped_(e);
    }); //throw FileError

    std::sort(files.begin(), files.end(), [](const FileInfo& lhs, const FileInfo& rhs) { return lhs.itemName < rhs.itemName; });
    std::sort(subFolders.begin(), subFolders.end(), [](const FolderInfo& lhs, const FolderInfo& rhs) { return lhs.itemName < rhs.itemName; });

    for (const FileInfo& fi : files)
        pendingFiles_.push_back({fi.fullPath, appendPath(folder.relPath, fi.itemName), fi.fileSize});

    //push in reverse: first subfolder is traversed next
    for (auto it = subFolders.rbegin(); it != subFolders.rend(); ++it)
        pendingFolders_.push_back({it->fullPath, appendPath(folder.relPath, it->itemName)});
}


std::optional<UploadTask> PathEnumerator::getNext()
{
    while (pendingFiles_.empty())
    {
        if (pendingFolders_.empty())
            return std::nullopt;

        const PendingFolder folder = std::move(pendingFolders_.back());
        pendingFolders_.pop_back();
        try
        {
            readFolder(folder); //throw FileError
        }
        catch (const FileError& e)
        {
            if (onItemSkipped_)
                onItemSkipped_(e);
        }
    }

    UploadTask task = std::move(pendingFiles_.front());
    pendingFiles_.pop_front();
    return task;
}


std::vector<UploadTask> cymo::listUploadTasks(const Zstring& rootPath, const std::function<void(const FileError& e)>& onItemSkipped) //throw FileError
{
    std::vector<UploadTask> tasks;

    PathEnumerator enumerator(rootPath, onItemSkipped); //throw FileError
    while (std::optional<UploadTask> task = enumerator.getNext())
        tasks.push_back(std::move(*task));

    return tasks;
}
