// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILER_TRAVERSER_H_127463214871234
#define FILER_TRAVERSER_H_127463214871234

#include <functional>
#include "file_error.h"

namespace zen
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
};

//- non-recursive
//- regular files only: pipes, sockets and devices are not reported
//- onItemError: failed to get data for a single item; the remaining items are still reported
//  if not set, the error is thrown and ends the traversal
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,     /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,   /*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink,  /*optional*/
                    const std::function<void(const FileError&    e)>& onItemError /*optional*/); //throw FileError
}

#endif //FILER_TRAVERSER_H_127463214871234
