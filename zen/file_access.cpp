// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "file_access.h"
#include <sys/stat.h>

using namespace zen;


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        struct stat itemInfo = {};
        if (::lstat(itemPath.c_str(), &itemInfo) != 0)
            THROW_LAST_SYS_ERROR("lstat");

        if (S_ISLNK(itemInfo.st_mode))
            return ItemType::symlink;
        if (S_ISDIR(itemInfo.st_mode))
            return ItemType::folder;
        return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString()); }
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
