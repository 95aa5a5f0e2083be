// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include "file_error.h"


namespace zen
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError

uint64_t getFileSize(const Zstring& filePath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857
