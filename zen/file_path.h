// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "zstring.h"


namespace zen
{
const Zchar FILE_NAME_SEPARATOR = '/';

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or single item name
inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

//relPath: no leading, trailing or duplicate separators
Zstring appendPath(const Zstring& basePath, const Zstring& relPath);
}

#endif //FILE_PATH_H_3984678473567247567
