// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "file_path.h"

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    Zstring path = itemPath;
    while (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos || path == Zstr("/"))
        return std::nullopt;

    if (pos == 0)
        return Zstring(Zstr("/"));
    return path.substr(0, pos);
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath; //with or without path separator, e.g. "/" or "/folder"

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size()); //append all three strings using a single memory allocation
    return std::move(output) + FILE_NAME_SEPARATOR + relPath;
}
