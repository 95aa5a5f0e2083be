// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "dir_mirror.h"
#include <optional>
#include <zen/file_path.h>

using namespace zen;
using namespace cymo;


namespace
{
void enterOrCreateFolder(FtpTransport& transport, const Zstring& folderPath) //throw FileError
{
    try
    {
        if (transport.changeDirectory(folderPath)) //throw SysError
            return;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(folderPath)), e.toString()); }

    //another session may create the same folder concurrently => MKD fails, but CWD succeeds
    std::optional<SysError> mkdError;
    try
    {
        transport.makeDirectory(folderPath); //throw SysError
    }
    catch (const SysError& e) { mkdError = e; }

    try
    {
        if (transport.changeDirectory(folderPath)) //throw SysError
            return;

        if (mkdError)
            throw *mkdError;
        throw SysError(_("The folder was created but cannot be accessed."));
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(folderPath)), e.toString()); }
}
}


void cymo::ensureRemotePath(FtpTransport& transport, RemoteDirectoryState& dirState, const Zstring& relFolderPath, const Zstring& remoteRootPath) //throw FileError
{
    const Zstring targetPath = appendPath(remoteRootPath, relFolderPath);

    if (targetPath == dirState.currentDir)
        return;

    //walk down from the root: most FTP servers cannot create nested folders in one go
    Zstring folderPath = remoteRootPath;
    const std::vector<Zstring> relComponents = splitCpy(relFolderPath, FILE_NAME_SEPARATOR, SplitOnEmpty::skip);

    for (size_t i = 0; i <= relComponents.size(); ++i)
    {
        if (i > 0)
            folderPath = appendPath(folderPath, relComponents[i - 1]);

        const bool lastLevel = i == relComponents.size();

        //confirmed folders need no round trip, except for the final one: it must become the working directory
        if (!lastLevel && dirState.confirmedDirs.contains(folderPath))
            continue;

        enterOrCreateFolder(transport, folderPath); //throw FileError
        dirState.confirmedDirs.insert(folderPath);
        dirState.currentDir = folderPath;
    }
}
