// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef DIR_MIRROR_H_2390847120938475
#define DIR_MIRROR_H_2390847120938475

#include <unordered_set>
#include <zen/file_error.h>
#include "../afs/ftp_transport.h"


namespace cymo
{
//per session: never shared between sessions
struct RemoteDirectoryState
{
    Zstring currentDir; //server path of the working directory
    std::unordered_set<Zstring> confirmedDirs; //server paths known to exist
};


/*  make "remoteRootPath/relFolderPath" the working directory, creating missing folders level by level
    - no-op if already the working directory
    - folders confirmed earlier in this session are not entered again
    - relFolderPath: relative, FILE_NAME_SEPARATOR-delimited; empty for the root itself        */
void ensureRemotePath(FtpTransport& transport, RemoteDirectoryState& dirState, const Zstring& relFolderPath, const Zstring& remoteRootPath); //throw FileError
}

#endif //DIR_MIRROR_H_2390847120938475
