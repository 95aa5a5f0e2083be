// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef STRUCTURES_H_8210478915019450901745
#define STRUCTURES_H_8210478915019450901745

#include <chrono>
#include <optional>
#include <zen/zstring.h>
#include "../afs/ftp_transport.h"


namespace cymo
{
struct FtpCredentials
{
    Zstring username;
    Zstring password;
};


//constructed once, then passed by const reference to orchestrator and sessions
struct UploadConfig
{
    Zstring remoteRootPath; //absolute or relative to the login folder
    Zstring localRootPath;  //folder or single file

    FtpLogin login;
    std::optional<FtpCredentials> credentials; //none: anonymous

    size_t autoRetryCount = 0;
    std::chrono::seconds autoRetryDelay{5};

    std::optional<size_t> threadCount; //none: detect parallelism

    bool binaryOnly = false; //skip text/binary detection
};
}

#endif //STRUCTURES_H_8210478915019450901745
