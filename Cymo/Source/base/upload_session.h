// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef UPLOAD_SESSION_H_8923475012938475
#define UPLOAD_SESSION_H_8923475012938475

#include <memory>
#include "dir_mirror.h"
#include "status_handler_impl.h"
#include "structures.h"
#include "transfer_mode.h"
#include "upload_task.h"


namespace cymo
{
/*  one worker's connection to the server:

      Idle -> Connected -> Authenticated -> Ready -> (Mirroring -> Transferring)* -> Closed

    - failure to connect, log in or enter the remote root is fatal for the session: all tasks of the share fail
    - a failing file is retried "autoRetryCount" times, then recorded as failed; the session continues
    - every task ends up either uploaded or failed                                                      */
class UploadSession
{
public:
    UploadSession(size_t sessionNo, //1-based, for log messages only
                  const UploadConfig& cfg,
                  FtpConnector& connector,
                  const TransferModeClassifier& classifier,
                  PhaseCallback& callback /*throw X*/);

    SessionOutcome run(WorkShare&& share); //throw X

private:
    UploadSession           (const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    void openSession();                      //throw FileError
    void uploadFile(const UploadTask& task); //throw FileError
    void closeSession();                     //throw X

    const UploadConfig& cfg_;
    FtpConnector& connector_;
    const TransferModeClassifier& classifier_;
    PrefixedCallback cb_;

    std::unique_ptr<FtpTransport> transport_;
    Zstring remoteRootPath_; //as reported by the server
    RemoteDirectoryState dirState_;
};
}

#endif //UPLOAD_SESSION_H_8923475012938475
