// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef ORCHESTRATOR_H_5098234756109283
#define ORCHESTRATOR_H_5098234756109283

#include "process_callback.h"
#include "structures.h"
#include "transfer_mode.h"
#include "upload_task.h"


namespace cymo
{
/*  upload the local tree "cfg.localRootPath" to "cfg.remoteRootPath":
      1. enumerate the local files
      2. partition them into one share per worker
      3. run one UploadSession per share, each on its own thread
      4. collect the outcomes: filesUploaded + filesFailed == filesFound

    only a failure to enumerate the local root throws; everything else ends up in the report   */
UploadReport runUpload(const UploadConfig& cfg,
                       FtpConnector& connector,
                       const TransferModeClassifier& classifier,
                       PhaseCallback& callback /*throw X*/); //throw FileError, X
}

#endif //ORCHESTRATOR_H_5098234756109283
