// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef UPLOAD_TASK_H_3178940562394857203
#define UPLOAD_TASK_H_3178940562394857203

#include <vector>
#include <zen/zstring.h>


namespace cymo
{
struct UploadTask
{
    Zstring localPath; //absolute or relative to working directory
    Zstring relPath;   //relative to scan root, FILE_NAME_SEPARATOR-delimited
    uint64_t fileSize = 0;
};


//contiguous slice of the task list assigned to exactly one session
struct WorkShare
{
    std::vector<UploadTask> tasks;
};


struct SessionOutcome
{
    size_t uploadedCount = 0;
    uint64_t bytesUploaded = 0;
    std::vector<UploadTask> failedTasks; //in processing order
};


struct UploadReport
{
    size_t filesFound    = 0;
    size_t filesUploaded = 0;
    size_t filesFailed   = 0;
    uint64_t bytesUploaded = 0;
    std::vector<UploadTask> failedTasks;
};
}

#endif //UPLOAD_TASK_H_3178940562394857203
