// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef WORK_PARTITION_H_0934857103948571
#define WORK_PARTITION_H_0934857103948571

#include <optional>
#include "upload_task.h"


namespace cymo
{
/*  split into contiguous shares preserving the original order:
    - share count: min(workerCount, tasks.size()), at least 1 worker; no tasks => no shares
    - the first "tasks.size() % shareCount" shares get one task more than the rest       */
std::vector<WorkShare> partitionWork(std::vector<UploadTask>&& tasks, size_t workerCount);

//explicit thread count or detected parallelism; always >= 1
size_t getWorkerCount(const std::optional<size_t>& threadCount);
}

#endif //WORK_PARTITION_H_0934857103948571
