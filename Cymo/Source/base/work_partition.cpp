// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "work_partition.h"
#include <algorithm>
#include <cassert>
#include <iterator>
#include <thread>

using namespace cymo;


std::vector<WorkShare> cymo::partitionWork(std::vector<UploadTask>&& tasks, size_t workerCount)
{
    if (tasks.empty())
        return {};

    const size_t shareCount = std::clamp<size_t>(workerCount, 1, tasks.size());

    const size_t quotient  = tasks.size() / shareCount;
    const size_t remainder = tasks.size() % shareCount;

    std::vector<WorkShare> shares(shareCount);

    auto itTask = tasks.begin();
    for (size_t i = 0; i < shareCount; ++i)
    {
        const size_t shareSize = quotient + (i < remainder ? 1 : 0);

        shares[i].tasks.assign(std::make_move_iterator(itTask),
                               std::make_move_iterator(itTask + shareSize));
        itTask += shareSize;
    }
    assert(itTask == tasks.end());

    tasks.clear(); //moved-from
    return shares;
}


size_t cymo::getWorkerCount(const std::optional<size_t>& threadCount)
{
    if (threadCount)
        return std::max<size_t>(*threadCount, 1);

    return std::max<size_t>(std::thread::hardware_concurrency(), 1); //"returns 0 if not computable"
}
