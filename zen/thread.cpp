// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace zen;


void zen::setCurrentThreadName(const Zstring& threadName)
{
    ::prctl(PR_SET_NAME, threadName.substr(0, 15).c_str(), 0, 0, 0); //kernel limit: 16 bytes including the null terminator
}


namespace
{
//initialized before main() runs: by the thread that later calls main()
const std::thread::id mainThreadId = std::this_thread::get_id();
}


bool zen::runningOnMainThread()
{
    return mainThreadId == std::thread::id() /*static initialization still running*/ ||
           mainThreadId == std::this_thread::get_id();
}
