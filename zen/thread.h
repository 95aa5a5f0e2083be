// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef THREAD_H_7896323423432235246427
#define THREAD_H_7896323423432235246427

#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include "zstring.h"


namespace zen
{
void setCurrentThreadName(const Zstring& threadName); //visible in "top -H" and debuggers

bool runningOnMainThread();


//run "fun" on a new detached thread: unlike std::async the returned future does not block in its destructor
//exceptions thrown by "fun" are rethrown by future::get()
template <class Function>
auto runAsync(Function&& fun)
{
    using FunType    = std::decay_t<Function>;
    using ResultType = std::invoke_result_t<FunType&>;

    //std::packaged_task wants a copy-constructible callable: share move-only ones (e.g. capturing a std::future)
    auto sharedFun = std::make_shared<FunType>(std::forward<Function>(fun));

    std::packaged_task<ResultType()> task([sharedFun] { return (*sharedFun)(); });
    std::future<ResultType> result = task.get_future();

    std::thread(std::move(task)).detach(); //a joinable std::thread would std::terminate() on destruction
    return result;
}


//a value that is only reachable while holding its mutex
template <class T>
class Protected
{
public:
    Protected() {}

    template <class Function>
    auto access(Function fun) //fun: T& -> X
    {
        std::lock_guard dummy(lock_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lock_;
    T value_{};
};
}

#endif //THREAD_H_7896323423432235246427
