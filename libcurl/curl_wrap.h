// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef CURL_WRAP_H_2879058325032785032789645
#define CURL_WRAP_H_2879058325032785032789645

//include from .cpp files only: keep <curl/curl.h> out of the project headers
#include <curl/curl.h>
#include <zen/sys_error.h>


namespace zen
{
//process-wide libcurl state: create on the main thread before the first session, destroy after the last one
class LibcurlScope
{
public:
    LibcurlScope(); //throw SysError
    ~LibcurlScope();

private:
    LibcurlScope           (const LibcurlScope&) = delete;
    LibcurlScope& operator=(const LibcurlScope&) = delete;
};


//type-erased argument for curl_easy_setopt(): long, curl_off_t, pointers and callbacks
struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#endif //CURL_WRAP_H_2879058325032785032789645
