// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef SYS_ERROR_H_3284791347018951324534
#define SYS_ERROR_H_3284791347018951324534

#include <cerrno>
#include "scope_guard.h" //not used here: included by everyone reporting errors
#include "i18n.h"        //
#include "zstring.h"     //


namespace zen
{
using ErrorCode = int; //errno value

inline ErrorCode getLastError() { return errno; } //errno is a macro: no "::"

//"ENOENT: No such file or directory [open]"
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);


//untranslated low-level detail, wrapped by FileError and friends for the user
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    virtual ~SysError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public zen::SysError { X(const std::wstring& msg) : SysError(msg) {} };


//macro: errno must be read before any other call can overwrite it
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw zen::SysError(formatSystemError(functionName, ecInternal)); } while (false)
}

#endif //SYS_ERROR_H_3284791347018951324534
