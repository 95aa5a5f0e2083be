// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_TRANSPORT_H_4390784561239784561
#define FTP_TRANSPORT_H_4390784561239784561

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <zen/sys_error.h>


namespace cymo
{
const int DEFAULT_PORT_FTP = 21; //TLS enabled? => same for explicit FTP, but *implicit* FTP uses port 990

struct FtpLogin
{
    Zstring server;
    int port = DEFAULT_PORT_FTP;
    bool useTls = false;
    int timeoutSec = 10;
};


enum class TransferMode
{
    binary,
    text,
};


struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)


//return "buffer.size()" bytes unless end of stream!
using ReadBlockFun = std::function<size_t(std::span<char> buffer)>; //throw X


//one control connection to the server; not thread-safe: owned by a single upload session
class FtpTransport
{
public:
    virtual ~FtpTransport() {}

    virtual void login(const Zstring& username, const Zstring& password) = 0; //throw SysError, SysErrorPassword

    //serverPath: absolute, or relative to the current working directory (initially the login folder)
    //returns the new working directory as reported by the server (absolute), or none if not existing
    virtual std::optional<Zstring> changeDirectory(const Zstring& serverPath) = 0; //throw SysError

    virtual void makeDirectory(const Zstring& serverPath /*absolute*/) = 0; //throw SysError

    //store in current working directory
    virtual void storeFile(const Zstring& fileName, TransferMode mode, const ReadBlockFun& readBlock /*throw X*/) = 0; //throw SysError, X

    virtual void close() = 0; //throw SysError
};


class FtpConnector
{
public:
    virtual ~FtpConnector() {}

    //called concurrently by all upload sessions
    virtual std::unique_ptr<FtpTransport> connect(const FtpLogin& login) = 0; //throw SysError
};
}

#endif //FTP_TRANSPORT_H_4390784561239784561
