// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp.h"
#include <algorithm>
#include <fcntl.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <zen/file_error.h>
#include <zen/file_path.h>

using namespace zen;
using namespace cymo;


namespace
{
//server replies as separate lines, CR LF or LF terminated; views into "response"
std::vector<std::string_view> getResponseLines(std::string_view response)
{
    std::vector<std::string_view> lines;
    while (!response.empty())
    {
        const size_t posEnd = response.find_first_of("\r\n");
        if (posEnd != 0)
            lines.push_back(response.substr(0, posEnd));
        if (posEnd == std::string_view::npos)
            break;
        response.remove_prefix(posEnd + 1);
    }
    return lines;
}


std::wstring formatFtpStatus(long sc)
{
    std::wstring statusText;
    switch (sc) //RFC 959 reply codes an upload can run into
    {
        //*INDENT-OFF*
        case 421: statusText = L"Service not available, closing control connection."; break;
        case 425: statusText = L"Cannot open data connection."; break;
        case 426: statusText = L"Connection closed; transfer aborted."; break;
        case 450: statusText = L"File unavailable."; break;
        case 451: statusText = L"Local error in processing."; break;
        case 452: statusText = L"Insufficient storage space."; break;
        case 500: statusText = L"Command not recognized."; break;
        case 501: statusText = L"Syntax error in parameters."; break;
        case 530: statusText = L"Not logged in."; break;
        case 532: statusText = L"Need account for storing files."; break;
        case 550: statusText = L"File unavailable, not found or no access."; break;
        case 552: statusText = L"Exceeded storage allocation."; break;
        case 553: statusText = L"File name not allowed."; break;
        default: break;
        //*INDENT-ON*
    }
    return L"FTP status " + numberTo<std::wstring>(sc) + (statusText.empty() ? L"." : L": " + statusText);
}

//================================================================================================================

//one libcurl easy handle = one control connection, kept open between requests
class FtpSession : public FtpTransport
{
public:
    explicit FtpSession(const FtpLogin& login) : login_(login)
    {
        if (trimCpy(login_.server).empty())
            throw SysError(_("Server name must not be empty."));
    }

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    void login(const Zstring& username, const Zstring& password) override //throw SysError, SysErrorPassword
    {
        username_ = username;
        password_ = password;

        //USER/PASS are sent with the next request: verify now instead of failing on the first upload
        runFtpCommands({"NOOP"}); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    std::optional<Zstring> changeDirectory(const Zstring& serverPath) override //throw SysError
    {
        std::string response;
        try
        {
            response = runFtpCommands({"CWD " + getServerPath(serverPath), "PWD"}); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysErrorFtpProtocol& e)
        {
            if (e.ftpErrorCode == 550) //CWD: no such directory
                return std::nullopt;
            throw;
        }

        currentDir_ = parsePwdResponse(response); //throw SysError
        return currentDir_;
    }

    void makeDirectory(const Zstring& serverPath) override //throw SysError
    {
        runFtpCommands({"MKD " + getServerPath(serverPath)}); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    void storeFile(const Zstring& fileName, TransferMode mode, const ReadBlockFun& readBlock /*throw X*/) override //throw SysError, X
    {
        if (currentDir_.empty())
            throw SysError(L"Contract error: storeFile() called before changeDirectory().");

        //exceptions must not unwind through libcurl: park it and rethrow after curl_easy_perform()
        std::exception_ptr readError;

        auto onReadRequest = [&](char* buffer, size_t bytesRequested) -> size_t
        {
            try
            {
                return readBlock(std::span<char>(buffer, bytesRequested)); //throw X; short count only at end of stream
            }
            catch (...) //rethrown below
            {
                readError = std::current_exception();
                return CURL_READFUNC_ABORT; //=> CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback onReadRequestWrapper = [](char* buffer, size_t size, size_t nitems, void* userData) -> size_t
        {
            return (*static_cast<decltype(onReadRequest)*>(userData))(buffer, size * nitems);
        };

        try
        {
            perform(appendPath(currentDir_, fileName), false /*isDir*/,
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READFUNCTION, onReadRequestWrapper},
                {CURLOPT_READDATA, &onReadRequest},
                {CURLOPT_TRANSFERTEXT, mode == TransferMode::text ? 1L : 0L}, //libcurl switches TYPE A/I only when needed
            }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (readError) //the local file failed, not the server
                std::rethrow_exception(readError);
            throw;
        }
    }

    void close() override //throw SysError
    {
        if (easyHandle_)
        {
            ::curl_easy_cleanup(easyHandle_); //says QUIT if the connection is still up
            easyHandle_ = nullptr;
        }
        currentDir_.clear();
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    //returns the server's replies (header data)
    std::string perform(const Zstring& serverPath, bool isDir, const std::vector<CurlOption>& requestOptions) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        if (easyHandle_)
            ::curl_easy_reset(easyHandle_); //clears the options only: the connection stays open
        else
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        std::string response;

        curl_write_callback onHeaderData = [](char* buffer, size_t size, size_t nitems, void* userData) -> size_t
        {
            static_cast<std::string*>(userData)->append(buffer, size * nitems);
            return size * nitems;
        };

        //libcurl does not set FD_CLOEXEC: https://github.com/curl/curl/issues/2252
        std::optional<SysError> socketError;
        auto onSocketCreate = [&](curl_socket_t curlfd) -> int
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
            {
                socketError = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };
        using SocketCallback = decltype(onSocketCreate);
        using SocketCallbackWrapper = int (*)(SocketCallback* clientp, curl_socket_t curlfd, curlsocktype purpose);
        SocketCallbackWrapper onSocketCreateWrapper = [](SocketCallback* clientp, curl_socket_t curlfd, curlsocktype /*purpose*/)
        {
            return (*clientp)(curlfd);
        };

        const long timeoutSec = login_.timeoutSec;
        const std::string url = getCurlUrlPath(serverPath, isDir); //throw SysError

        std::vector<CurlOption> options
        {
            {CURLOPT_URL, url.c_str()},
            {CURLOPT_PORT, static_cast<long>(login_.port > 0 ? login_.port : DEFAULT_PORT_FTP)},
            {CURLOPT_ERRORBUFFER, curlErrorBuf},
            {CURLOPT_HEADERFUNCTION, onHeaderData},
            {CURLOPT_HEADERDATA, &response},
            {CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper},
            {CURLOPT_SOCKOPTDATA, &onSocketCreate},

            {CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_NOCWD}, //paths are absolute: no CWD round trips
            {CURLOPT_FTP_SKIP_PASV_IP, 0L}, //some servers send a data address different from the control connection
            {CURLOPT_NOSIGNAL, 1L}, //one session per thread

            {CURLOPT_CONNECTTIMEOUT, timeoutSec},
            {CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSec},
            //large files: no limit on the total time, only on stalling (0 bytes/sec would mean "disabled")
            {CURLOPT_LOW_SPEED_LIMIT, 1L},
            {CURLOPT_LOW_SPEED_TIME, timeoutSec},
            {CURLOPT_TCP_KEEPALIVE, 1L}, //control connection is idle during long uploads

            //self-signed certificates are the norm for FTP servers
            {CURLOPT_SSL_VERIFYPEER, 0L},
            {CURLOPT_SSL_VERIFYHOST, 0L},
            {CURLOPT_CAINFO, static_cast<const char*>(nullptr)}, //may be loaded even if not verifying
        };

        if (!username_.empty()) //else: libcurl logs in as "anonymous"
        {
            options.emplace_back(CURLOPT_USERNAME, username_.c_str());
            options.emplace_back(CURLOPT_PASSWORD, password_.c_str());
        }

        if (login_.useTls) //explicit FTPS, RFC 4217: AUTH TLS, then protect control and data connection
        {
            options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
            options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
        }

        options.insert(options.end(), requestOptions.begin(), requestOptions.end());

        for (const CurlOption& opt : options)
            if (const CURLcode rc = ::curl_easy_setopt(easyHandle_, opt.option, opt.value);
                rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(opt.option)) + ')',
                                                 formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));

        const CURLcode rcPerform = ::curl_easy_perform(easyHandle_); //reply codes >= 400 are errors

        if (socketError)
            throw *socketError;

        if (rcPerform != CURLE_OK)
            throwPerformError(rcPerform, curlErrorBuf, response); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

        return response;
    }

    [[noreturn]] void throwPerformError(CURLcode rc, const char* curlErrorBuf, const std::string& response) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        std::wstring details = trimCpy(utfTo<std::wstring>(curlErrorBuf));

        //last reply line: the server's own explanation
        if (const std::vector<std::string_view> lines = getResponseLines(response);
            !lines.empty())
            if (const std::string_view lastLine = trimCpy(lines.back());
                !lastLine.empty())
                details += (details.empty() ? L"" : L"\n") + utfTo<std::wstring>(lastLine);

        if (rc == CURLE_LOGIN_DENIED)
            throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rc), details));

        long ftpStatus = 0;
        if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatus) == CURLE_OK &&
            400 <= ftpStatus && ftpStatus < 600)
            throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rc),
                                                        details + (details.empty() ? L"" : L"\n") + formatFtpStatus(ftpStatus)), ftpStatus);

        throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rc), details));
    }

    //commands are sent after login and before the (empty) directory listing request
    std::string runFtpCommands(const std::vector<std::string>& ftpCmds) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        curl_slist* cmdList = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(cmdList));

        for (const std::string& cmd : ftpCmds)
        {
            curl_slist* cmdListNew = ::curl_slist_append(cmdList, cmd.c_str());
            if (!cmdListNew)
                throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
            cmdList = cmdListNew;
        }

        return perform(Zstr("/"), true /*isDir*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, cmdList},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    //FTP command argument: absolute, or relative to the server's current working directory
    static std::string getServerPath(const Zstring& serverPath) //throw SysError
    {
        if (serverPath.empty())
            throw SysError(L"Contract error: empty server path.");

        //a line break would end the command and start another
        if (std::any_of(serverPath.begin(), serverPath.end(), [](Zchar c) { return isLineBreak(c) || c == '\0'; }))
            throw SysError(replaceCpy(_("Invalid character in path %x."), L"%x", fmtPath(serverPath)));

        return utfTo<std::string>(serverPath); //UTF-8: no RFC 2640 negotiation
    }

    std::string getCurlUrlPath(const Zstring& serverPath, bool isDir) //throw SysError
    {
        //URL paths start at the login folder: only absolute paths are unambiguous
        if (!startsWith(serverPath, FILE_NAME_SEPARATOR))
            throw SysError(L"Contract error: absolute server path expected. " + fmtPath(serverPath));

        std::string urlPath;
        for (const std::string& comp : splitCpy(getServerPath(serverPath), '/', SplitOnEmpty::skip)) //throw SysError
        {
            char* compEscaped = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
            if (!compEscaped)
                throw SysError(formatSystemError("curl_easy_escape(" + comp + ')', L"", L"Conversion failure"));
            ZEN_ON_SCOPE_EXIT(::curl_free(compEscaped));

            urlPath += '/';
            urlPath += compEscaped;
        }

        //"ftp://host//abs/path": the double slash makes the path absolute for NOCWD (https://github.com/curl/curl/pull/4382)
        std::string url = "ftp://" + utfTo<std::string>(login_.server) + '/' + urlPath;
        if (urlPath.empty())
            url += '/';

        if (isDir && !endsWith(url, '/')) //directory URLs end with a slash
            url += '/';
        return url;
    }

    const FtpLogin login_;
    Zstring username_; //empty: anonymous
    Zstring password_;

    CURL* easyHandle_ = nullptr;
    Zstring currentDir_;
};


class CurlFtpConnector : public FtpConnector
{
public:
    std::unique_ptr<FtpTransport> connect(const FtpLogin& login) override //throw SysError
    {
        //the control connection is opened by the first request
        return std::make_unique<FtpSession>(login); //throw SysError
    }
};
}


std::unique_ptr<FtpConnector> cymo::createFtpConnector()
{
    return std::make_unique<CurlFtpConnector>();
}


Zstring cymo::parsePwdResponse(const std::string& serverResponse) //throw SysError
{
    //257 "<directory-name>" <commentary>; a double quote inside the name is written twice (RFC 959)
    auto parseDirName = [](std::string_view line) -> std::optional<Zstring>
    {
        const size_t posQuote = line.find('"');
        if (posQuote == std::string_view::npos)
            return std::nullopt;

        Zstring dirName;
        for (size_t i = posQuote + 1; i < line.size(); ++i)
            if (line[i] != '"')
                dirName += line[i];
            else if (i + 1 < line.size() && line[i + 1] == '"')
            {
                dirName += '"';
                ++i;
            }
            else //closing quote
                return dirName;

        return std::nullopt;
    };

    for (const std::string_view line : getResponseLines(serverResponse))
        if (startsWith(line, "257 "))
        {
            if (const std::optional<Zstring> dirPath = parseDirName(line);
                dirPath && startsWith(*dirPath, FILE_NAME_SEPARATOR))
                return *dirPath;
            break;
        }

    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(serverResponse) + L')');
}
