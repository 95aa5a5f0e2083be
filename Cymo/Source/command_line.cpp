// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "command_line.h"
#include <algorithm>
#include <zen/file_path.h>

using namespace zen;
using namespace cymo;


namespace
{
const wchar_t TAB_SPACE[] = L"    ";

struct CommandLineOption
{
    const char* shortName; //optional
    const char* longName;
    bool hasValue;
};

const CommandLineOption optionRemotePath {"-r", "--remote-path", true};
const CommandLineOption optionLocalPath  {"-l", "--local-path",  true};
const CommandLineOption optionServer     {"-s", "--server",      true};
const CommandLineOption optionUsername   {"-u", "--username",    true};
const CommandLineOption optionPassword   {"-p", "--password",    true};
const CommandLineOption optionPort       {nullptr, "--port",        true};
const CommandLineOption optionRetry      {nullptr, "--retry",       true};
const CommandLineOption optionRetryDelay {nullptr, "--retry-delay", true};
const CommandLineOption optionThread     {"-t", "--thread",      true};
const CommandLineOption optionTimeout    {nullptr, "--timeout",     true};
const CommandLineOption optionTls        {nullptr, "--tls",         false};
const CommandLineOption optionBinary     {nullptr, "--binary",      false};
const CommandLineOption optionLogFile    {nullptr, "--log-file",    true};
const CommandLineOption optionHelp       {"-h", "--help",        false};
const CommandLineOption optionVersion    {"-V", "--version",     false};

const CommandLineOption* const allOptions[] =
{
    &optionRemotePath, &optionLocalPath, &optionServer, &optionUsername, &optionPassword,
    &optionPort, &optionRetry, &optionRetryDelay, &optionThread, &optionTimeout,
    &optionTls, &optionBinary, &optionLogFile, &optionHelp, &optionVersion,
};


bool matchesOption(const Zstring& arg, const CommandLineOption& opt)
{
    return (opt.shortName && arg == opt.shortName) || arg == opt.longName;
}


std::wstring getOptionLabel(const CommandLineOption& opt)
{
    return utfTo<std::wstring>(opt.longName);
}


//"--port=21" => "--port", "21"
std::pair<Zstring, std::optional<Zstring>> splitInlineValue(const Zstring& arg)
{
    if (startsWith(arg, Zstr("--")) && contains(arg, Zstr('=')))
        return {beforeFirst(arg, Zstr('='), IfNotFoundReturn::all),
                afterFirst (arg, Zstr('='), IfNotFoundReturn::none)};
    return {arg, std::nullopt};
}


template <class Num>
Num parseNumber(const Zstring& value, const CommandLineOption& opt, Num minValue, Num maxValue) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Invalid value %y for option %x."),
                                                        L"%x", getOptionLabel(opt)),
                                             L"%y", fmtPath(value));
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c); }) || value.size() > 9)
        throw FileError(errorMsg, _("Expected a non-negative integer number."));

    const Num number = stringTo<Num>(value);
    if (number < minValue || number > maxValue)
        throw FileError(errorMsg, replaceCpy(replaceCpy(_("Allowed range: %x - %y"),
                                                        L"%x", numberTo<std::wstring>(minValue)),
                                             L"%y", numberTo<std::wstring>(maxValue)));
    return number;
}


Zstring normalizeRemotePath(const Zstring& remotePath) //throw FileError
{
    for (const Zchar c : remotePath)
        if (c == Zstr('\r') || c == Zstr('\n') || c == Zstr('\0'))
            throw FileError(replaceCpy(replaceCpy(_("Invalid value %y for option %x."),
                                                  L"%x", getOptionLabel(optionRemotePath)),
                                       L"%y", fmtPath(remotePath)),
                            _("Line breaks are not allowed in FTP paths."));

    //relative paths are kept: the server resolves them against the login folder
    const bool absolutePath = startsWith(remotePath, FILE_NAME_SEPARATOR);

    Zstring output;
    for (const Zstring& comp : splitCpy(remotePath, FILE_NAME_SEPARATOR, SplitOnEmpty::skip))
        output = output.empty() && !absolutePath ? comp : output + FILE_NAME_SEPARATOR + comp;

    if (output.empty())
    {
        if (!absolutePath)
            throw FileError(replaceCpy(_("Missing value for option %x."), L"%x", getOptionLabel(optionRemotePath)));
        output = FILE_NAME_SEPARATOR;
    }
    return output;
}
}


CommandLineRequest cymo::parseCommandLine(const std::vector<Zstring>& args) //throw FileError
{
    CommandLineRequest req;

    std::optional<Zstring> remotePath;
    std::optional<Zstring> localPath;
    std::optional<Zstring> server;
    std::optional<Zstring> username;
    std::optional<Zstring> password;

    for (auto it = args.begin(); it != args.end(); ++it)
    {
        const auto [arg, inlineValue] = splitInlineValue(*it);

        auto itOpt = std::find_if(std::begin(allOptions), std::end(allOptions), [&arg = arg](const CommandLineOption* opt) { return matchesOption(arg, *opt); });
        if (itOpt == std::end(allOptions))
            throw FileError(replaceCpy(_("Unknown command line option %x."), L"%x", fmtPath(*it)));

        const CommandLineOption& opt = **itOpt;

        Zstring value;
        if (opt.hasValue)
        {
            if (inlineValue)
                value = *inlineValue;
            else if (++it != args.end())
                value = *it;
            else
                throw FileError(replaceCpy(_("Missing value for option %x."), L"%x", getOptionLabel(opt)));
        }
        else if (inlineValue)
            throw FileError(replaceCpy(_("Option %x does not take a value."), L"%x", getOptionLabel(opt)));

        if (&opt == &optionRemotePath)
            remotePath = value;
        else if (&opt == &optionLocalPath)
            localPath = value;
        else if (&opt == &optionServer)
            server = value;
        else if (&opt == &optionUsername)
            username = value;
        else if (&opt == &optionPassword)
            password = value;
        else if (&opt == &optionPort)
            req.cfg.login.port = parseNumber<int>(value, opt, 1, 65535); //throw FileError
        else if (&opt == &optionRetry)
            req.cfg.autoRetryCount = parseNumber<size_t>(value, opt, 0, 1000); //throw FileError
        else if (&opt == &optionRetryDelay)
            req.cfg.autoRetryDelay = std::chrono::seconds(parseNumber<int>(value, opt, 0, 3600)); //throw FileError
        else if (&opt == &optionThread)
            req.cfg.threadCount = parseNumber<size_t>(value, opt, 1, 1000); //throw FileError
        else if (&opt == &optionTimeout)
            req.cfg.login.timeoutSec = parseNumber<int>(value, opt, 1, 3600); //throw FileError
        else if (&opt == &optionTls)
            req.cfg.login.useTls = true;
        else if (&opt == &optionBinary)
            req.cfg.binaryOnly = true;
        else if (&opt == &optionLogFile)
        {
            if (trimCpy(value).empty())
                throw FileError(replaceCpy(_("Missing value for option %x."), L"%x", getOptionLabel(opt)));
            req.logFilePath = value;
        }
        else if (&opt == &optionHelp)
            req.showHelp = true;
        else if (&opt == &optionVersion)
            req.showVersion = true;
        else
            assert(false);
    }

    if (req.showHelp || req.showVersion)
        return req;

    auto checkRequired = [](const std::optional<Zstring>& value, const CommandLineOption& opt) //throw FileError
    {
        if (!value)
            throw FileError(replaceCpy(_("Missing required option %x."), L"%x", getOptionLabel(opt)));
        if (trimCpy(*value).empty())
            throw FileError(replaceCpy(_("Missing value for option %x."), L"%x", getOptionLabel(opt)));
    };
    checkRequired(remotePath, optionRemotePath); //throw FileError
    checkRequired(localPath,  optionLocalPath);  //
    checkRequired(server,     optionServer);     //

    req.cfg.remoteRootPath = normalizeRemotePath(*remotePath); //throw FileError
    req.cfg.localRootPath  = *localPath;
    req.cfg.login.server   = trimCpy(*server);

    //trailing separator is not part of the item name
    if (req.cfg.localRootPath.size() > 1 && endsWith(req.cfg.localRootPath, FILE_NAME_SEPARATOR))
        req.cfg.localRootPath = beforeLast(req.cfg.localRootPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);

    if (username && password)
        req.cfg.credentials = FtpCredentials{*username, *password};
    else if (username)
        throw FileError(replaceCpy(_("Missing required option %x."), L"%x", getOptionLabel(optionPassword)),
                        replaceCpy(_("Option %x requires a user name and a password."), L"%x", getOptionLabel(optionUsername)));
    else if (password)
        throw FileError(replaceCpy(_("Missing required option %x."), L"%x", getOptionLabel(optionUsername)),
                        replaceCpy(_("Option %x requires a user name and a password."), L"%x", getOptionLabel(optionPassword)));
    return req;
}


std::wstring cymo::getSyntaxHelp()
{
    return _("Upload a local folder to an FTP server using multiple parallel sessions.") + L"\n\n" +
           _("Syntax:") + L"\n" +
           TAB_SPACE + L"cymo -r <" + _("remote path") + L"> -l <" + _("local path") + L"> -s <" + _("server") + L"> [" + _("options") + L"]\n\n" +
           _("Options:") + L"\n" +
           TAB_SPACE + L"-r, --remote-path <path>  " + _("Remote folder on the FTP server where files will be uploaded") + L'\n' +
           TAB_SPACE + L"-l, --local-path <path>   " + _("Local folder or file to upload") + L'\n' +
           TAB_SPACE + L"-s, --server <host>       " + _("FTP server address or host name") + L'\n' +
           TAB_SPACE + L"-u, --username <name>     " + _("User name (requires password; default: anonymous)") + L'\n' +
           TAB_SPACE + L"-p, --password <pass>     " + _("Password (requires user name)") + L'\n' +
           TAB_SPACE + L"    --port <n>            " + _("Server port (default: 21)") + L'\n' +
           TAB_SPACE + L"    --retry <n>           " + _("Retries per failed file (default: 0)") + L'\n' +
           TAB_SPACE + L"    --retry-delay <sec>   " + _("Delay between retries (default: 5)") + L'\n' +
           TAB_SPACE + L"-t, --thread <n>          " + _("Number of parallel sessions (default: number of CPU cores)") + L'\n' +
           TAB_SPACE + L"    --timeout <sec>       " + _("Network timeout (default: 10)") + L'\n' +
           TAB_SPACE + L"    --tls                 " + _("Use explicit FTPS for control and data connections") + L'\n' +
           TAB_SPACE + L"    --binary              " + _("Always use binary transfer mode") + L'\n' +
           TAB_SPACE + L"    --log-file <path>     " + _("Save the log to a text file") + L'\n' +
           TAB_SPACE + L"-h, --help                " + _("Show this help") + L'\n' +
           TAB_SPACE + L"-V, --version             " + _("Show version") + L"\n\n" +
           _("Example:") + L"\n" +
           TAB_SPACE + L"cymo -r /ftp/upload -l /local/files -s ftp.example.com -u <name> -p <password>\n";
}
