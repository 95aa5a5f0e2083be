// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "upload_session.h"
#include <algorithm>
#include <vector>
#include <zen/file_io.h>
#include <zen/file_path.h>

using namespace zen;
using namespace cymo;


UploadSession::UploadSession(size_t sessionNo,
                             const UploadConfig& cfg,
                             FtpConnector& connector,
                             const TransferModeClassifier& classifier,
                             PhaseCallback& callback) :
    cfg_(cfg),
    connector_(connector),
    classifier_(classifier),
    cb_(L"[" + _("Session") + L' ' + numberTo<std::wstring>(sessionNo) + L"] ", callback) {}


SessionOutcome UploadSession::run(WorkShare&& share) //throw X
{
    SessionOutcome outcome;

    try
    {
        openSession(); //throw FileError
    }
    catch (const FileError& e)
    {
        cb_.logMessage(e.toString(), PhaseCallback::MsgType::error); //throw X
        closeSession(); //throw X

        outcome.failedTasks = std::move(share.tasks);
        return outcome;
    }

    for (const UploadTask& task : share.tasks)
    {
        const std::wstring errorMsg = tryReportingError([&] { uploadFile(task); /*throw FileError*/ },
        AutoRetry{cfg_.autoRetryCount, cfg_.autoRetryDelay}, cb_); //throw X
        if (errorMsg.empty())
        {
            ++outcome.uploadedCount;
            outcome.bytesUploaded += task.fileSize;
            cb_.updateDataProcessed(1, static_cast<int64_t>(task.fileSize)); //noexcept!
        }
        else
            outcome.failedTasks.push_back(task);
    }

    closeSession(); //throw X
    return outcome;
}


void UploadSession::openSession() //throw FileError
{
    const std::wstring serverDisplay = utfTo<std::wstring>(cfg_.login.server);
    try
    {
        cb_.updateStatus(replaceCpy(_("Connecting to %x..."), L"%x", fmtPath(serverDisplay)));

        transport_ = connector_.connect(cfg_.login); //throw SysError  => Connected

        if (cfg_.credentials)
            transport_->login(cfg_.credentials->username, cfg_.credentials->password); //throw SysError, SysErrorPassword  => Authenticated
    }
    catch (const SysErrorPassword& e) { throw FileError(replaceCpy(_("Login to server %x failed."), L"%x", fmtPath(serverDisplay)), e.toString()); }
    catch (const SysError&         e) { throw FileError(replaceCpy(_("Unable to connect to %x."),  L"%x", fmtPath(serverDisplay)), e.toString()); }

    const std::wstring errorMsg = replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(cfg_.remoteRootPath));
    try
    {
        std::optional<Zstring> workDir = transport_->changeDirectory(cfg_.remoteRootPath); //throw SysError
        if (!workDir)
            throw SysError(_("The remote upload folder does not exist."));

        remoteRootPath_ = *workDir; //=> Ready
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    dirState_.currentDir = remoteRootPath_;
    dirState_.confirmedDirs.insert(remoteRootPath_);

    cb_.logMessage(replaceCpy(_("Remote working directory: %x"), L"%x", fmtPath(remoteRootPath_)), PhaseCallback::MsgType::info); //throw X
}


void UploadSession::uploadFile(const UploadTask& task) //throw FileError
{
    //=> Mirroring
    const std::optional<Zstring> relParentPath = getParentFolderPath(task.relPath);
    ensureRemotePath(*transport_, dirState_, relParentPath ? *relParentPath : Zstring(), remoteRootPath_); //throw FileError

    //=> Transferring
    const Zstring fileName = getItemName(task.relPath);
    const Zstring targetPath = appendPath(dirState_.currentDir, fileName);

    cb_.updateStatus(replaceCpy(_("Uploading file %x..."), L"%x", fmtPath(targetPath)));

    FileInput fileIn(task.localPath); //throw FileError

    //sniff the transfer mode from the first bytes; they are sent first when streaming
    std::vector<char> prefix(classifier_.getSampleSize());
    prefix.resize(fileIn.read(prefix)); //throw FileError

    const TransferMode mode = classifier_.classify(prefix);

    size_t prefixPos = 0;
    const ReadBlockFun readBlock = [&](std::span<char> buffer) //throw FileError
    {
        size_t bytesRead = 0;
        if (prefixPos < prefix.size())
        {
            bytesRead = std::min(buffer.size(), prefix.size() - prefixPos);
            std::copy(prefix.begin() + prefixPos, prefix.begin() + prefixPos + bytesRead, buffer.begin());
            prefixPos += bytesRead;
        }
        if (bytesRead < buffer.size())
            bytesRead += fileIn.read(buffer.subspan(bytesRead)); //throw FileError
        return bytesRead;
    };

    try
    {
        transport_->storeFile(fileName, mode, readBlock); //throw SysError, FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetPath)), e.toString()); }

    fileIn.close(); //throw FileError
}


void UploadSession::closeSession() //throw X
{
    if (transport_)
    {
        try
        {
            transport_->close(); //throw SysError  => Closed
        }
        catch (const SysError& e)
        {
            cb_.logMessage(replaceCpy(_("Cannot close connection to %x."), L"%x", fmtPath(cfg_.login.server)) + L"\n" + e.toString(),
                           PhaseCallback::MsgType::warning); //throw X
        }
        transport_.reset();
    }
    cb_.updateStatus(std::wstring());
}
