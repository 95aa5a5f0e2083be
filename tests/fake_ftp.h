// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef FAKE_FTP_H_2093847502938475
#define FAKE_FTP_H_2093847502938475

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <zen/file_path.h>
#include "afs/ftp_transport.h"
#include "base/process_callback.h"


namespace cymo::test
{
//in-memory FTP server: thread-safe, shared by all sessions of a run
class FakeFtpServer
{
public:
    FakeFtpServer() { dirs_.insert(Zstr("/")); }

    struct StoredFile
    {
        std::string content;
        TransferMode mode = TransferMode::binary;
    };

    //------------ setup ------------
    void addFolder(const Zstring& serverPath)
    {
        std::lock_guard dummy(lock_);
        for (Zstring path = serverPath; path != Zstr("/"); path = parentOf(path))
            dirs_.insert(path);
    }
    //initial working directory of each connection
    void setLoginFolder(const Zstring& serverPath)
    {
        addFolder(serverPath);
        std::lock_guard dummy(lock_);
        loginFolder_ = serverPath;
    }
    Zstring getLoginFolder() const { std::lock_guard dummy(lock_); return loginFolder_; }

    void setCredentials(const Zstring& username, const Zstring& password)
    {
        std::lock_guard dummy(lock_);
        credentials_ = {username, password};
    }
    void failConnects(size_t count) { std::lock_guard dummy(lock_); connectFailures_ = count; }

    //next "count" uploads to "serverPath" fail; count == -1: always
    void failStores(const Zstring& serverPath, size_t count) { std::lock_guard dummy(lock_); storeFailures_[serverPath] = count; }

    void failMakeDirectory(const Zstring& serverPath) { std::lock_guard dummy(lock_); mkdFailures_.insert(serverPath); }

    void failClose() { std::lock_guard dummy(lock_); closeFails_ = true; }

    //------------ inspection ------------
    std::vector<std::string> getCommandLog() const { std::lock_guard dummy(lock_); return commandLog_; }
    std::map<Zstring, StoredFile> getFiles() const { std::lock_guard dummy(lock_); return files_; }
    std::set<Zstring> getFolders() const { std::lock_guard dummy(lock_); return dirs_; }
    size_t getConnectCount() const { std::lock_guard dummy(lock_); return connectCount_; }
    size_t getCloseCount  () const { std::lock_guard dummy(lock_); return closeCount_; }
    size_t getStoreAttempts(const Zstring& serverPath) const
    {
        std::lock_guard dummy(lock_);
        auto it = storeAttempts_.find(serverPath);
        return it == storeAttempts_.end() ? 0 : it->second;
    }

    //------------ FTP commands ------------
    void connect() //throw SysError
    {
        std::lock_guard dummy(lock_);
        ++connectCount_;
        if (connectFailures_ > 0)
        {
            --connectFailures_;
            throw zen::SysError(L"Connection refused");
        }
    }

    void login(const Zstring& username, const Zstring& password) //throw SysErrorPassword
    {
        std::lock_guard dummy(lock_);
        commandLog_.push_back("USER " + username);
        if (credentials_ && (credentials_->first != username || credentials_->second != password))
            throw SysErrorPassword(L"530 Login incorrect.");
    }

    //returns the new absolute working directory
    std::optional<Zstring> changeDirectory(const Zstring& currentDir, const Zstring& serverPath)
    {
        std::lock_guard dummy(lock_);
        commandLog_.push_back("CWD " + serverPath);

        const Zstring absPath = zen::startsWith(serverPath, Zstr('/')) ? serverPath : zen::appendPath(currentDir, serverPath);
        if (!dirs_.contains(absPath))
            return std::nullopt;
        return absPath;
    }

    void makeDirectory(const Zstring& serverPath) //throw SysError
    {
        std::lock_guard dummy(lock_);
        commandLog_.push_back("MKD " + serverPath);

        if (mkdFailures_.contains(serverPath))
            throw SysErrorFtpProtocol(L"550 Permission denied.", 550);
        if (dirs_.contains(serverPath))
            throw SysErrorFtpProtocol(L"550 File exists.", 550);
        if (!dirs_.contains(parentOf(serverPath)))
            throw SysErrorFtpProtocol(L"550 No such file or directory.", 550);
        dirs_.insert(serverPath);
    }

    void storeFile(const Zstring& serverPath, TransferMode mode, const ReadBlockFun& readBlock) //throw SysError, X
    {
        {
            std::lock_guard dummy(lock_);
            commandLog_.push_back("STOR " + serverPath);
            ++storeAttempts_[serverPath];

            if (!dirs_.contains(parentOf(serverPath)))
                throw SysErrorFtpProtocol(L"553 Could not create file.", 553);

            if (auto it = storeFailures_.find(serverPath); it != storeFailures_.end() && it->second > 0)
            {
                if (it->second != static_cast<size_t>(-1))
                    --it->second;
                throw SysErrorFtpProtocol(L"451 Local error in processing.", 451);
            }
        }

        std::string content;
        std::vector<char> buffer(7); //small block size: exercise the streaming
        for (;;)
        {
            const size_t bytesRead = readBlock(buffer); //throw X
            content.append(buffer.data(), bytesRead);
            if (bytesRead < buffer.size())
                break;
        }

        std::lock_guard dummy(lock_);
        files_[serverPath] = {std::move(content), mode};
    }

    void close() //throw SysError
    {
        std::lock_guard dummy(lock_);
        ++closeCount_;
        if (closeFails_)
            throw zen::SysError(L"Connection reset by peer");
    }

private:
    static Zstring parentOf(const Zstring& serverPath)
    {
        const Zstring parent = zen::beforeLast(serverPath, Zstr('/'), zen::IfNotFoundReturn::none);
        return parent.empty() ? Zstr("/") : parent;
    }

    mutable std::mutex lock_;
    std::set<Zstring> dirs_;
    Zstring loginFolder_ = Zstr("/");
    std::map<Zstring, StoredFile> files_;
    std::optional<std::pair<Zstring, Zstring>> credentials_;
    std::vector<std::string> commandLog_;

    size_t connectFailures_ = 0;
    std::map<Zstring, size_t> storeFailures_;
    std::map<Zstring, size_t> storeAttempts_;
    std::set<Zstring> mkdFailures_;
    bool closeFails_ = false;
    size_t connectCount_ = 0;
    size_t closeCount_ = 0;
};


class FakeFtpTransport : public FtpTransport
{
public:
    explicit FakeFtpTransport(FakeFtpServer& server) : server_(server), currentDir_(server.getLoginFolder()) {}

    void login(const Zstring& username, const Zstring& password) override { server_.login(username, password); }

    std::optional<Zstring> changeDirectory(const Zstring& serverPath) override
    {
        const std::optional<Zstring> newDir = server_.changeDirectory(currentDir_, serverPath);
        if (newDir)
            currentDir_ = *newDir;
        return newDir;
    }

    void makeDirectory(const Zstring& serverPath) override { server_.makeDirectory(serverPath); }

    void storeFile(const Zstring& fileName, TransferMode mode, const ReadBlockFun& readBlock) override
    {
        server_.storeFile(zen::appendPath(currentDir_, fileName), mode, readBlock);
    }

    void close() override { server_.close(); }

private:
    FakeFtpServer& server_;
    Zstring currentDir_;
};


class FakeFtpConnector : public FtpConnector
{
public:
    explicit FakeFtpConnector(FakeFtpServer& server) : server_(server) {}

    std::unique_ptr<FtpTransport> connect(const FtpLogin& /*login*/) override
    {
        server_.connect(); //throw SysError
        return std::make_unique<FakeFtpTransport>(server_);
    }

private:
    FakeFtpServer& server_;
};


//single-threaded callback recording everything
class RecordingCallback : public PhaseCallback
{
public:
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { std::lock_guard dummy(lock_); itemsProcessed += itemsDelta; bytesProcessed += bytesDelta; }
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override { std::lock_guard dummy(lock_); itemsTotal     += itemsDelta; bytesTotal     += bytesDelta; }

    void updateStatus(std::wstring&& msg) override { std::lock_guard dummy(lock_); statusMessages.push_back(std::move(msg)); }
    void logMessage(const std::wstring& msg, MsgType type) override { std::lock_guard dummy(lock_); log.emplace_back(msg, type); }

    size_t countMessages(MsgType type) const
    {
        std::lock_guard dummy(lock_);
        return std::count_if(log.begin(), log.end(), [type](const auto& item) { return item.second == type; });
    }

    int     itemsProcessed = 0;
    int64_t bytesProcessed = 0;
    int     itemsTotal = 0;
    int64_t bytesTotal = 0;
    std::vector<std::wstring> statusMessages;
    std::vector<std::pair<std::wstring, MsgType>> log;

private:
    mutable std::mutex lock_;
};
}

#endif //FAKE_FTP_H_2093847502938475
