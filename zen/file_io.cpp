// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "file_io.h"
#include <cstdio>   //rename
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace zen;


FileInput::FileInput(const Zstring& filePath) : filePath_(filePath) //throw FileError
{
    try
    {
        //open() blocks on a named pipe => only regular files are read
        struct stat itemInfo = {};
        if (::stat(filePath.c_str(), &itemInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(itemInfo.st_mode))
            throw SysError(_("Unsupported item type.") + L" [" + numberTo<std::wstring>(itemInfo.st_mode & S_IFMT) + L']');

        fd_ = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1)
            THROW_LAST_SYS_ERROR("open");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }

    //whole file is read front to back; posix_fadvise() returns the error instead of setting errno
    if (const int ec = ::posix_fadvise(fd_, 0 /*offset*/, 0 /*len: until EOF*/, POSIX_FADV_SEQUENTIAL); ec != 0)
    {
        ::close(fd_);
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), formatSystemError("posix_fadvise", ec));
    }
}


FileInput::~FileInput()
{
    if (fd_ != -1) //input only: nothing is lost when close() fails here
        ::close(fd_);
}


size_t FileInput::read(std::span<char> buffer) //throw FileError
{
    try
    {
        if (fd_ == -1)
            throw SysError(L"Contract error: read() called after close().");

        size_t bytesRead = 0;
        while (bytesRead < buffer.size())
        {
            const ssize_t rv = ::read(fd_, buffer.data() + bytesRead, buffer.size() - bytesRead);
            if (rv < 0)
            {
                if (errno == EINTR)
                    continue;
                THROW_LAST_SYS_ERROR("read");
            }
            if (rv == 0) //EOF
                break;

            bytesRead += static_cast<size_t>(rv);
        }
        return bytesRead;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath_)), e.toString()); }
}


void FileInput::close() //throw FileError
{
    const int fd = fd_;
    fd_ = -1; //POSIX leaves the descriptor state unspecified after a failed close() => never retry

    if (fd != -1 && ::close(fd) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath_)), "close");
}


void zen::setFileContent(const Zstring& filePath, std::string_view bytes) //throw FileError
{
    const Zstring tmpPath = filePath + Zstr('.') + numberTo<Zstring>(::getpid()) + Zstr(".tmp");
    try
    {
        const int fd = ::open(tmpPath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666); //umask applies
        if (fd == -1)
            THROW_LAST_SYS_ERROR("open");
        bool closed = false;
        ZEN_ON_SCOPE_EXIT(if (!closed) ::close(fd));
        ZEN_ON_SCOPE_FAIL(::unlink(tmpPath.c_str()));

        while (!bytes.empty())
        {
            const ssize_t rv = ::write(fd, bytes.data(), bytes.size());
            if (rv < 0)
            {
                if (errno == EINTR)
                    continue;
                THROW_LAST_SYS_ERROR("write");
            }
            if (rv == 0) //no progress: treat like a full disk
            {
                errno = ENOSPC;
                THROW_LAST_SYS_ERROR("write");
            }
            bytes.remove_prefix(static_cast<size_t>(rv));
        }

        closed = true;
        if (::close(fd) != 0)
            THROW_LAST_SYS_ERROR("close");

        if (::rename(tmpPath.c_str(), filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rename");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
