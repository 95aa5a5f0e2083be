// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include <span>
#include "file_error.h"


namespace zen
{
//sequential read of a local file; follows symlinks
class FileInput
{
public:
    explicit FileInput(const Zstring& filePath); //throw FileError
    ~FileInput();

    //fills "buffer" completely unless the end of file is reached first; 0 means EOF
    size_t read(std::span<char> buffer); //throw FileError

    //reports errors the destructor would have to ignore
    void close(); //throw FileError

    const Zstring& getFilePath() const { return filePath_; }

private:
    FileInput           (const FileInput&) = delete;
    FileInput& operator=(const FileInput&) = delete;

    const Zstring filePath_;
    int fd_ = -1;
};


//replace "filePath" atomically: content goes to a temporary file which is renamed when complete
void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
