// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef COMMAND_LINE_H_3409817236409812
#define COMMAND_LINE_H_3409817236409812

#include <vector>
#include <zen/file_error.h>
#include "base/structures.h"


namespace cymo
{
struct CommandLineRequest
{
    bool showHelp    = false;
    bool showVersion = false;

    UploadConfig cfg;   //only valid if neither help nor version is requested
    Zstring logFilePath; //optional
};

//args: without program name
CommandLineRequest parseCommandLine(const std::vector<Zstring>& args); //throw FileError

std::wstring getSyntaxHelp();
}

#endif //COMMAND_LINE_H_3409817236409812
