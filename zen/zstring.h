// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"     //
#include "string_tools.h"


using Zchar = char;
#define Zstr(x) x

//native string for interfacing with the OS: UTF-8 encoded on Linux
using Zstring = std::basic_string<Zchar>;

using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_73425873425789
