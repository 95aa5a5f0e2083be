// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef VERSION_H_18749208374123
#define VERSION_H_18749208374123

namespace cymo
{
const char cymoVersion[] = "0.3.0"; //internal linkage!
}

#endif //VERSION_H_18749208374123
