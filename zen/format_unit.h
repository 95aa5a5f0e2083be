// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef FMT_UNIT_8702184019487324
#define FMT_UNIT_8702184019487324

#include <string>
#include <cstdint>


namespace zen
{
const int bytesPerKilo = 1000;
std::wstring formatFilesizeShort(int64_t filesize);
std::wstring formatProgressPercent(double fraction /*[0, 1]*/); //rounded down!
std::wstring formatTimeSpan(int64_t timeInSec); //"h:mm:ss"

std::wstring formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)

std::wstring formatNumber(int64_t n); //format integer number including thousands separator
}

#endif
