// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "format_unit.h"
#include <cmath>
#include <cwchar>
#include <iterator>
#include "i18n.h"

using namespace zen;


namespace
{
template <class Num>
std::wstring printNumber(const wchar_t* format, Num number)
{
    wchar_t buffer[128] = {};
    const int charsWritten = std::swprintf(buffer, std::size(buffer), format, number);
    return charsWritten > 0 ? std::wstring(buffer, charsWritten) : std::wstring();
}
}


std::wstring zen::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber(L"%.1f", value);

    return formatNumber(std::llround(value));
}


std::wstring zen::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return _P("1 byte", "%x bytes", size);

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const std::wstring& unitTxt) { return replaceCpy(unitTxt, L"%x", formatThreeDigitPrecision(sizeInUnit)); };

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x KB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x MB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x GB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x TB"));

    sizeInUnit /= bytesPerKilo;
    return formatUnit(_("%x PB"));
}


std::wstring zen::formatProgressPercent(double fraction)
{
    //round down! don't show 100% when not actually done
    return numberTo<std::wstring>(static_cast<int>(std::floor(fraction * 100))) + L'%';
}


std::wstring zen::formatTimeSpan(int64_t timeInSec)
{
    if (timeInSec < 0)
        return L'-' + formatTimeSpan(-timeInSec);

    return printNumber(L"%lld", static_cast<long long>(timeInSec / 3600)) +
           printNumber(L":%02d", static_cast<int>(timeInSec / 60 % 60)) +
           printNumber(L":%02d", static_cast<int>(timeInSec % 60));
}


std::wstring zen::formatNumber(int64_t n)
{
    static_assert(sizeof(long long int) == sizeof(n));
    return printNumber(L"%'lld", static_cast<long long>(n)); //considers grouping (') of the current locale
}
