// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#include "console_status_handler.h"
#include <cassert>
#include <iostream>
#include <zen/format_unit.h>
#include <zen/thread.h>

using namespace zen;
using namespace cymo;


namespace
{
MessageType mapMessageType(PhaseCallback::MsgType type)
{
    switch (type)
    {
        case PhaseCallback::MsgType::info:
            return MSG_TYPE_INFO;
        case PhaseCallback::MsgType::warning:
            return MSG_TYPE_WARNING;
        case PhaseCallback::MsgType::error:
            return MSG_TYPE_ERROR;
    }
    assert(false);
    return MSG_TYPE_ERROR;
}
}


ConsoleStatusHandler::ConsoleStatusHandler(bool showStatusLine) : showStatusLine_(showStatusLine) {}


ConsoleStatusHandler::~ConsoleStatusHandler()
{
    clearStatusLine();
}


void ConsoleStatusHandler::updateDataProcessed(int itemsDelta, int64_t bytesDelta)
{
    statsCurrent_.items += itemsDelta;
    statsCurrent_.bytes += bytesDelta;
}


void ConsoleStatusHandler::updateDataTotal(int itemsDelta, int64_t bytesDelta)
{
    statsTotal_.items += itemsDelta;
    statsTotal_.bytes += bytesDelta;
}


void ConsoleStatusHandler::updateStatus(std::wstring&& msg)
{
    assert(runningOnMainThread());
    statusMsg_ = std::move(msg);
    printStatusLine();
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type)
{
    assert(runningOnMainThread());
    logMsg(errorLog_, msg, mapMessageType(type));

    clearStatusLine();
    std::cout << formatMessage(errorLog_.back()) << std::flush;
    printStatusLine();
}


void ConsoleStatusHandler::printStatusLine()
{
    if (!showStatusLine_)
        return;

    std::wstring statusLine;
    if (statsTotal_.items > 0)
        statusLine = L'[' + formatNumber(statsCurrent_.items) + L'/' + formatNumber(statsTotal_.items) + L' ' +
                     formatProgressPercent(statsTotal_.bytes > 0 ? static_cast<double>(statsCurrent_.bytes) / statsTotal_.bytes : 0) + L"] ";
    statusLine += replaceCpy(statusMsg_, L'\n', L' ');

    const std::string output = utfTo<std::string>(statusLine);

    std::cerr << '\r' << output;
    if (output.size() < statusLineLen_)
        std::cerr << std::string(statusLineLen_ - output.size(), ' ') << '\r' << output;
    std::cerr << std::flush;

    statusLineLen_ = output.size();
}


void ConsoleStatusHandler::clearStatusLine()
{
    if (statusLineLen_ > 0)
    {
        std::cerr << '\r' << std::string(statusLineLen_, ' ') << '\r' << std::flush;
        statusLineLen_ = 0;
    }
}
