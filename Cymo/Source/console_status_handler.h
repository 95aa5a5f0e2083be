// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef CONSOLE_STATUS_HANDLER_H_5682039475612
#define CONSOLE_STATUS_HANDLER_H_5682039475612

#include <zen/error_log.h>
#include "base/process_callback.h"


namespace cymo
{
struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;
};


//main thread only: print log entries as they arrive, keep a transient status line on a terminal
class ConsoleStatusHandler : public PhaseCallback
{
public:
    explicit ConsoleStatusHandler(bool showStatusLine);
    ~ConsoleStatusHandler();

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override;
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override;

    void updateStatus(std::wstring&& msg) override;
    void logMessage(const std::wstring& msg, MsgType type) override;

    const zen::ErrorLog& getErrorLog() const { return errorLog_; }
    ProgressStats getStatsCurrent() const { return statsCurrent_; }
    ProgressStats getStatsTotal  () const { return statsTotal_; }

private:
    ConsoleStatusHandler           (const ConsoleStatusHandler&) = delete;
    ConsoleStatusHandler& operator=(const ConsoleStatusHandler&) = delete;

    void printStatusLine();
    void clearStatusLine();

    const bool showStatusLine_;
    zen::ErrorLog errorLog_;

    ProgressStats statsCurrent_;
    ProgressStats statsTotal_;

    std::wstring statusMsg_;
    size_t statusLineLen_ = 0; //currently printed
};
}

#endif //CONSOLE_STATUS_HANDLER_H_5682039475612
