// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************


#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <cassert>
#include <zen/i18n.h>


namespace cymo
{
enum CymoReturnCode //as returned after process exit
{
    CYMO_RC_SUCCESS = 0, //run completed; individual files may have failed
    CYMO_RC_ERROR,       //setup failed: invalid command line, unreadable local root
    CYMO_RC_EXCEPTION,   //unexpected internal error
};


inline
void raiseReturnCode(CymoReturnCode& rc, CymoReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class UploadResult
{
    finishedSuccess,
    finishedError, //some files failed
};


inline
std::wstring getFinalStatusLabel(UploadResult finalStatus)
{
    switch (finalStatus)
    {
        case UploadResult::finishedSuccess:
            return _("Completed successfully");
        case UploadResult::finishedError:
            return _("Completed with errors");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
