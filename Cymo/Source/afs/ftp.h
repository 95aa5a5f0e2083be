// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include "ftp_transport.h"


namespace cymo
{
//FTP client based on libcurl: requires a LibcurlScope
std::unique_ptr<FtpConnector> createFtpConnector();

Zstring parsePwdResponse(const std::string& serverResponse); //throw SysError
}

#endif //FTP_H_745895742383425326568678
