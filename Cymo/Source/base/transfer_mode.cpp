// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#include "transfer_mode.h"
#include <algorithm>
#include <zen/utf.h>

using namespace zen;
using namespace cymo;


TransferMode TextSniffingClassifier::classify(std::span<const char> prefix) const
{
    if (prefix.empty())
        return TransferMode::binary;

    std::string_view sample(prefix.data(), prefix.size());

    if (std::find(sample.begin(), sample.end(), '\0') != sample.end())
        return TransferMode::binary;

    if (prefix.size() >= SAMPLE_SIZE) //sample may end in the middle of a character
        sample.remove_suffix(getTruncatedUtf8Tail(sample));

    return isValidUtf8(sample) ? TransferMode::text : TransferMode::binary;
}
