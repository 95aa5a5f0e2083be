// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef TRANSFER_MODE_H_5623409817230498
#define TRANSFER_MODE_H_5623409817230498

#include <span>
#include "../afs/ftp_transport.h"


namespace cymo
{
//best-effort guess based on the first bytes of a file
class TransferModeClassifier
{
public:
    virtual ~TransferModeClassifier() {}

    virtual size_t getSampleSize() const = 0;
    virtual TransferMode classify(std::span<const char> prefix) const = 0; //thread-safe!
};


//text <=> non-empty, valid UTF-8 without NUL chars; a UTF-8 sequence cut off by the sample size is accepted
class TextSniffingClassifier : public TransferModeClassifier
{
public:
    static constexpr size_t SAMPLE_SIZE = 1024;

    size_t getSampleSize() const override { return SAMPLE_SIZE; }
    TransferMode classify(std::span<const char> prefix) const override;
};


class BinaryOnlyClassifier : public TransferModeClassifier
{
public:
    size_t getSampleSize() const override { return 0; }
    TransferMode classify(std::span<const char> /*prefix*/) const override { return TransferMode::binary; }
};
}

#endif //TRANSFER_MODE_H_5623409817230498
