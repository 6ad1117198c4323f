//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2006/09/12
// Author: Sriram Rao
//
// Copyright 2008-2011 Quantcast Corp.
// Copyright 2006-2008 Kosmix Corp.
//
// This file is part of Replicated Block Stream (RBS).
//
// Licensed under the Apache License, Version 2.0
// (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the License.
//
// \brief Chunk checksum engine.
//
// A chunk checksum is a list of digests, one per bytes per checksum slice of
// the chunk data, the last slice can be shorter.
//
//----------------------------------------------------------------------------

#ifndef RBSIO_CHECKSUM_H
#define RBSIO_CHECKSUM_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include <ostream>

namespace RBS
{
using std::string;
using std::vector;
using std::ostream;

/// Block checksums are computed on 64KB block boundaries. We use the
/// "rolling" 32-bit Adler checksum algorithm
const uint32_t CHECKSUM_BLOCKSIZE = 65536;
const uint32_t kRbsNullChecksum   = 1;

/// Call this function if you want checksum computed over CHECKSUM_BLOCKSIZE
/// bytes
uint32_t ComputeBlockChecksum(const char* data, size_t len);
uint32_t ComputeBlockChecksum(uint32_t ckhsum, const char* buf, size_t len);

enum ChecksumType
{
    kChecksumTypeNone    = 0,
    kChecksumTypeAdler32 = 1,
    kChecksumTypeCrc32   = 2,
    kChecksumTypeMd5     = 3,
    kChecksumTypeSha256  = 4
};

const char* ChecksumTypeToString(ChecksumType inType);
bool ParseChecksumType(const char* inNamePtr, ChecksumType& outType);

struct ChecksumData
{
    ChecksumData(
        ChecksumType inType             = kChecksumTypeNone,
        uint32_t     inBytesPerChecksum = 0)
        : mType(inType),
          mBytesPerChecksum(inBytesPerChecksum),
          mChecksums()
        {}
    bool operator==(const ChecksumData& inOther) const
    {
        return (
            mType             == inOther.mType &&
            mBytesPerChecksum == inOther.mBytesPerChecksum &&
            mChecksums        == inOther.mChecksums
        );
    }
    bool operator!=(const ChecksumData& inOther) const
        { return ! (*this == inOther); }
    ostream& Display(ostream& inStream) const;

    ChecksumType   mType;
    uint32_t       mBytesPerChecksum;
    vector<string> mChecksums; // Binary digests, big endian for 32 bit sums.
};

inline static ostream&
operator<<(ostream& inStream, const ChecksumData& inData)
    { return inData.Display(inStream); }

class Checksum
{
public:
    enum { kMaxDigestLength = 32 };

    Checksum(
        ChecksumType inType             = kChecksumTypeCrc32,
        uint32_t     inBytesPerChecksum = 1 << 20);
    ChecksumType GetType() const
        { return mType; }
    uint32_t GetBytesPerChecksum() const
        { return mBytesPerChecksum; }
    // Returns 0 on success, -EINVAL on invalid parameters, and -EIO if digest
    // computation failed.
    int Compute(
        const char*   inBufPtr,
        size_t        inLength,
        ChecksumData& outData) const;
    // Recomputes with the type and slice size recorded in inData.
    // Returns 0 if the data matches, -EBADMSG on mismatch.
    static int Verify(
        const char*         inBufPtr,
        size_t              inLength,
        const ChecksumData& inData);
    static int GetDigestLength(
        ChecksumType inType);
private:
    ChecksumType mType;
    uint32_t     mBytesPerChecksum;

    static int ComputeDigest(
        ChecksumType inType,
        const char*  inBufPtr,
        size_t       inLength,
        string&      outDigest);
};

}

#endif // RBSIO_CHECKSUM_H
