//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2006/09/12
// Author: Sriram Rao
//
// Copyright 2008-2012 Quantcast Corp.
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
// \brief Chunk checksum engine: adler32 and crc32 with zlib, md5 and sha256
// with OpenSSL EVP digests.
//
//----------------------------------------------------------------------------

#include "checksum.h"

#include <errno.h>
#include <string.h>
#include <strings.h>
#include <zlib.h>
#include <openssl/evp.h>

namespace RBS
{

static inline uint32_t
RbsChecksum(uint32_t chksum, const void* buf, size_t len)
{
    return adler32(chksum, reinterpret_cast<const Bytef*>(buf), len);
}

uint32_t
ComputeBlockChecksum(const char* buf, size_t len)
{
    return RbsChecksum(kRbsNullChecksum, buf, len);
}

uint32_t
ComputeBlockChecksum(uint32_t chksum, const char* buf, size_t len)
{
    return RbsChecksum(chksum, buf, len);
}

static inline void
AppendUInt32(string& str, uint32_t val)
{
    str += (char)((val >> 24) & 0xFF);
    str += (char)((val >> 16) & 0xFF);
    str += (char)((val >>  8) & 0xFF);
    str += (char)(val & 0xFF);
}

static const struct
{
    ChecksumType mType;
    const char*  mNamePtr;
} kChecksumTypeNames[] = {
    { kChecksumTypeNone,    "NONE"    },
    { kChecksumTypeAdler32, "ADLER32" },
    { kChecksumTypeCrc32,   "CRC32"   },
    { kChecksumTypeMd5,     "MD5"     },
    { kChecksumTypeSha256,  "SHA256"  }
};
static const size_t kChecksumTypeCount =
    sizeof(kChecksumTypeNames) / sizeof(kChecksumTypeNames[0]);

const char*
ChecksumTypeToString(ChecksumType inType)
{
    for (size_t i = 0; i < kChecksumTypeCount; i++) {
        if (kChecksumTypeNames[i].mType == inType) {
            return kChecksumTypeNames[i].mNamePtr;
        }
    }
    return "UNKNOWN";
}

bool
ParseChecksumType(const char* inNamePtr, ChecksumType& outType)
{
    if (! inNamePtr) {
        return false;
    }
    for (size_t i = 0; i < kChecksumTypeCount; i++) {
        if (strcasecmp(kChecksumTypeNames[i].mNamePtr, inNamePtr) == 0) {
            outType = kChecksumTypeNames[i].mType;
            return true;
        }
    }
    return false;
}

ostream&
ChecksumData::Display(ostream& inStream) const
{
    inStream << ChecksumTypeToString(mType) << "/" << mBytesPerChecksum <<
        "/" << mChecksums.size();
    if (! mChecksums.empty()) {
        static const char* const kHexDigits = "0123456789abcdef";
        const string& theFirst = mChecksums.front();
        inStream << "/";
        for (size_t i = 0; i < theFirst.size() && i < 8; i++) {
            const int theByte = theFirst[i] & 0xFF;
            inStream << kHexDigits[theByte >> 4] << kHexDigits[theByte & 0xF];
        }
    }
    return inStream;
}

Checksum::Checksum(
    ChecksumType inType,
    uint32_t     inBytesPerChecksum)
    : mType(inType),
      mBytesPerChecksum(inBytesPerChecksum)
{}

/* static */ int
Checksum::GetDigestLength(
    ChecksumType inType)
{
    switch (inType) {
        case kChecksumTypeNone:    return 0;
        case kChecksumTypeAdler32: return 4;
        case kChecksumTypeCrc32:   return 4;
        case kChecksumTypeMd5:     return 16;
        case kChecksumTypeSha256:  return 32;
        default:                   break;
    }
    return -EINVAL;
}

/* static */ int
Checksum::ComputeDigest(
    ChecksumType inType,
    const char*  inBufPtr,
    size_t       inLength,
    string&      outDigest)
{
    outDigest.clear();
    switch (inType) {
        case kChecksumTypeNone:
            return 0;
        case kChecksumTypeAdler32:
            AppendUInt32(outDigest, ComputeBlockChecksum(inBufPtr, inLength));
            return 0;
        case kChecksumTypeCrc32:
            AppendUInt32(outDigest, (uint32_t)crc32(crc32(0L, Z_NULL, 0),
                reinterpret_cast<const Bytef*>(inBufPtr), (uInt)inLength));
            return 0;
        case kChecksumTypeMd5:
        case kChecksumTypeSha256:
            break;
        default:
            return -EINVAL;
    }
    EVP_MD_CTX* const theCtxPtr = EVP_MD_CTX_new();
    if (! theCtxPtr) {
        return -ENOMEM;
    }
    unsigned char theMd[EVP_MAX_MD_SIZE];
    unsigned int  theLen = 0;
    const bool    theOkFlag =
        EVP_DigestInit_ex(theCtxPtr,
            inType == kChecksumTypeSha256 ? EVP_sha256() : EVP_md5(), 0) &&
        EVP_DigestUpdate(theCtxPtr, inBufPtr, inLength) &&
        EVP_DigestFinal_ex(theCtxPtr, theMd, &theLen);
    EVP_MD_CTX_free(theCtxPtr);
    if (! theOkFlag) {
        return -EIO;
    }
    outDigest.assign(reinterpret_cast<const char*>(theMd), theLen);
    return 0;
}

int
Checksum::Compute(
    const char*   inBufPtr,
    size_t        inLength,
    ChecksumData& outData) const
{
    if ((! inBufPtr && inLength > 0) || GetDigestLength(mType) < 0) {
        return -EINVAL;
    }
    outData.mType             = mType;
    outData.mBytesPerChecksum = mBytesPerChecksum;
    outData.mChecksums.clear();
    if (mType == kChecksumTypeNone) {
        return 0;
    }
    if (mBytesPerChecksum <= 0) {
        return -EINVAL;
    }
    outData.mChecksums.reserve(
        (inLength + mBytesPerChecksum - 1) / mBytesPerChecksum);
    for (size_t thePos = 0; thePos < inLength; thePos += mBytesPerChecksum) {
        const size_t theLen = inLength - thePos < mBytesPerChecksum ?
            inLength - thePos : (size_t)mBytesPerChecksum;
        outData.mChecksums.push_back(string());
        const int theStatus = ComputeDigest(
            mType, inBufPtr + thePos, theLen, outData.mChecksums.back());
        if (theStatus != 0) {
            outData.mChecksums.clear();
            return theStatus;
        }
    }
    return 0;
}

/* static */ int
Checksum::Verify(
    const char*         inBufPtr,
    size_t              inLength,
    const ChecksumData& inData)
{
    ChecksumData theData;
    const Checksum theChecksum(inData.mType, inData.mBytesPerChecksum);
    const int      theStatus = theChecksum.Compute(inBufPtr, inLength, theData);
    if (theStatus != 0) {
        return theStatus;
    }
    return (theData == inData ? 0 : -EBADMSG);
}

}
