//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2016/8/9
// Author: Mike Ovsiannikov
//
// Copyright 2014,2016 Quantcast Corporation. All rights reserved.
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
// \brief Chunk name construction and parsing.
//
//----------------------------------------------------------------------------

#include "blockname.h"

#include <stdlib.h>
#include <errno.h>

namespace RBS
{

static const char   kChunkNameSeparator[]  = "_chunk_";
static const size_t kChunkNameSeparatorLen = sizeof(kChunkNameSeparator) - 1;

template<typename T>
    static inline void
AppendDecimal(
    string& ioStr,
    T       inVal)
{
    char        theBuf[32];
    char* const theEndPtr = theBuf + sizeof(theBuf);
    char*       thePtr    = theEndPtr;
    const bool  theNegFlag = inVal < 0;
    // Negative values are handled digit by digit to avoid overflow on min.
    do {
        const int theDigit = (int)(inVal % 10);
        *--thePtr = (char)('0' + (theDigit < 0 ? -theDigit : theDigit));
        inVal /= 10;
    } while (inVal != 0);
    if (theNegFlag) {
        *--thePtr = '-';
    }
    ioStr.append(thePtr, theEndPtr - thePtr);
}

    bool
AppendChunkName(
    string&   ioName,
    localId_t inLocalId,
    int64_t   inChunkIndex)
{
    if (inChunkIndex <= 0) {
        return false;
    }
    AppendDecimal(ioName, inLocalId);
    ioName.append(kChunkNameSeparator, kChunkNameSeparatorLen);
    AppendDecimal(ioName, inChunkIndex);
    return true;
}

    string
MakeChunkName(
    localId_t inLocalId,
    int64_t   inChunkIndex)
{
    string theName;
    AppendChunkName(theName, inLocalId, inChunkIndex);
    return theName;
}

    bool
ParseChunkName(
    const string& inName,
    localId_t&    outLocalId,
    int64_t&      outChunkIndex)
{
    const size_t thePos = inName.find(kChunkNameSeparator);
    if (thePos == string::npos || thePos == 0) {
        return false;
    }
    const char* const theStartPtr = inName.c_str();
    char*             theEndPtr   = 0;
    errno = 0;
    const long long theLocalId = strtoll(theStartPtr, &theEndPtr, 10);
    if (errno != 0 || theEndPtr != theStartPtr + thePos) {
        return false;
    }
    const char* const theIdxPtr = theStartPtr + thePos + kChunkNameSeparatorLen;
    if (*theIdxPtr < '0' || '9' < *theIdxPtr) {
        return false;
    }
    const long long theIndex = strtoll(theIdxPtr, &theEndPtr, 10);
    if (errno != 0 || *theEndPtr != 0 || theIndex <= 0) {
        return false;
    }
    outLocalId    = (localId_t)theLocalId;
    outChunkIndex = (int64_t)theIndex;
    return true;
}

} // namespace RBS
