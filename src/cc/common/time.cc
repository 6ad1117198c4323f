//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2010/10/27
// Author: Dan Adkins
//
// Copyright 2010 Quantcast Corp.
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
// \brief Wall clock helpers.
//
//----------------------------------------------------------------------------

#include <sys/time.h>
#include <time.h>
#include <stdio.h>
#include "time.h"

namespace RBS {

int64_t
microseconds(void)
{
    struct timeval tv;

    if (gettimeofday(&tv, 0) < 0)
        return -1;

    return (int64_t)tv.tv_sec*1000*1000 + tv.tv_usec;
}

int
FormatTimeStamp(int64_t inMicroSec, const char* inFormatPtr,
    bool inUseGMTFlag, char* inBufPtr, int inBufSize)
{
    if (inBufSize <= 0) {
        return 0;
    }
    const time_t theTime = (time_t)(inMicroSec / 1000000);
    struct tm    theTm;
    if (! (inUseGMTFlag ?
            gmtime_r(&theTime, &theTm) : localtime_r(&theTime, &theTm))) {
        inBufPtr[0] = 0;
        return 0;
    }
    int theLen = (int)strftime(inBufPtr, inBufSize,
        inFormatPtr ? inFormatPtr : "%m-%d-%Y %H:%M:%S", &theTm);
    if (theLen + 8 < inBufSize) {
        theLen += snprintf(inBufPtr + theLen, inBufSize - theLen, ".%06d",
            (int)(inMicroSec % 1000000));
    }
    return theLen;
}

} // namespace RBS
