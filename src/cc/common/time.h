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

#ifndef COMMON_TIME_H
#define COMMON_TIME_H

#include <stdint.h>

namespace RBS {

extern int64_t microseconds(void);

// Formats local or GMT wall time with strftime format and appends
// microseconds, returns number of characters written.
extern int FormatTimeStamp(int64_t inMicroSec, const char* inFormatPtr,
    bool inUseGMTFlag, char* inBufPtr, int inBufSize);

} // namespace RBS

#endif // COMMON_TIME_H
