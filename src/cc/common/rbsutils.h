//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2008/11/01
// Author: Mike Ovsiannikov
//
// Copyright 2008-2010 Quantcast Corp.
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
// \brief Fatal error, system error message, and run time assertion helpers.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RBSUTILS_H
#define COMMON_RBSUTILS_H

#include <string>

#define RBS_RTASSERT(a) \
    if (!(a)) RBS::Utils::AssertionFailure(#a, __FILE__, __LINE__)

namespace RBS
{

struct Utils
{
    static void FatalError(
        const char* inMsgPtr,
        int         inSysError);

    static std::string SysError(
        int         inSysError,
        const char* inMsgPtr = 0);

    static void AssertionFailure(
        const char* inMsgPtr,
        const char* inFileNamePtr,
        int         inLineNum);
};

}

#endif /* COMMON_RBSUTILS_H */
