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
// \brief Thin pthread wrapper.
//
//----------------------------------------------------------------------------

#include "Thread.h"
#include "rbsutils.h"

#include <errno.h>

namespace RBS
{

Thread::Thread(
    Runnable*   inRunnablePtr /* = 0 */,
    const char* inNamePtr     /* = 0 */)
    : mStartedFlag(false),
      mThread(),
      mRunnablePtr(inRunnablePtr),
      mName(inNamePtr ? inNamePtr : "")
{}

Thread::~Thread()
{
    Thread::Join();
}

    int
Thread::TryToStart(
    Runnable*   inRunnablePtr /* = 0 */,
    const char* inNamePtr     /* = 0 */)
{
    if (mStartedFlag) {
        return EINVAL;
    }
    if (inNamePtr) {
        mName = inNamePtr;
    }
    if (inRunnablePtr) {
        mRunnablePtr = inRunnablePtr;
    }
    if (! mRunnablePtr) {
        return EINVAL;
    }
    mStartedFlag = true;
    const int theErr = pthread_create(&mThread, 0, &Thread::Runner, this);
    if (theErr != 0) {
        mStartedFlag = false;
        return theErr;
    }
    return theErr;
}

    void
Thread::Join()
{
    if (! mStartedFlag) {
        return;
    }
    const int theErr = pthread_join(mThread, 0);
    if (theErr) {
        FatalError("pthread_join", theErr);
    }
    mStartedFlag = false;
}

    /* static */ void
Thread::FatalError(
    const char* inErrMsgPtr,
    int         inSysError)
{
    Utils::FatalError(inErrMsgPtr, inSysError);
}

    /* static */ void*
Thread::Runner(
    void* inArgPtr)
{
    reinterpret_cast<Thread*>(inArgPtr)->mRunnablePtr->Run();
    return 0;
}

}
