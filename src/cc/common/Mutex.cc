//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2008/10/30
// Author: Mike Ovsiannikov
//
// Copyright 2008-2011 Quantcast Corp.
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
// \brief Recursive pthread mutex and condition variable.
//
//----------------------------------------------------------------------------

#include "Mutex.h"
#include "rbsutils.h"

#include <time.h>

namespace RBS
{

    static int
GetAbsTimeout(
    Mutex::Time      inTimeoutNanoSec,
    struct timespec& outAbsTimeout)
{
    const int theErr = clock_gettime(CLOCK_REALTIME, &outAbsTimeout);
    if (theErr != 0) {
        return errno;
    }
    const Mutex::Time k1NanoSec  = Mutex::Time(1000) * 1000000;
    const Mutex::Time theNanoSec = outAbsTimeout.tv_nsec +
        (inTimeoutNanoSec < 0 ? Mutex::Time(0) : inTimeoutNanoSec);
    outAbsTimeout.tv_nsec = long(theNanoSec % k1NanoSec);
    outAbsTimeout.tv_sec += time_t(theNanoSec / k1NanoSec);
    return 0;
}

Mutex::Mutex()
    : mLockCnt(0),
      mOwner(),
      mMutex()
{
    int theErr;
    pthread_mutexattr_t theAttr;
    if ((theErr = pthread_mutexattr_init(&theAttr)) != 0) {
        RaiseError("Mutex: pthread_mutex_attr_init", theErr);
    }
    if ((theErr = pthread_mutexattr_settype(
            &theAttr, PTHREAD_MUTEX_RECURSIVE)) != 0) {
        RaiseError("Mutex: pthread_mutexattr_settype", theErr);
    }
    if ((theErr = pthread_mutex_init(&mMutex, &theAttr)) != 0) {
        RaiseError("Mutex: pthread_mutex_init", theErr);
    }
    if ((theErr = pthread_mutexattr_destroy(&theAttr)) != 0) {
        RaiseError("Mutex: pthread_mutexattr_destroy", theErr);
    }
}

Mutex::~Mutex()
{
    const int theErr = pthread_mutex_destroy(&mMutex);
    if (theErr != 0) {
        RaiseError("Mutex::~Mutex: pthread_mutex_destroy", theErr);
    }
}

/* static */ void
Mutex::RaiseError(
    const char* inMsgPtr,
    int         inSysError)
{
    Utils::FatalError(inMsgPtr, inSysError);
}

CondVar::CondVar()
    : mCond()
{
    const int theErr = pthread_cond_init(&mCond, 0);
    if (theErr) {
        RaiseError("CondVar::CondVar: pthread_cond_init", theErr);
    }
}

CondVar::~CondVar()
{
    const int theErr = pthread_cond_destroy(&mCond);
    if (theErr) {
        RaiseError("CondVar::~CondVar: pthread_cond_destroy", theErr);
    }
}

    bool
CondVar::Wait(
    Mutex&      inMutex,
    Mutex::Time inTimeoutNanoSec)
{
    struct timespec theAbsTimeout;
    int theErr = GetAbsTimeout(inTimeoutNanoSec, theAbsTimeout);
    if (theErr != 0) {
        RaiseError("CondVar::Wait: clock_gettime", theErr);
    }
    if (! inMutex.Unlocked()) {
        RaiseError("CondVar::Wait(timeout) deadlock: mLockCnt > 0");
    }
    theErr = pthread_cond_timedwait(&mCond, &inMutex.mMutex, &theAbsTimeout);
    if (theErr == ETIMEDOUT) {
        inMutex.Locked(0);
        return false;
    }
    if (theErr != 0) {
        RaiseError("CondVar::Wait: pthread_cond_timedwait", theErr);
    }
    return inMutex.Locked(theErr);
}

/* static */ void
CondVar::RaiseError(
    const char* inMsgPtr,
    int         inSysError)
{
    Utils::FatalError(inMsgPtr, inSysError);
}

}
