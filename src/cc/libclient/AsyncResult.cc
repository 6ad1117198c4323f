//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
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
// \brief Shared asynchronous operation result.
//
//----------------------------------------------------------------------------

#include "AsyncResult.h"
#include "common/time.h"

namespace RBS
{
namespace client
{

    int
AsyncResultBase::Wait(
    int inTimeoutMs)
{
    StMutexLocker theLock(mMutex);
    if (inTimeoutMs < 0) {
        while (! mDoneFlag && ! mInterruptedFlag) {
            mCond.Wait(mMutex);
        }
    } else {
        const int64_t theEnd = microseconds() + int64_t(inTimeoutMs) * 1000;
        while (! mDoneFlag && ! mInterruptedFlag) {
            const int64_t theLeft = theEnd - microseconds();
            if (theLeft <= 0) {
                break;
            }
            mCond.Wait(mMutex, CondVar::Time(theLeft) * 1000);
        }
    }
    if (mDoneFlag) {
        return kWaitOk;
    }
    return (mInterruptedFlag ? kWaitInterrupted : kWaitTimedOut);
}

    void
AsyncResultBase::Interrupt()
{
    StMutexLocker theLock(mMutex);
    mInterruptedFlag = true;
    mCond.NotifyAll();
}

    int
ResultWaiter::Wait(
    AsyncResultBase& inResult,
    int              inTimeoutMs)
{
    StMutexLocker theLock(mMutex);
    if (mInterruptedFlag) {
        return AsyncResultBase::kWaitInterrupted;
    }
    RBS_RTASSERT(! mWaitPtr);
    mWaitPtr = &inResult;
    int theStatus;
    {
        StMutexUnlocker theUnlock(mMutex);
        theStatus = inResult.Wait(inTimeoutMs);
    }
    mWaitPtr = 0;
    return theStatus;
}

    void
ResultWaiter::Interrupt()
{
    StMutexLocker theLock(mMutex);
    mInterruptedFlag = true;
    if (mWaitPtr) {
        mWaitPtr->Interrupt();
    }
}

}} // namespace RBS::client
