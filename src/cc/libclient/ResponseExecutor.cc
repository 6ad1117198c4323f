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
// \brief Single threaded executor that runs completion tasks in submission order.
//
//----------------------------------------------------------------------------

#include "ResponseExecutor.h"
#include "common/MsgLogger.h"
#include "common/rbsutils.h"

namespace RBS
{
namespace client
{

ResponseExecutor::ResponseExecutor(
    const char* inNamePtr)
    : Runnable(),
      mMutex(),
      mCond(),
      mQueue(),
      mStartedFlag(false),
      mStopFlag(false),
      mExecutedCount(0),
      mThread(this, inNamePtr ? inNamePtr : "ResponseExecutor"),
      mName(inNamePtr ? inNamePtr : "ResponseExecutor")
{}

ResponseExecutor::~ResponseExecutor()
{
    ResponseExecutor::Shutdown();
}

    void
ResponseExecutor::Start()
{
    StMutexLocker theLock(mMutex);
    if (mStartedFlag || mStopFlag) {
        return;
    }
    mStartedFlag = true;
    mThread.Start();
}

    bool
ResponseExecutor::Enqueue(
    ResponseExecutor::Task& inTask)
{
    StMutexLocker theLock(mMutex);
    if (mStopFlag || ! mStartedFlag) {
        RBS_LOG_STREAM_DEBUG << mName <<
            ": not running, task rejected" <<
        RBS_LOG_EOM;
        return false;
    }
    mQueue.push_back(&inTask);
    mCond.Notify();
    return true;
}

    void
ResponseExecutor::Shutdown()
{
    StMutexLocker theLock(mMutex);
    if (mStopFlag) {
        return;
    }
    mStopFlag = true;
    mCond.Notify();
    const bool theJoinFlag = mStartedFlag;
    theLock.Unlock();
    RBS_RTASSERT(! mThread.IsCurrentThread());
    if (theJoinFlag) {
        mThread.Join();
    }
}

    bool
ResponseExecutor::IsRunning() const
{
    StMutexLocker theLock(mMutex);
    return (mStartedFlag && ! mStopFlag);
}

    int64_t
ResponseExecutor::GetExecutedCount() const
{
    StMutexLocker theLock(mMutex);
    return mExecutedCount;
}

    /* virtual */ void
ResponseExecutor::Run()
{
    StMutexLocker theLock(mMutex);
    for (; ;) {
        while (! mStopFlag && mQueue.empty()) {
            mCond.Wait(mMutex);
        }
        if (mQueue.empty()) {
            break; // Stop, and queue is drained.
        }
        Task* const theTaskPtr = mQueue.front();
        mQueue.pop_front();
        {
            StMutexUnlocker theUnlock(mMutex);
            theTaskPtr->Run();
        }
        mExecutedCount++;
    }
    RBS_LOG_STREAM_DEBUG << mName << ": stopped"
        " executed: " << mExecutedCount <<
    RBS_LOG_EOM;
}

}} // namespace RBS::client
