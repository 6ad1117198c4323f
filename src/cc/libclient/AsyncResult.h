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
// The producer completes the result exactly once with Done(). A consumer can
// either block in Wait(), or register a completion that is invoked from the
// thread that completed the result, with the result mutex held.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_ASYNC_RESULT_H
#define LIBCLIENT_ASYNC_RESULT_H

#include "common/Mutex.h"
#include "common/rbstypes.h"
#include "common/rbsutils.h"

#include <boost/shared_ptr.hpp>

#include <errno.h>

namespace RBS
{
namespace client
{

class AsyncResultBase
{
public:
    enum
    {
        kWaitOk          = 0,
        kWaitTimedOut    = -ETIMEDOUT,
        kWaitInterrupted = -EWAITINTERRUPTED
    };

    bool IsDone() const
    {
        StMutexLocker theLock(mMutex);
        return mDoneFlag;
    }
    // Negative timeout means wait forever.
    int Wait(
        int inTimeoutMs = -1);
    // Interrupt is sticky: all current and subsequent waits return
    // kWaitInterrupted, unless the result is already done.
    void Interrupt();
protected:
    mutable Mutex mMutex;
    CondVar       mCond;
    bool          mDoneFlag;
    bool          mInterruptedFlag;

    AsyncResultBase()
        : mMutex(),
          mCond(),
          mDoneFlag(false),
          mInterruptedFlag(false)
        {}
    virtual ~AsyncResultBase()
        {}
    void SetDone()
    {
        mDoneFlag = true;
        mCond.NotifyAll();
    }
private:
    AsyncResultBase(
        const AsyncResultBase& inResult);
    AsyncResultBase& operator=(
        const AsyncResultBase& inResult);
};

template<typename T>
class AsyncResult : public AsyncResultBase
{
public:
    typedef T                                   Result;
    typedef boost::shared_ptr<AsyncResult<T> > Ptr;

    class Completion
    {
    public:
        virtual void Done(
            AsyncResult<T>& inResult) = 0;
    protected:
        Completion()
            {}
        virtual ~Completion()
            {}
    };

    AsyncResult()
        : AsyncResultBase(),
          mResult(),
          mCompletionPtr(0)
        {}
    virtual ~AsyncResult()
        {}
    // Returns false if the result was already completed, in which case the
    // prior result is retained.
    bool Done(
        const T& inResult)
    {
        StMutexLocker theLock(mMutex);
        if (mDoneFlag) {
            return false;
        }
        mResult = inResult;
        SetDone();
        Completion* const theCompletionPtr = mCompletionPtr;
        mCompletionPtr = 0;
        if (theCompletionPtr) {
            theCompletionPtr->Done(*this);
        }
        return true;
    }
    // The result must be done.
    const T& Get() const
    {
        StMutexLocker theLock(mMutex);
        RBS_RTASSERT(mDoneFlag);
        return mResult;
    }
    // Only one completion can be registered. If the result is already done,
    // the completion is invoked immediately.
    void Register(
        Completion& inCompletion)
    {
        StMutexLocker theLock(mMutex);
        RBS_RTASSERT(! mCompletionPtr);
        if (mDoneFlag) {
            inCompletion.Done(*this);
            return;
        }
        mCompletionPtr = &inCompletion;
    }
private:
    T           mResult;
    Completion* mCompletionPtr;
};

// Waits on results on behalf of one caller thread. Interrupt() can be invoked
// from any thread, and wakes up the current wait, if any. All subsequent waits
// return kWaitInterrupted.
class ResultWaiter
{
public:
    ResultWaiter()
        : mMutex(),
          mWaitPtr(0),
          mInterruptedFlag(false)
        {}
    int Wait(
        AsyncResultBase& inResult,
        int              inTimeoutMs);
    void Interrupt();
    bool IsInterrupted() const
    {
        StMutexLocker theLock(mMutex);
        return mInterruptedFlag;
    }
private:
    mutable Mutex    mMutex;
    AsyncResultBase* mWaitPtr;
    bool             mInterruptedFlag;

    ResultWaiter(
        const ResultWaiter& inWaiter);
    ResultWaiter& operator=(
        const ResultWaiter& inWaiter);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_ASYNC_RESULT_H */
