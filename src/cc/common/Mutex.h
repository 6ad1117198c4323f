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
// \brief Recursive pthread mutex, condition variable, and scoped lockers.
//
// Errors returned by pthread calls are treated as fatal.
//
//----------------------------------------------------------------------------

#ifndef COMMON_MUTEX_H
#define COMMON_MUTEX_H

#include <pthread.h>
#include <errno.h>
#include <stdint.h>

namespace RBS
{

class Mutex
{
public:
    typedef int64_t Time;

    Mutex();
    ~Mutex();
    bool Lock()
        { return Locked(pthread_mutex_lock(&mMutex)); }

    bool TryLock()
    {
        const int theErr = pthread_mutex_trylock(&mMutex);
        return (theErr != EBUSY && Locked(theErr));
    }

    bool Unlock()
    {
        const bool theUnlockedFlag = Unlocked();
        const int theErr = pthread_mutex_unlock(&mMutex);
        if (theErr) {
            RaiseError("Mutex::Unlock", theErr);
        }
        return theUnlockedFlag;
    }

    bool IsOwned() const
        { return (mLockCnt > 0 &&
            ::pthread_equal(mOwner, ::pthread_self()) != 0); }

private:
    int             mLockCnt;
    pthread_t       mOwner;
    pthread_mutex_t mMutex;

    static void RaiseError(
        const char* inMsgPtr,
        int         inSysError = 0);

    bool Locked(
        int inErr)
    {
        if (inErr) {
            RaiseError("Mutex::Locked", inErr);
        }
        if (mLockCnt < 0) {
            RaiseError("Mutex::Locked mLockCnt < 0");
        }
        if (mLockCnt++ == 0) {
            mOwner = ::pthread_self();
        }
        return true;
    }

    bool Unlocked()
    {
        if (mLockCnt <= 0) {
            RaiseError("Mutex::Unlocked mLockCnt <= 0");
        }
        const bool theUnlockedFlag = --mLockCnt == 0;
        if (theUnlockedFlag) {
            mOwner = pthread_t();
        }
        return theUnlockedFlag;
    }

    friend class CondVar;

    // No copies.
    Mutex(const Mutex& inMutex);
    Mutex& operator=(const Mutex& inMutex);
};

class CondVar
{
public:
    typedef Mutex::Time Time;

    CondVar();
    ~CondVar();
    bool Wait(
        Mutex& inMutex)
    {
        if (! inMutex.Unlocked()) {
            RaiseError("CondVar::Wait deadlock: mLockCnt > 0");
        }
        const int theErr = pthread_cond_wait(&mCond, &inMutex.mMutex);
        if (theErr) {
            RaiseError("CondVar::Wait", theErr);
        }
        return inMutex.Locked(theErr);
    }

    // Returns false on timeout.
    bool Wait(
        Mutex& inMutex,
        Time   inTimeoutNanoSec);

    void Notify()
    {
        const int theErr = pthread_cond_signal(&mCond);
        if (theErr) {
            RaiseError("CondVar::Notify", theErr);
        }
    }

    void NotifyAll()
    {
        const int theErr = pthread_cond_broadcast(&mCond);
        if (theErr) {
            RaiseError("CondVar::NotifyAll", theErr);
        }
    }

private:
    pthread_cond_t mCond;

    static void RaiseError(
        const char* inMsgPtr,
        int         inSysError = 0);

    // No copies.
    CondVar(const CondVar& inCondVar);
    CondVar& operator=(const CondVar& inCondVar);
};

class StMutexLocker
{
public:
    StMutexLocker(
        Mutex& inMutex)
        : mMutexPtr(&inMutex)
        { mMutexPtr->Lock(); }

    ~StMutexLocker()
        { Unlock(); }

    void Unlock()
    {
        if (mMutexPtr) {
            mMutexPtr->Unlock();
            mMutexPtr = 0;
        }
    }

private:
    Mutex* mMutexPtr;

    StMutexLocker(const StMutexLocker& inLocker);
    StMutexLocker& operator=(const StMutexLocker& inLocker);
};

class StMutexUnlocker
{
public:
    StMutexUnlocker(
        Mutex& inMutex)
        : mMutex(inMutex)
        { mMutex.Unlock(); }

    ~StMutexUnlocker()
        { mMutex.Lock(); }

private:
    Mutex& mMutex;

    StMutexUnlocker(const StMutexUnlocker& inUnlocker);
    StMutexUnlocker& operator=(const StMutexUnlocker& inUnlocker);
};

}

#endif /* COMMON_MUTEX_H */
