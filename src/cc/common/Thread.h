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

#ifndef COMMON_THREAD_H
#define COMMON_THREAD_H

#include <pthread.h>
#include <string>

namespace RBS
{

class Runnable
{
public:
    virtual void Run() = 0;

protected:
    Runnable()
        {}
    virtual ~Runnable()
        {}
};

class Thread
{
public:
    Thread(
        Runnable*   inRunnablePtr = 0,
        const char* inNamePtr     = 0);
    ~Thread();
    void Start(
        Runnable*   inRunnablePtr = 0,
        const char* inNamePtr     = 0)
    {
        const int theErr = TryToStart(inRunnablePtr, inNamePtr);
        if (theErr) {
            FatalError("TryToStart", theErr);
        }
    }
    int TryToStart(
        Runnable*   inRunnablePtr = 0,
        const char* inNamePtr     = 0);
    void Join();
    bool IsStarted() const
        { return mStartedFlag; }
    std::string GetName() const
        { return mName; }
    bool IsCurrentThread() const
        { return (mStartedFlag &&
            ::pthread_equal(mThread, ::pthread_self()) != 0); }

private:
    bool        mStartedFlag;
    pthread_t   mThread;
    Runnable*   mRunnablePtr;
    std::string mName;

    static void* Runner(
        void* inArgPtr);
    static void FatalError(
        const char* inErrMsgPtr,
        int         inSysError);

    // No copies.
    Thread(const Thread& inThread);
    Thread& operator=(const Thread& inThread);
};

}

#endif /* COMMON_THREAD_H */
