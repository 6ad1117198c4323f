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

#ifndef LIBCLIENT_RESPONSE_EXECUTOR_H
#define LIBCLIENT_RESPONSE_EXECUTOR_H

#include "common/Mutex.h"
#include "common/Thread.h"

#include <deque>
#include <string>

namespace RBS
{
namespace client
{
using std::deque;
using std::string;

class ResponseExecutor : private Runnable
{
public:
    // Task ownership stays with the submitter. Run() is allowed to delete the
    // task.
    class Task
    {
    public:
        virtual void Run() = 0;
    protected:
        Task()
            {}
        virtual ~Task()
            {}
    };

    ResponseExecutor(
        const char* inNamePtr = 0);
    ~ResponseExecutor();
    void Start();
    // Returns false if the executor was already shut down, and the task will
    // not run.
    bool Enqueue(
        Task& inTask);
    // Runs all queued tasks, then stops the worker thread. Subsequent
    // Enqueue() calls fail.
    void Shutdown();
    bool IsRunning() const;
    bool IsCurrentThread() const
        { return mThread.IsCurrentThread(); }
    int64_t GetExecutedCount() const;
private:
    typedef deque<Task*> Queue;

    mutable Mutex mMutex;
    CondVar       mCond;
    Queue         mQueue;
    bool          mStartedFlag;
    bool          mStopFlag;
    int64_t       mExecutedCount;
    Thread        mThread;
    string        mName;

    virtual void Run();
private:
    ResponseExecutor(
        const ResponseExecutor& inExecutor);
    ResponseExecutor& operator=(
        const ResponseExecutor& inExecutor);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_RESPONSE_EXECUTOR_H */
