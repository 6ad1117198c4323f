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
// \brief Set once failure cell: the first failure wins.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_FAILURE_LATCH_H
#define LIBCLIENT_FAILURE_LATCH_H

#include <string>

namespace RBS
{
namespace client
{
using std::string;

class FailureLatch
{
public:
    FailureLatch(
        const char* inLogPrefixPtr = 0);
    ~FailureLatch();
    // Returns true if this call latched the failure. Status must be negative.
    bool Set(
        int           inStatus,
        const string& inMsg);
    bool IsSet() const
        { return (Load() != 0); }
    // Returns 0 if no failure was latched.
    int GetStatus() const;
    bool Get(
        int&    outStatus,
        string& outMsg) const;
    void SetLogPrefix(
        const string& inPrefix)
        { mLogPrefix = inPrefix; }
private:
    struct Failure
    {
        Failure(
            int           inStatus,
            const string& inMsg)
            : mStatus(inStatus),
              mMsg(inMsg)
            {}
        const int    mStatus;
        const string mMsg;
    };
    Failure* volatile mFailurePtr;
    string            mLogPrefix;

    const Failure* Load() const;
private:
    FailureLatch(
        const FailureLatch& inLatch);
    FailureLatch& operator=(
        const FailureLatch& inLatch);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_FAILURE_LATCH_H */
