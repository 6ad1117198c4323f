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

#include "FailureLatch.h"
#include "common/MsgLogger.h"
#include "common/rbsatomic.h"
#include "common/rbserrno.h"
#include "common/rbsutils.h"

namespace RBS
{
namespace client
{

FailureLatch::FailureLatch(
    const char* inLogPrefixPtr)
    : mFailurePtr(0),
      mLogPrefix(inLogPrefixPtr ? inLogPrefixPtr : "")
{}

FailureLatch::~FailureLatch()
{
    delete Load();
}

    const FailureLatch::Failure*
FailureLatch::Load() const
{
    return SyncLoad(const_cast<Failure* volatile&>(mFailurePtr));
}

    bool
FailureLatch::Set(
    int           inStatus,
    const string& inMsg)
{
    RBS_RTASSERT(inStatus < 0);
    Failure* const theFailurePtr = new Failure(inStatus, inMsg);
    if (SyncCompareAndSwap(mFailurePtr, (Failure*)0, theFailurePtr)) {
        RBS_LOG_STREAM_ERROR << mLogPrefix <<
            "failure: " << inMsg <<
            " status: " << inStatus << " " << ErrorCodeToString(inStatus) <<
        RBS_LOG_EOM;
        return true;
    }
    const Failure* const theCurPtr = Load();
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "ignoring failure: " << inMsg <<
        " status: " << inStatus << " " << ErrorCodeToString(inStatus) <<
        " already failed: " << theCurPtr->mMsg <<
        " status: " << theCurPtr->mStatus <<
    RBS_LOG_EOM;
    delete theFailurePtr;
    return false;
}

    int
FailureLatch::GetStatus() const
{
    const Failure* const theFailurePtr = Load();
    return (theFailurePtr ? theFailurePtr->mStatus : 0);
}

    bool
FailureLatch::Get(
    int&    outStatus,
    string& outMsg) const
{
    const Failure* const theFailurePtr = Load();
    if (! theFailurePtr) {
        return false;
    }
    outStatus = theFailurePtr->mStatus;
    outMsg    = theFailurePtr->mMsg;
    return true;
}

}} // namespace RBS::client
