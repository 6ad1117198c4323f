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
// \brief Commit watcher: tracks metadata commits by flush watermark, and confirms
// quorum commitment with the pipeline replication log.
//
//----------------------------------------------------------------------------

#include "CommitWatcher.h"
#include "common/MsgLogger.h"
#include "common/rbserrno.h"

#include <sstream>
#include <vector>

namespace RBS
{
namespace client
{
using std::ostringstream;
using std::vector;
using std::pair;
using std::make_pair;

CommitWatcher::CommitWatcher(
    ResultWaiter& inWaiter,
    const char*   inLogPrefixPtr)
    : mMutex(),
      mWaiter(inWaiter),
      mTransportPtr(0),
      mRecords(),
      mLatestCommitIndex(-1),
      mFailedReplicas(),
      mAckedWatermark(0),
      mLogPrefix(inLogPrefixPtr ? inLogPrefixPtr : "")
{}

CommitWatcher::~CommitWatcher()
{
    CommitWatcher::Drain();
}

    void
CommitWatcher::SetTransport(
    PipelineTransport* inTransportPtr)
{
    StMutexLocker theLock(mMutex);
    mTransportPtr = inTransportPtr;
}

    int
CommitWatcher::Track(
    blockOff_t             inWatermark,
    const CommitFuturePtr& inFuturePtr)
{
    StMutexLocker theLock(mMutex);
    if (! inFuturePtr) {
        return kErrorInvariant;
    }
    pair<Records::iterator, bool> const theRes =
        mRecords.insert(make_pair(inWatermark, Record(inFuturePtr)));
    if (! theRes.second) {
        RBS_LOG_STREAM_ERROR << mLogPrefix <<
            "commit at watermark: " << inWatermark <<
            " is already tracked" <<
        RBS_LOG_EOM;
        return kErrorInvariant;
    }
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "tracking commit at watermark: " << inWatermark <<
        " records: " << mRecords.size() <<
    RBS_LOG_EOM;
    return kErrorNone;
}

    void
CommitWatcher::UpdateCommitInfo(
    logIndex_t inLogIndex)
{
    StMutexLocker theLock(mMutex);
    if (mLatestCommitIndex < inLogIndex) {
        mLatestCommitIndex = inLogIndex;
    }
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "commit index: " << inLogIndex <<
        " latest: " << mLatestCommitIndex <<
    RBS_LOG_EOM;
}

    int
CommitWatcher::WaitFor(
    blockOff_t             inWatermark,
    const CommitFuturePtr& inFuturePtr,
    int                    inTimeoutMs,
    string&                outMsg)
{
    const int theStatus = mWaiter.Wait(*inFuturePtr, inTimeoutMs);
    if (theStatus != AsyncResultBase::kWaitOk) {
        ostringstream theStream;
        theStream << (theStatus == AsyncResultBase::kWaitInterrupted ?
                "interrupted" : "timed out") <<
            " waiting for commit at watermark: " << inWatermark;
        outMsg = theStream.str();
        return (theStatus == AsyncResultBase::kWaitInterrupted ?
            kErrorInterrupted : kErrorQuorumTimeout);
    }
    const CommitResult& theResult = inFuturePtr->Get();
    if (theResult.mStatus == 0) {
        return kErrorNone;
    }
    StMutexLocker theLock(mMutex);
    Records::iterator const theIt = mRecords.find(inWatermark);
    if (theIt != mRecords.end() && theIt->second.mFuturePtr == inFuturePtr) {
        mRecords.erase(theIt);
    }
    outMsg = theResult.mStatusMsg;
    return (theResult.mStatus < 0 ? theResult.mStatus : kErrorCommit);
}

    int
CommitWatcher::ReleaseCommitted(
    logIndex_t inCommittedIndex,
    string&    outMsg)
{
    StMutexLocker theLock(mMutex);
    for (Records::iterator theIt = mRecords.begin();
            theIt != mRecords.end(); ) {
        const CommitFuturePtr& thePtr = theIt->second.mFuturePtr;
        if (! thePtr->IsDone()) {
            ++theIt;
            continue;
        }
        const CommitResult& theResult = thePtr->Get();
        if (theResult.mStatus != 0) {
            const int theStatus = theResult.mStatus;
            outMsg = theResult.mStatusMsg;
            mRecords.erase(theIt);
            return (theStatus < 0 ? theStatus : kErrorCommit);
        }
        if (inCommittedIndex < theResult.mLogIndex) {
            ++theIt;
            continue;
        }
        if (mAckedWatermark < theIt->first) {
            mAckedWatermark = theIt->first;
        }
        mRecords.erase(theIt++);
    }
    return kErrorNone;
}

    int
CommitWatcher::Watch(
    bool        inEarliestFlag,
    int         inTimeoutMs,
    WatchReply& outReply,
    string&     outMsg)
{
    PipelineTransport* theTransportPtr;
    blockOff_t         theWatermark;
    CommitFuturePtr    theFuturePtr;
    {
        StMutexLocker theLock(mMutex);
        if (mRecords.empty()) {
            return kErrorNone;
        }
        if (! mTransportPtr) {
            outMsg = "commit watcher has no transport";
            return kErrorInvariant;
        }
        theTransportPtr = mTransportPtr;
        Records::const_iterator const theIt = inEarliestFlag ?
            mRecords.begin() : --mRecords.end();
        theWatermark = theIt->first;
        theFuturePtr = theIt->second.mFuturePtr;
    }
    int theStatus = WaitFor(theWatermark, theFuturePtr, inTimeoutMs, outMsg);
    if (theStatus != kErrorNone) {
        return theStatus;
    }
    logIndex_t theLogIndex = theFuturePtr->Get().mLogIndex;
    if (! inEarliestFlag) {
        StMutexLocker theLock(mMutex);
        if (theLogIndex < mLatestCommitIndex) {
            theLogIndex = mLatestCommitIndex;
        }
    }
    WatchReply theReply;
    theStatus = theTransportPtr->WatchForCommit(
        theLogIndex, inTimeoutMs, theReply);
    if (theStatus != 0) {
        ostringstream theStream;
        theStream << "watch for commit log index: " << theLogIndex <<
            " watermark: " << theWatermark <<
            " failed: " << ErrorCodeToString(theStatus);
        outMsg = theStream.str();
        return (theStatus == -ETIMEDOUT ? kErrorQuorumTimeout :
            (theStatus < 0 ? theStatus : kErrorCommit));
    }
    if (theReply.mCommittedIndex < theLogIndex) {
        theReply.mCommittedIndex = theLogIndex;
    }
    {
        StMutexLocker theLock(mMutex);
        for (Replicas::const_iterator theIt = theReply.mLaggingReplicas.begin();
                theIt != theReply.mLaggingReplicas.end();
                ++theIt) {
            mFailedReplicas.insert(*theIt);
        }
    }
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "watch " << (inEarliestFlag ? "earliest" : "latest") <<
        " watermark: " << theWatermark <<
        " log index: " << theLogIndex <<
        " committed: " << theReply.mCommittedIndex <<
        " lagging: " << theReply.mLaggingReplicas.size() <<
    RBS_LOG_EOM;
    outReply = theReply;
    return ReleaseCommitted(theReply.mCommittedIndex, outMsg);
}

    int
CommitWatcher::WaitForAll(
    int     inTimeoutMs,
    string& outMsg)
{
    typedef vector<pair<blockOff_t, CommitFuturePtr> > Pending;
    Pending thePending;
    {
        StMutexLocker theLock(mMutex);
        thePending.reserve(mRecords.size());
        for (Records::const_iterator theIt = mRecords.begin();
                theIt != mRecords.end();
                ++theIt) {
            thePending.push_back(
                make_pair(theIt->first, theIt->second.mFuturePtr));
        }
    }
    for (Pending::const_iterator theIt = thePending.begin();
            theIt != thePending.end();
            ++theIt) {
        const int theStatus =
            WaitFor(theIt->first, theIt->second, inTimeoutMs, outMsg);
        if (theStatus != kErrorNone) {
            return theStatus;
        }
    }
    return kErrorNone;
}

    void
CommitWatcher::Drain()
{
    StMutexLocker theLock(mMutex);
    if (! mRecords.empty()) {
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "draining commit records: " << mRecords.size() <<
        RBS_LOG_EOM;
    }
    mRecords.clear();
    mLatestCommitIndex = -1;
    mTransportPtr = 0;
}

    bool
CommitWatcher::IsTracked(
    blockOff_t inWatermark) const
{
    StMutexLocker theLock(mMutex);
    return (mRecords.find(inWatermark) != mRecords.end());
}

    size_t
CommitWatcher::GetTrackedCount() const
{
    StMutexLocker theLock(mMutex);
    return mRecords.size();
}

    logIndex_t
CommitWatcher::GetLatestCommitIndex() const
{
    StMutexLocker theLock(mMutex);
    return mLatestCommitIndex;
}

    blockOff_t
CommitWatcher::GetAckedWatermark() const
{
    StMutexLocker theLock(mMutex);
    return mAckedWatermark;
}

    Replicas
CommitWatcher::GetFailedReplicas() const
{
    StMutexLocker theLock(mMutex);
    return Replicas(mFailedReplicas.begin(), mFailedReplicas.end());
}

}} // namespace RBS::client
