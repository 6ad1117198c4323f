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

#ifndef LIBCLIENT_COMMIT_WATCHER_H
#define LIBCLIENT_COMMIT_WATCHER_H

#include "PipelineTransport.h"
#include "common/Mutex.h"

#include <map>
#include <set>
#include <string>

namespace RBS
{
namespace client
{
using std::map;
using std::set;
using std::string;

// Tracked commit records and failed replica set are accessed from the writer
// caller thread, and from the completion executor, and are protected by the
// watcher mutex. Waits are performed without holding the mutex.
class CommitWatcher
{
public:
    enum
    {
        kErrorNone          = 0,
        kErrorCommit        = -ECOMMITFAILED,
        kErrorQuorumTimeout = -EQUORUMTIMEOUT,
        kErrorInvariant     = -EINVARIANT,
        kErrorInterrupted   = -EWAITINTERRUPTED
    };

    CommitWatcher(
        ResultWaiter& inWaiter,
        const char*   inLogPrefixPtr = 0);
    ~CommitWatcher();
    void SetTransport(
        PipelineTransport* inTransportPtr);
    void SetLogPrefix(
        const string& inPrefix)
        { mLogPrefix = inPrefix; }
    // A given watermark is committed exactly once. Tracking the same watermark
    // twice returns kErrorInvariant, and the existing record is retained.
    int Track(
        blockOff_t             inWatermark,
        const CommitFuturePtr& inFuturePtr);
    // Invoked from the completion executor with log index of successful
    // commit. The latest watch waits for the highest reported index, even if
    // it belongs to an earlier watermark.
    void UpdateCommitInfo(
        logIndex_t inLogIndex);
    // Waits for the oldest tracked commit to be confirmed by quorum.
    int WatchEarliest(
        int         inTimeoutMs,
        WatchReply& outReply,
        string&     outMsg)
        { return Watch(true, inTimeoutMs, outReply, outMsg); }
    // Waits for the most recently issued commit to be confirmed by quorum.
    int WatchLatest(
        int         inTimeoutMs,
        WatchReply& outReply,
        string&     outMsg)
        { return Watch(false, inTimeoutMs, outReply, outMsg); }
    // Waits for all tracked commit responses, without quorum watch.
    int WaitForAll(
        int     inTimeoutMs,
        string& outMsg);
    // Releases all records and detaches transport. Does not block.
    void Drain();
    bool IsTracked(
        blockOff_t inWatermark) const;
    size_t GetTrackedCount() const;
    logIndex_t GetLatestCommitIndex() const;
    blockOff_t GetAckedWatermark() const;
    Replicas GetFailedReplicas() const;
private:
    struct Record
    {
        Record(
            const CommitFuturePtr& inFuturePtr = CommitFuturePtr())
            : mFuturePtr(inFuturePtr)
            {}
        CommitFuturePtr mFuturePtr;
    };
    typedef map<blockOff_t, Record> Records;
    typedef set<ReplicaInfo>        FailedReplicas;

    mutable Mutex      mMutex;
    ResultWaiter&      mWaiter;
    PipelineTransport* mTransportPtr;
    Records            mRecords;
    logIndex_t         mLatestCommitIndex;
    FailedReplicas     mFailedReplicas;
    blockOff_t         mAckedWatermark;
    string             mLogPrefix;

    int Watch(
        bool        inEarliestFlag,
        int         inTimeoutMs,
        WatchReply& outReply,
        string&     outMsg);
    int WaitFor(
        blockOff_t             inWatermark,
        const CommitFuturePtr& inFuturePtr,
        int                    inTimeoutMs,
        string&                outMsg);
    int ReleaseCommitted(
        logIndex_t inCommittedIndex,
        string&    outMsg);
private:
    CommitWatcher(
        const CommitWatcher& inWatcher);
    CommitWatcher& operator=(
        const CommitWatcher& inWatcher);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_COMMIT_WATCHER_H */
