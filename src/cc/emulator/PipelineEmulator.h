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
// \brief In process replica pipeline emulator. Implements the pipeline client
// factory and transport with fault injection, for tests and the block writer
// tool.
//
//----------------------------------------------------------------------------

#ifndef EMULATOR_PIPELINE_EMULATOR_H
#define EMULATOR_PIPELINE_EMULATOR_H

#include "libclient/PipelineTransport.h"
#include "common/Mutex.h"
#include "common/Thread.h"

#include <boost/shared_ptr.hpp>

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace RBS
{
using std::deque;
using std::map;
using std::string;
using std::vector;
using client::BlockData;
using client::BlockId;
using client::PipelineDescriptor;
using client::PipelineTransport;
using client::Replicas;

// Operations are completed in order by the emulator thread. Each replica
// applies a successful commit as a single replacement of its block snapshot.
class PipelineEmulator : public client::PipelineClientFactory, private Runnable
{
public:
    typedef boost::shared_ptr<const BlockData> BlockDataPtr;

    struct CommitRecord
    {
        CommitRecord()
            : mBlockData(),
              mFinalFlag(false),
              mStatus(0),
              mLogIndex(-1)
            {}

        BlockData  mBlockData; // As sent by the client.
        bool       mFinalFlag;
        int        mStatus;
        logIndex_t mLogIndex;
    };
    typedef vector<CommitRecord> Commits;
    typedef vector<bool>         SyncFlags;
    struct Counters
    {
        Counters()
            : mAcquireCount(0),
              mReleaseCount(0),
              mInvalidateCount(0),
              mStartCount(0),
              mSendCount(0),
              mSendByteCount(0),
              mCommitCount(0),
              mCloseCount(0),
              mWatchCount(0),
              mCancelCount(0)
            {}

        int64_t mAcquireCount;
        int64_t mReleaseCount;
        int64_t mInvalidateCount;
        int64_t mStartCount;
        int64_t mSendCount;
        int64_t mSendByteCount;
        int64_t mCommitCount;
        int64_t mCloseCount;
        int64_t mWatchCount;
        int64_t mCancelCount;
    };

    PipelineEmulator(
        const char* inLogPrefixPtr = 0);
    virtual ~PipelineEmulator();
    static PipelineDescriptor MakePipeline(
        int64_t inId,
        int     inReplicaCount = NUM_REPLICAS_PER_PIPELINE);
    virtual int Acquire(
        const PipelineDescriptor& inPipeline,
        PipelineTransport*&       outTransportPtr);
    virtual void Release(
        PipelineTransport& inTransport,
        bool               inInvalidateFlag);

    // Fault injection. The "nth" operations are counted from 1 across all
    // transports.
    void SetAcquireStatus(
        int inStatus);
    void SetStartStatus(
        int inStatus);
    void SetChunkSendStatus(
        int64_t inNth,
        int     inStatus);
    void SetCommitStatus(
        int64_t inNth,
        int     inStatus);
    // Replace the block id in the nth commit response.
    void SetCommitResponseBlockId(
        int64_t        inNth,
        const BlockId& inBlockId);
    void SetCloseStatus(
        int inStatus);
    // Lagging replica does not apply commits.
    void SetReplicaLagging(
        int  inReplicaIndex,
        bool inLaggingFlag);
    // While paused, queued operations are not completed.
    void Pause();
    void Resume();

    Counters GetCounters() const;
    Commits GetCommits() const;
    SyncFlags GetSyncFlags() const;
    // Returns null if the replica has no committed snapshot.
    BlockDataPtr GetCommittedBlock(
        int inReplicaIndex) const;
    logIndex_t GetCommittedLogIndex() const;
    size_t GetPendingCount() const;
    // Returns false on timeout.
    bool WaitForIdle(
        int inTimeoutMs);
private:
    class Transport;
    class Op;
    typedef deque<Op*>            Queue;
    typedef map<int64_t, int>     StatusMap;
    typedef map<int64_t, BlockId> BlockIdMap;
    typedef vector<BlockDataPtr>  ReplicaBlocks;
    typedef vector<logIndex_t>    ReplicaIndexes;
    typedef vector<bool>          LaggingFlags;

    mutable Mutex    mMutex;
    CondVar          mCond;
    CondVar          mCommitCond;
    Queue            mQueue;
    bool             mStopFlag;
    bool             mPausedFlag;
    int              mInFlightCount;
    int              mAcquireStatus;
    int              mStartStatus;
    int              mCloseStatus;
    StatusMap        mSendStatus;
    StatusMap        mCommitStatus;
    BlockIdMap       mCommitBlockIds;
    LaggingFlags     mLaggingFlags;
    ReplicaBlocks    mReplicaBlocks;
    ReplicaIndexes   mReplicaIndexes;
    logIndex_t       mLogIndex;
    Counters         mCounters;
    Commits          mCommits;
    SyncFlags        mSyncFlags;
    string           mLogPrefix;
    Thread           mThread;

    virtual void Run();
    void Enqueue(
        Op& inOp);
    void Process(
        Op& inOp);
    void CancelPending(
        const Transport& inTransport);
    int WatchForCommit(
        const Transport&    inTransport,
        logIndex_t          inLogIndex,
        int                 inTimeoutMs,
        client::WatchReply& outReply);
    logIndex_t GetQuorumIndex(
        const Transport& inTransport,
        logIndex_t       inLogIndex,
        Replicas&        outLagging) const;
    friend class Transport;
private:
    PipelineEmulator(
        const PipelineEmulator& inEmulator);
    PipelineEmulator& operator=(
        const PipelineEmulator& inEmulator);
};

} // namespace RBS

#endif /* EMULATOR_PIPELINE_EMULATOR_H */
