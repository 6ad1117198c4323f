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
// \brief Replicated pipeline transport interfaces.
//
// The transport and its factory are supplied by the caller. The writer only
// uses the asynchronous primitives declared here, and interprets their
// results.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_PIPELINE_TRANSPORT_H
#define LIBCLIENT_PIPELINE_TRANSPORT_H

#include "AsyncResult.h"
#include "BlockData.h"
#include "common/rbsdecls.h"

#include <string>
#include <vector>
#include <ostream>

namespace RBS
{
namespace client
{
using std::string;
using std::vector;
using std::ostream;

struct ReplicaInfo
{
    ReplicaInfo()
        : mUuid(),
          mLocation()
        {}
    ReplicaInfo(
        const string&         inUuid,
        const ServerLocation& inLocation)
        : mUuid(inUuid),
          mLocation(inLocation)
        {}
    bool operator==(const ReplicaInfo& inOther) const
        { return (mUuid == inOther.mUuid); }
    bool operator<(const ReplicaInfo& inOther) const
        { return (mUuid < inOther.mUuid); }

    string         mUuid;
    ServerLocation mLocation;
};

inline static ostream&
operator<<(ostream& inStream, const ReplicaInfo& inReplica)
    { return (inStream << inReplica.mUuid << "@" << inReplica.mLocation); }

typedef vector<ReplicaInfo> Replicas;

struct PipelineDescriptor
{
    PipelineDescriptor()
        : mId(-1),
          mReplicas()
        {}

    int64_t  mId;
    Replicas mReplicas;
};

struct SendResult
{
    SendResult(
        int           inStatus = 0,
        const string& inMsg    = string())
        : mStatus(inStatus),
          mStatusMsg(inMsg),
          mOffset(-1),
          mLength(0)
        {}

    int        mStatus;
    string     mStatusMsg;
    blockOff_t mOffset;
    blockOff_t mLength;
};

struct CommitResult
{
    CommitResult(
        int           inStatus = 0,
        const string& inMsg    = string())
        : mStatus(inStatus),
          mStatusMsg(inMsg),
          mBlockId(),
          mLogIndex(-1)
        {}

    int        mStatus;
    string     mStatusMsg;
    BlockId    mBlockId;  // Updated commit sequence number on success.
    logIndex_t mLogIndex; // Replication log position of the commit.
};

struct CloseResult
{
    CloseResult(
        int           inStatus = 0,
        const string& inMsg    = string())
        : mStatus(inStatus),
          mStatusMsg(inMsg)
        {}

    int    mStatus;
    string mStatusMsg;
};

struct WatchReply
{
    WatchReply()
        : mCommittedIndex(-1),
          mLaggingReplicas()
        {}

    logIndex_t mCommittedIndex; // Log index committed by quorum.
    Replicas   mLaggingReplicas; // Replicas behind the requested index.
};

typedef AsyncResult<SendResult>   SendFuture;
typedef AsyncResult<CommitResult> CommitFuture;
typedef AsyncResult<CloseResult>  CloseFuture;
typedef SendFuture::Ptr           SendFuturePtr;
typedef CommitFuture::Ptr         CommitFuturePtr;
typedef CloseFuture::Ptr          CloseFuturePtr;

// Streaming connection to a replica pipeline. All methods are invoked from
// the writer's caller thread. Results are completed from the transport's own
// threads, in any order.
class PipelineTransport
{
public:
    virtual const PipelineDescriptor& GetPipeline() const = 0;
    // Opens data stream for the block. Returns 0 on success.
    virtual int StartStream(
        const BlockId& inBlockId) = 0;
    // The transport copies the data before return.
    virtual SendFuturePtr SendChunk(
        const char* inBufPtr,
        size_t      inLength,
        blockOff_t  inOffset,
        bool        inSyncFlag) = 0;
    // The replica set applies the commit as single replace of the block
    // chunk list and metadata. Final flag means that no more chunks follow.
    virtual CommitFuturePtr SendMetadataCommit(
        const BlockData& inBlockData,
        bool             inFinalFlag) = 0;
    virtual CloseFuturePtr CloseStream() = 0;
    // Blocks until the log index is committed by quorum, or timeout. Returns
    // 0 on success, -ETIMEDOUT if quorum was not reached in time.
    virtual int WatchForCommit(
        logIndex_t  inLogIndex,
        int         inTimeoutMs,
        WatchReply& outReply) = 0;
protected:
    PipelineTransport()
        {}
    virtual ~PipelineTransport()
        {}
};

// Pool of pipeline connections.
class PipelineClientFactory
{
public:
    virtual int Acquire(
        const PipelineDescriptor& inPipeline,
        PipelineTransport*&       outTransportPtr) = 0;
    // Invalidate means that the transport must be discarded, not reused. The
    // release completes all outstanding results of the transport, with
    // -ECANCELED status, before it returns.
    virtual void Release(
        PipelineTransport& inTransport,
        bool               inInvalidateFlag) = 0;
protected:
    PipelineClientFactory()
        {}
    virtual ~PipelineClientFactory()
        {}
};

}} // namespace RBS::client

#endif /* LIBCLIENT_PIPELINE_TRANSPORT_H */
