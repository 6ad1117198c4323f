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
// \brief In process replica pipeline emulator implementation.
//
//----------------------------------------------------------------------------

#include "PipelineEmulator.h"

#include "common/MsgLogger.h"
#include "common/rbserrno.h"
#include "common/time.h"
#include "rbsio/checksum.h"

#include <algorithm>
#include <functional>
#include <sstream>

#include <errno.h>

namespace RBS
{
using std::greater;
using std::ostringstream;
using std::sort;
using client::ChunkInfo;
using client::CloseFuture;
using client::CloseFuturePtr;
using client::CloseResult;
using client::CommitFuture;
using client::CommitFuturePtr;
using client::CommitResult;
using client::ReplicaInfo;
using client::SendFuture;
using client::SendFuturePtr;
using client::SendResult;
using client::WatchReply;

class PipelineEmulator::Transport : public PipelineTransport
{
public:
    Transport(
        PipelineEmulator&         inOuter,
        const PipelineDescriptor& inPipeline)
        : PipelineTransport(),
          mOuter(inOuter),
          mPipeline(inPipeline),
          mBlockId(),
          mCommitSeq(0),
          mStartedFlag(false),
          mClosedFlag(false),
          mData()
        {}
    virtual ~Transport()
        {}
    virtual const PipelineDescriptor& GetPipeline() const
        { return mPipeline; }
    virtual int StartStream(
        const BlockId& inBlockId);
    virtual SendFuturePtr SendChunk(
        const char* inBufPtr,
        size_t      inLength,
        blockOff_t  inOffset,
        bool        inSyncFlag);
    virtual CommitFuturePtr SendMetadataCommit(
        const BlockData& inBlockData,
        bool             inFinalFlag);
    virtual CloseFuturePtr CloseStream();
    virtual int WatchForCommit(
        logIndex_t  inLogIndex,
        int         inTimeoutMs,
        WatchReply& outReply)
    {
        return mOuter.WatchForCommit(
            *this, inLogIndex, inTimeoutMs, outReply);
    }

    PipelineEmulator&        mOuter;
    const PipelineDescriptor mPipeline;
    BlockId                  mBlockId;
    seq_t                    mCommitSeq;
    bool                     mStartedFlag;
    bool                     mClosedFlag;
    string                   mData;
private:
    Transport(
        const Transport& inTransport);
    Transport& operator=(
        const Transport& inTransport);
};

class PipelineEmulator::Op
{
public:
    enum Type
    {
        kTypeSend,
        kTypeCommit,
        kTypeClose
    };

    Op(
        Transport& inTransport,
        Type       inType)
        : mTransport(inTransport),
          mType(inType),
          mSendPtr(),
          mCommitPtr(),
          mClosePtr(),
          mData(),
          mOffset(0),
          mBlockData(),
          mFinalFlag(false),
          mSendResult(),
          mCommitResult(),
          mCloseResult()
        {}
    void Complete()
    {
        switch (mType) {
            case kTypeSend:   mSendPtr->Done(mSendResult);     break;
            case kTypeCommit: mCommitPtr->Done(mCommitResult); break;
            case kTypeClose:  mClosePtr->Done(mCloseResult);   break;
        }
    }
    void Cancel(
        int           inStatus,
        const string& inMsg)
    {
        mSendResult   = SendResult(inStatus, inMsg);
        mCommitResult = CommitResult(inStatus, inMsg);
        mCloseResult  = CloseResult(inStatus, inMsg);
        Complete();
    }

    Transport&      mTransport;
    const Type      mType;
    SendFuturePtr   mSendPtr;
    CommitFuturePtr mCommitPtr;
    CloseFuturePtr  mClosePtr;
    string          mData;
    blockOff_t      mOffset;
    BlockData       mBlockData;
    bool            mFinalFlag;
    SendResult      mSendResult;
    CommitResult    mCommitResult;
    CloseResult     mCloseResult;
private:
    Op(
        const Op& inOp);
    Op& operator=(
        const Op& inOp);
};

    int
PipelineEmulator::Transport::StartStream(
    const BlockId& inBlockId)
{
    StMutexLocker theLock(mOuter.mMutex);
    mOuter.mCounters.mStartCount++;
    if (mOuter.mStartStatus != 0) {
        return mOuter.mStartStatus;
    }
    if (mStartedFlag) {
        return -EINVAL;
    }
    mBlockId     = inBlockId;
    mCommitSeq   = inBlockId.mCommitSeq;
    mStartedFlag = true;
    return 0;
}

    SendFuturePtr
PipelineEmulator::Transport::SendChunk(
    const char* inBufPtr,
    size_t      inLength,
    blockOff_t  inOffset,
    bool        inSyncFlag)
{
    SendFuturePtr const theResultPtr(new SendFuture());
    StMutexLocker theLock(mOuter.mMutex);
    if (! mStartedFlag || mClosedFlag || inOffset < 0 ||
            (! inBufPtr && 0 < inLength)) {
        theLock.Unlock();
        theResultPtr->Done(SendResult(-EPIPE, "stream is not open"));
        return theResultPtr;
    }
    Op& theOp = *(new Op(*this, Op::kTypeSend));
    theOp.mSendPtr = theResultPtr;
    theOp.mData.assign(inBufPtr, inLength);
    theOp.mOffset = inOffset;
    mOuter.mSyncFlags.push_back(inSyncFlag);
    mOuter.Enqueue(theOp);
    return theResultPtr;
}

    CommitFuturePtr
PipelineEmulator::Transport::SendMetadataCommit(
    const BlockData& inBlockData,
    bool             inFinalFlag)
{
    CommitFuturePtr const theResultPtr(new CommitFuture());
    StMutexLocker theLock(mOuter.mMutex);
    if (! mStartedFlag || mClosedFlag) {
        theLock.Unlock();
        theResultPtr->Done(CommitResult(-EPIPE, "stream is not open"));
        return theResultPtr;
    }
    Op& theOp = *(new Op(*this, Op::kTypeCommit));
    theOp.mCommitPtr = theResultPtr;
    theOp.mBlockData = inBlockData;
    theOp.mFinalFlag = inFinalFlag;
    mOuter.Enqueue(theOp);
    return theResultPtr;
}

    CloseFuturePtr
PipelineEmulator::Transport::CloseStream()
{
    CloseFuturePtr const theResultPtr(new CloseFuture());
    StMutexLocker theLock(mOuter.mMutex);
    if (! mStartedFlag || mClosedFlag) {
        theLock.Unlock();
        theResultPtr->Done(CloseResult(-EPIPE, "stream is not open"));
        return theResultPtr;
    }
    mClosedFlag = true;
    Op& theOp = *(new Op(*this, Op::kTypeClose));
    theOp.mClosePtr = theResultPtr;
    mOuter.Enqueue(theOp);
    return theResultPtr;
}

PipelineEmulator::PipelineEmulator(
    const char* inLogPrefixPtr)
    : PipelineClientFactory(),
      Runnable(),
      mMutex(),
      mCond(),
      mCommitCond(),
      mQueue(),
      mStopFlag(false),
      mPausedFlag(false),
      mInFlightCount(0),
      mAcquireStatus(0),
      mStartStatus(0),
      mCloseStatus(0),
      mSendStatus(),
      mCommitStatus(),
      mCommitBlockIds(),
      mLaggingFlags(MAX_REPLICAS_PER_PIPELINE, false),
      mReplicaBlocks(MAX_REPLICAS_PER_PIPELINE),
      mReplicaIndexes(MAX_REPLICAS_PER_PIPELINE, logIndex_t(-1)),
      mLogIndex(0),
      mCounters(),
      mCommits(),
      mSyncFlags(),
      mLogPrefix(inLogPrefixPtr ? inLogPrefixPtr : "PE "),
      mThread(this, "PipelineEmulator")
{
    mThread.Start();
}

PipelineEmulator::~PipelineEmulator()
{
    StMutexLocker theLock(mMutex);
    mStopFlag = true;
    mCond.NotifyAll();
    mCommitCond.NotifyAll();
    theLock.Unlock();
    mThread.Join();
    while (! mQueue.empty()) {
        Op* const theOpPtr = mQueue.front();
        mQueue.pop_front();
        theOpPtr->Cancel(-ECANCELED, "emulator shutdown");
        delete theOpPtr;
    }
}

    /* static */ PipelineDescriptor
PipelineEmulator::MakePipeline(
    int64_t inId,
    int     inReplicaCount)
{
    PipelineDescriptor theRet;
    theRet.mId = inId;
    for (int i = 0; i < inReplicaCount; i++) {
        ostringstream theStream;
        theStream << "replica-" << inId << "-" << i;
        theRet.mReplicas.push_back(ReplicaInfo(
            theStream.str(), ServerLocation("127.0.0.1", 22000 + i)));
    }
    return theRet;
}

    int
PipelineEmulator::Acquire(
    const PipelineDescriptor& inPipeline,
    PipelineTransport*&       outTransportPtr)
{
    StMutexLocker theLock(mMutex);
    mCounters.mAcquireCount++;
    outTransportPtr = 0;
    if (mAcquireStatus != 0) {
        return mAcquireStatus;
    }
    if (inPipeline.mReplicas.empty() ||
            MAX_REPLICAS_PER_PIPELINE < (int)inPipeline.mReplicas.size()) {
        RBS_LOG_STREAM_ERROR << mLogPrefix <<
            "invalid pipeline: " << inPipeline.mId <<
            " replicas: " << inPipeline.mReplicas.size() <<
        RBS_LOG_EOM;
        return -EINVAL;
    }
    outTransportPtr = new Transport(*this, inPipeline);
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "acquired pipeline: " << inPipeline.mId <<
        " replicas: " << inPipeline.mReplicas.size() <<
    RBS_LOG_EOM;
    return 0;
}

    void
PipelineEmulator::Release(
    PipelineTransport& inTransport,
    bool               inInvalidateFlag)
{
    Transport& theTransport = static_cast<Transport&>(inTransport);
    Queue      theCanceled;
    StMutexLocker theLock(mMutex);
    mCounters.mReleaseCount++;
    if (inInvalidateFlag) {
        mCounters.mInvalidateCount++;
    }
    for (Queue::iterator theIt = mQueue.begin(); theIt != mQueue.end(); ) {
        if (&(*theIt)->mTransport == &theTransport) {
            theCanceled.push_back(*theIt);
            theIt = mQueue.erase(theIt);
        } else {
            ++theIt;
        }
    }
    mCounters.mCancelCount += theCanceled.size();
    if (! theCanceled.empty() && ! inInvalidateFlag) {
        RBS_LOG_STREAM_WARN << mLogPrefix <<
            "release with pending operations: " << theCanceled.size() <<
        RBS_LOG_EOM;
    }
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "release pipeline: " << theTransport.mPipeline.mId <<
        " invalidate: " << inInvalidateFlag <<
        " canceled: " << theCanceled.size() <<
    RBS_LOG_EOM;
    theLock.Unlock();
    while (! theCanceled.empty()) {
        Op* const theOpPtr = theCanceled.front();
        theCanceled.pop_front();
        theOpPtr->Cancel(-ECANCELED, "pipeline transport released");
        delete theOpPtr;
    }
    // Wait for in flight completion, if any.
    StMutexLocker theWaitLock(mMutex);
    while (0 < mInFlightCount) {
        mCond.Wait(mMutex);
    }
    mCommitCond.NotifyAll();
    delete &theTransport;
}

    void
PipelineEmulator::Enqueue(
    Op& inOp)
{
    mQueue.push_back(&inOp);
    mCond.NotifyAll();
}

    void
PipelineEmulator::Run()
{
    StMutexLocker theLock(mMutex);
    for (; ;) {
        while (! mStopFlag && (mPausedFlag || mQueue.empty())) {
            mCond.Wait(mMutex);
        }
        if (mStopFlag) {
            break;
        }
        Op& theOp = *mQueue.front();
        mQueue.pop_front();
        mInFlightCount++;
        Process(theOp);
        {
            StMutexUnlocker theUnlock(mMutex);
            theOp.Complete();
            delete &theOp;
        }
        mInFlightCount--;
        mCond.NotifyAll();
    }
}

    void
PipelineEmulator::Process(
    Op& inOp)
{
    Transport& theTransport = inOp.mTransport;
    switch (inOp.mType) {
        case Op::kTypeSend: {
            const int64_t theNth = ++mCounters.mSendCount;
            StatusMap::const_iterator const theIt = mSendStatus.find(theNth);
            if (theIt != mSendStatus.end()) {
                inOp.mSendResult = SendResult(theIt->second,
                    "injected chunk send failure");
                break;
            }
            const size_t theOffset = (size_t)inOp.mOffset;
            if (theTransport.mData.size() < theOffset) {
                theTransport.mData.resize(theOffset);
            }
            theTransport.mData.replace(
                theOffset, inOp.mData.size(), inOp.mData);
            mCounters.mSendByteCount += inOp.mData.size();
            inOp.mSendResult.mOffset = inOp.mOffset;
            inOp.mSendResult.mLength = (blockOff_t)inOp.mData.size();
            break;
        }
        case Op::kTypeCommit: {
            const int64_t theNth = ++mCounters.mCommitCount;
            CommitRecord theRecord;
            theRecord.mBlockData = inOp.mBlockData;
            theRecord.mFinalFlag = inOp.mFinalFlag;
            StatusMap::const_iterator const theIt = mCommitStatus.find(theNth);
            if (theIt != mCommitStatus.end()) {
                inOp.mCommitResult = CommitResult(theIt->second,
                    "injected commit failure");
            } else if (! inOp.mBlockData.mBlockId.IsSameBlock(
                    theTransport.mBlockId)) {
                ostringstream theStream;
                theStream << "commit block: " << inOp.mBlockData.mBlockId <<
                    " does not match stream block: " << theTransport.mBlockId;
                inOp.mCommitResult = CommitResult(-EINVAL, theStream.str());
            } else {
                const string& theData = theTransport.mData;
                for (BlockData::Chunks::const_iterator
                        theCIt = inOp.mBlockData.mChunks.begin();
                        theCIt != inOp.mBlockData.mChunks.end();
                        ++theCIt) {
                    const ChunkInfo& theChunk = *theCIt;
                    if ((blockOff_t)theData.size() < theChunk.GetEnd() ||
                            Checksum::Verify(
                                theData.data() + theChunk.mOffset,
                                (size_t)theChunk.mLength,
                                theChunk.mChecksum) != 0) {
                        inOp.mCommitResult = CommitResult(-EBADMSG,
                            "chunk verification failed: " + theChunk.mName);
                        break;
                    }
                }
            }
            if (inOp.mCommitResult.mStatus == 0) {
                mLogIndex++;
                BlockData* const theBlockPtr = new BlockData(inOp.mBlockData);
                theBlockPtr->mBlockId.mCommitSeq = ++theTransport.mCommitSeq;
                const BlockDataPtr theCommittedPtr(theBlockPtr);
                const size_t theCount = theTransport.mPipeline.mReplicas.size();
                for (size_t i = 0; i < theCount; i++) {
                    if (mLaggingFlags[i]) {
                        continue;
                    }
                    mReplicaBlocks[i]  = theCommittedPtr;
                    mReplicaIndexes[i] = mLogIndex;
                }
                BlockIdMap::const_iterator const theBIt =
                    mCommitBlockIds.find(theNth);
                inOp.mCommitResult.mBlockId = theBIt != mCommitBlockIds.end() ?
                    theBIt->second : theCommittedPtr->mBlockId;
                inOp.mCommitResult.mLogIndex = mLogIndex;
                mCommitCond.NotifyAll();
            } else {
                RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                    "commit: " << theNth <<
                    " failed: " << inOp.mCommitResult.mStatusMsg <<
                RBS_LOG_EOM;
            }
            theRecord.mStatus   = inOp.mCommitResult.mStatus;
            theRecord.mLogIndex = inOp.mCommitResult.mLogIndex;
            mCommits.push_back(theRecord);
            break;
        }
        case Op::kTypeClose:
            mCounters.mCloseCount++;
            if (mCloseStatus != 0) {
                inOp.mCloseResult = CloseResult(mCloseStatus,
                    "injected close failure");
            }
            break;
    }
}

    logIndex_t
PipelineEmulator::GetQuorumIndex(
    const Transport& inTransport,
    logIndex_t       inLogIndex,
    Replicas&        outLagging) const
{
    const Replicas& theReplicas = inTransport.mPipeline.mReplicas;
    ReplicaIndexes  theIndexes;
    outLagging.clear();
    for (size_t i = 0; i < theReplicas.size(); i++) {
        theIndexes.push_back(mReplicaIndexes[i]);
        if (mReplicaIndexes[i] < inLogIndex) {
            outLagging.push_back(theReplicas[i]);
        }
    }
    sort(theIndexes.begin(), theIndexes.end(), greater<logIndex_t>());
    const size_t theQuorum = theIndexes.size() / 2 + 1;
    return theIndexes[theQuorum - 1];
}

    int
PipelineEmulator::WatchForCommit(
    const Transport& inTransport,
    logIndex_t       inLogIndex,
    int              inTimeoutMs,
    WatchReply&      outReply)
{
    StMutexLocker theLock(mMutex);
    mCounters.mWatchCount++;
    const int64_t theEnd = microseconds() + int64_t(inTimeoutMs) * 1000;
    for (; ;) {
        Replicas         theLagging;
        const logIndex_t theIndex =
            GetQuorumIndex(inTransport, inLogIndex, theLagging);
        if (inLogIndex <= theIndex) {
            outReply.mCommittedIndex  = theIndex;
            outReply.mLaggingReplicas = theLagging;
            return 0;
        }
        const int64_t theLeft = theEnd - microseconds();
        if (mStopFlag || theLeft <= 0) {
            outReply.mCommittedIndex  = theIndex;
            outReply.mLaggingReplicas = theLagging;
            RBS_LOG_STREAM_INFO << mLogPrefix <<
                "watch log index: " << inLogIndex <<
                " timed out, quorum index: " << theIndex <<
                " lagging: " << theLagging.size() <<
            RBS_LOG_EOM;
            return -ETIMEDOUT;
        }
        mCommitCond.Wait(mMutex, CondVar::Time(theLeft) * 1000);
    }
}

    void
PipelineEmulator::SetAcquireStatus(
    int inStatus)
{
    StMutexLocker theLock(mMutex);
    mAcquireStatus = inStatus;
}

    void
PipelineEmulator::SetStartStatus(
    int inStatus)
{
    StMutexLocker theLock(mMutex);
    mStartStatus = inStatus;
}

    void
PipelineEmulator::SetChunkSendStatus(
    int64_t inNth,
    int     inStatus)
{
    StMutexLocker theLock(mMutex);
    mSendStatus[inNth] = inStatus;
}

    void
PipelineEmulator::SetCommitStatus(
    int64_t inNth,
    int     inStatus)
{
    StMutexLocker theLock(mMutex);
    mCommitStatus[inNth] = inStatus;
}

    void
PipelineEmulator::SetCommitResponseBlockId(
    int64_t        inNth,
    const BlockId& inBlockId)
{
    StMutexLocker theLock(mMutex);
    mCommitBlockIds[inNth] = inBlockId;
}

    void
PipelineEmulator::SetCloseStatus(
    int inStatus)
{
    StMutexLocker theLock(mMutex);
    mCloseStatus = inStatus;
}

    void
PipelineEmulator::SetReplicaLagging(
    int  inReplicaIndex,
    bool inLaggingFlag)
{
    StMutexLocker theLock(mMutex);
    if (inReplicaIndex < 0 || (int)mLaggingFlags.size() <= inReplicaIndex) {
        return;
    }
    mLaggingFlags[inReplicaIndex] = inLaggingFlag;
}

    void
PipelineEmulator::Pause()
{
    StMutexLocker theLock(mMutex);
    mPausedFlag = true;
}

    void
PipelineEmulator::Resume()
{
    StMutexLocker theLock(mMutex);
    mPausedFlag = false;
    mCond.NotifyAll();
}

    PipelineEmulator::Counters
PipelineEmulator::GetCounters() const
{
    StMutexLocker theLock(mMutex);
    return mCounters;
}

    PipelineEmulator::Commits
PipelineEmulator::GetCommits() const
{
    StMutexLocker theLock(mMutex);
    return mCommits;
}

    PipelineEmulator::SyncFlags
PipelineEmulator::GetSyncFlags() const
{
    StMutexLocker theLock(mMutex);
    return mSyncFlags;
}

    PipelineEmulator::BlockDataPtr
PipelineEmulator::GetCommittedBlock(
    int inReplicaIndex) const
{
    StMutexLocker theLock(mMutex);
    if (inReplicaIndex < 0 || (int)mReplicaBlocks.size() <= inReplicaIndex) {
        return BlockDataPtr();
    }
    return mReplicaBlocks[inReplicaIndex];
}

    logIndex_t
PipelineEmulator::GetCommittedLogIndex() const
{
    StMutexLocker theLock(mMutex);
    return mLogIndex;
}

    size_t
PipelineEmulator::GetPendingCount() const
{
    StMutexLocker theLock(mMutex);
    return (mQueue.size() + mInFlightCount);
}

    bool
PipelineEmulator::WaitForIdle(
    int inTimeoutMs)
{
    StMutexLocker theLock(mMutex);
    const int64_t theEnd = microseconds() + int64_t(inTimeoutMs) * 1000;
    while ((! mQueue.empty() && ! mPausedFlag) || 0 < mInFlightCount) {
        const int64_t theLeft = theEnd - microseconds();
        if (theLeft <= 0) {
            return false;
        }
        mCond.Wait(mMutex, CondVar::Time(theLeft) * 1000);
    }
    return true;
}

} // namespace RBS
