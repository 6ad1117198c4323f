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
// \brief Streaming block writer implementation.
//
//----------------------------------------------------------------------------

#include "BlockStreamWriter.h"
#include "ChunkFramer.h"
#include "CommitWatcher.h"
#include "FailureLatch.h"
#include "ResponseExecutor.h"
#include "SyncPolicy.h"

#include "common/MsgLogger.h"
#include "common/Properties.h"
#include "common/rbsatomic.h"
#include "common/rbserrno.h"
#include "common/rbsutils.h"

#include <boost/shared_ptr.hpp>

#include <sstream>
#include <vector>

namespace RBS
{
namespace client
{
using std::ostringstream;
using std::vector;

static const char* const kBlockTypeKey   = "TYPE";
static const char* const kBlockTypeValue = "KEY";

BlockStreamWriter::Config::Config()
    : mStreamBufferSize(int64_t(4) << 20),
      mStreamBufferFlushSize(int64_t(16) << 20),
      mStreamBufferMaxSize(int64_t(32) << 20),
      mSyncSize(0),
      mChecksumType(kChecksumTypeCrc32),
      mBytesPerChecksum(1 << 20),
      mOpTimeoutMs(60 * 1000),
      mWatchTimeoutMs(180 * 1000)
{}

    void
BlockStreamWriter::Config::SetParameters(
    const Properties& inProps,
    const char*       inPrefixPtr)
{
    const string thePrefix = inPrefixPtr ? inPrefixPtr : "";
    mStreamBufferSize = inProps.getValue(
        thePrefix + "stream.bufferSize", mStreamBufferSize);
    mStreamBufferFlushSize = inProps.getValue(
        thePrefix + "stream.flushSize", mStreamBufferFlushSize);
    mStreamBufferMaxSize = inProps.getValue(
        thePrefix + "stream.maxOutstandingSize", mStreamBufferMaxSize);
    mSyncSize = inProps.getValue(
        thePrefix + "stream.syncSize", mSyncSize);
    const char* const theTypePtr = inProps.getValue(
        thePrefix + "checksum.type", (const char*)0);
    if (theTypePtr && ! ParseChecksumType(theTypePtr, mChecksumType)) {
        // Unknown name, rejected by ValidateConfig().
        mChecksumType = ChecksumType(-1);
    }
    mBytesPerChecksum = inProps.getValue(
        thePrefix + "checksum.bytesPerChecksum", mBytesPerChecksum);
    mOpTimeoutMs = inProps.getValue(
        thePrefix + "opTimeoutMs", mOpTimeoutMs);
    mWatchTimeoutMs = inProps.getValue(
        thePrefix + "watchTimeoutMs", mWatchTimeoutMs);
}

class BlockStreamWriter::Impl
{
public:
    typedef BlockStreamWriter Outer;
    typedef Outer::Offset     Offset;

    enum
    {
        kErrorNone          = Outer::kErrorNone,
        kErrorParameters    = Outer::kErrorParameters,
        kErrorTransport     = Outer::kErrorTransport,
        kErrorCommit        = Outer::kErrorCommit,
        kErrorQuorumTimeout = Outer::kErrorQuorumTimeout,
        kErrorInvariant     = Outer::kErrorInvariant,
        kErrorInterrupted   = Outer::kErrorInterrupted
    };

    Impl(
        const BlockId&            inBlockId,
        PipelineClientFactory&    inFactory,
        const PipelineDescriptor& inPipeline,
        const Config&             inConfig,
        const char*               inLogPrefixPtr)
        : mConfig(inConfig),
          mConfigErrMsg(),
          mConfigStatus(Outer::ValidateConfig(mConfig, &mConfigErrMsg)),
          mFactory(inFactory),
          mPipeline(inPipeline),
          mLogPrefix(MakeLogPrefix(inBlockId, inLogPrefixPtr)),
          mBlockIdPtr(new BlockId(inBlockId)),
          mTransportPtr(0),
          mState(kStateNone),
          mCleanupDoneFlag(false),
          mFailure(mLogPrefix.c_str()),
          mWaiter(),
          mExecutor((mLogPrefix + "executor").c_str()),
          mCommitWatcher(mWaiter, mLogPrefix.c_str()),
          mChunkFramer(inBlockId.mLocalId, Checksum(
            mConfigStatus == 0 ? mConfig.mChecksumType : kChecksumTypeNone,
            mConfigStatus == 0 ? uint32_t(mConfig.mBytesPerChecksum) : 1u)),
          mDefaultSyncPolicy(mConfig.mSyncSize),
          mSyncPolicyPtr(&mDefaultSyncPolicy),
          mBlockData(inBlockId),
          mWrittenLength(0),
          mFlushedLength(0),
          mChunkFutures(),
          mCommitFutures(),
          mCloseFuturePtr(),
          mStats()
    {
        mBlockData.mMetadata[kBlockTypeKey] = kBlockTypeValue;
        if (mConfigStatus != kErrorNone) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "invalid configuration: " << mConfigErrMsg <<
            RBS_LOG_EOM;
        }
    }
    ~Impl()
    {
        if (mState == kStateClosed || mState == kStateNone) {
            return;
        }
        RBS_LOG_STREAM_WARN << mLogPrefix <<
            "writer destroyed without close, written: " <<
                GetWrittenLength() <<
            " flushed: " << mFlushedLength <<
        RBS_LOG_EOM;
        mWaiter.Interrupt();
        Cleanup(true);
        mState = kStateClosed;
    }
    int Open()
    {
        if (mState != kStateNone) {
            return (mFailure.IsSet() ? mFailure.GetStatus() :
                kErrorParameters);
        }
        if (mConfigStatus != kErrorNone) {
            return mConfigStatus;
        }
        const BlockId theBlockId = GetBlockId();
        if (theBlockId.mContainerId < 0 || theBlockId.mLocalId < 0) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "invalid block id: " << theBlockId <<
            RBS_LOG_EOM;
            return kErrorParameters;
        }
        PipelineTransport* theTransportPtr = 0;
        int theStatus = mFactory.Acquire(mPipeline, theTransportPtr);
        if (theStatus != 0 || ! theTransportPtr) {
            if (theTransportPtr) {
                mFactory.Release(*theTransportPtr, true);
            }
            ostringstream theStream;
            theStream << "failed to acquire pipeline: " << mPipeline.mId <<
                " " << ErrorCodeToString(theStatus);
            mState = kStateClosed;
            mCleanupDoneFlag = true;
            return Latch(kErrorTransport, theStream.str());
        }
        mTransportPtr = theTransportPtr;
        mCommitWatcher.SetTransport(mTransportPtr);
        mExecutor.Start();
        mState = kStateOpen;
        if ((theStatus = mTransportPtr->StartStream(theBlockId)) != 0) {
            ostringstream theStream;
            theStream << "failed to start stream for block: " <<
                theBlockId << " " << ErrorCodeToString(theStatus);
            Latch(kErrorTransport, theStream.str());
            mState = kStateClosing;
            Cleanup(true);
            mState = kStateClosed;
            return mFailure.GetStatus();
        }
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "opened pipeline: " << mPipeline.mId <<
            " replicas: " << mPipeline.mReplicas.size() <<
            " flush size: " << mConfig.mStreamBufferFlushSize <<
            " max outstanding: " << mConfig.mStreamBufferMaxSize <<
            " checksum: " << ChecksumTypeToString(mConfig.mChecksumType) <<
        RBS_LOG_EOM;
        return kErrorNone;
    }
    int Write(
        const char* inBufPtr,
        size_t      inLength)
    {
        int theStatus = CheckOpen();
        if (theStatus != kErrorNone) {
            return theStatus;
        }
        if (inLength <= 0) {
            return kErrorNone;
        }
        if (! inBufPtr) {
            return kErrorParameters;
        }
        if ((theStatus = ApplyBackpressure(inLength)) != kErrorNone) {
            return theStatus;
        }
        ChunkInfo theChunk;
        if ((theStatus = mChunkFramer.Frame(inBufPtr, inLength, theChunk))
                < 0) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "chunk framing failure: " << ErrorCodeToString(theStatus) <<
            RBS_LOG_EOM;
            return theStatus;
        }
        mStats.mWriteCount++;
        mStats.mWriteByteCount += inLength;
        if ((theStatus = WriteChunkToContainer(inBufPtr, theChunk))
                != kErrorNone) {
            return theStatus;
        }
        if (mConfig.mStreamBufferFlushSize <=
                GetWrittenLength() - mFlushedLength) {
            UpdateFlushLength();
            return ExecutePutBlock(false, false);
        }
        return mFailure.GetStatus();
    }
    int Flush()
    {
        const int theStatus = CheckOpen();
        if (theStatus != kErrorNone) {
            return theStatus;
        }
        return WaitForChunks();
    }
    int Sync()
    {
        const int theStatus = CheckOpen();
        if (theStatus != kErrorNone) {
            return theStatus;
        }
        return HandleFlush(false);
    }
    int Close()
    {
        if (mState == kStateClosed) {
            return (mFailure.IsSet() ? mFailure.GetStatus() : mConfigStatus);
        }
        if (mState == kStateClosing) {
            return kErrorParameters;
        }
        if (mState == kStateNone) {
            mState = kStateClosed;
            mCleanupDoneFlag = true;
            return mConfigStatus;
        }
        mState = kStateClosing;
        int theStatus = mFailure.GetStatus();
        if (theStatus == kErrorNone) {
            theStatus = HandleFlush(true);
        }
        if (theStatus == kErrorNone) {
            theStatus = WaitForClose();
        }
        if (theStatus != kErrorNone) {
            WaitPendingResults();
        }
        const bool theInvalidateFlag = mFailure.IsSet();
        Cleanup(theInvalidateFlag);
        mState = kStateClosed;
        if (theInvalidateFlag) {
            return mFailure.GetStatus();
        }
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "closed block: " << GetBlockId() <<
            " size: " << GetWrittenLength() <<
            " chunks: " << mBlockData.mChunks.size() <<
        RBS_LOG_EOM;
        return kErrorNone;
    }
    void Interrupt()
    {
        RBS_LOG_STREAM_INFO << mLogPrefix << "interrupt" << RBS_LOG_EOM;
        mWaiter.Interrupt();
    }
    void SetSyncPolicy(
        SyncPolicy* inPolicyPtr)
    {
        if (mState != kStateNone) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "sync policy can only be set before open" <<
            RBS_LOG_EOM;
            return;
        }
        mSyncPolicyPtr = inPolicyPtr ? inPolicyPtr : &mDefaultSyncPolicy;
    }
    bool IsOpen() const
        { return (mState == kStateOpen && ! mFailure.IsSet()); }
    bool IsClosed() const
        { return (mState == kStateClosed); }
    bool IsFailed() const
        { return mFailure.IsSet(); }
    Offset GetWrittenLength() const
        { return SyncLoad(const_cast<volatile Offset&>(mWrittenLength)); }
    Offset GetFlushedLength() const
        { return mFlushedLength; }
    Replicas GetFailedReplicas() const
        { return mCommitWatcher.GetFailedReplicas(); }
    bool GetFailure(
        int&    outStatus,
        string& outMsg) const
        { return mFailure.Get(outStatus, outMsg); }
    int GetErrorCode() const
    {
        return (mFailure.IsSet() ? mFailure.GetStatus() : mConfigStatus);
    }
    BlockId GetBlockId() const
    {
        const boost::shared_ptr<const BlockId> thePtr =
            boost::atomic_load(&mBlockIdPtr);
        return *thePtr;
    }
    void GetStats(
        Stats& outStats) const
        { outStats = mStats; }
private:
    enum State
    {
        kStateNone,
        kStateOpen,
        kStateClosing,
        kStateClosed
    };
    typedef vector<SendFuturePtr>   ChunkFutures;
    typedef vector<CommitFuturePtr> CommitFutures;

    // Transport completions are queued to the executor thread, so that the
    // transport threads never run writer code.
    class ChunkSendOp :
        public SendFuture::Completion,
        public ResponseExecutor::Task
    {
    public:
        ChunkSendOp(
            Impl&                inOuter,
            const SendFuturePtr& inResultPtr,
            const SendFuturePtr& inDonePtr,
            const ChunkInfo&     inChunk)
            : SendFuture::Completion(),
              ResponseExecutor::Task(),
              mOuter(inOuter),
              mResultPtr(inResultPtr),
              mDonePtr(inDonePtr),
              mChunk(inChunk)
            {}
        void Start()
            { mResultPtr->Register(*this); }
        virtual void Done(
            SendFuture& /* inResult */)
        {
            if (! mOuter.mExecutor.Enqueue(*this)) {
                Run();
            }
        }
        virtual void Run()
            { mOuter.ChunkSendDone(*this); }
        virtual ~ChunkSendOp()
            {}

        Impl&               mOuter;
        const SendFuturePtr mResultPtr;
        const SendFuturePtr mDonePtr;
        const ChunkInfo     mChunk;
    };
    class CommitOp :
        public CommitFuture::Completion,
        public ResponseExecutor::Task
    {
    public:
        CommitOp(
            Impl&                  inOuter,
            const CommitFuturePtr& inResultPtr,
            const CommitFuturePtr& inDonePtr,
            Offset                 inWatermark,
            bool                   inFinalFlag)
            : CommitFuture::Completion(),
              ResponseExecutor::Task(),
              mOuter(inOuter),
              mResultPtr(inResultPtr),
              mDonePtr(inDonePtr),
              mWatermark(inWatermark),
              mFinalFlag(inFinalFlag)
            {}
        void Start()
            { mResultPtr->Register(*this); }
        virtual void Done(
            CommitFuture& /* inResult */)
        {
            if (! mOuter.mExecutor.Enqueue(*this)) {
                Run();
            }
        }
        virtual void Run()
            { mOuter.CommitDone(*this); }
        virtual ~CommitOp()
            {}

        Impl&                 mOuter;
        const CommitFuturePtr mResultPtr;
        const CommitFuturePtr mDonePtr;
        const Offset          mWatermark;
        const bool            mFinalFlag;
    };
    friend class ChunkSendOp;
    friend class CommitOp;

    const Config                     mConfig;
    string                           mConfigErrMsg;
    const int                        mConfigStatus;
    PipelineClientFactory&           mFactory;
    const PipelineDescriptor         mPipeline;
    const string                     mLogPrefix;
    boost::shared_ptr<const BlockId> mBlockIdPtr;
    PipelineTransport*               mTransportPtr;
    State                            mState;
    bool                             mCleanupDoneFlag;
    FailureLatch                     mFailure;
    ResultWaiter                     mWaiter;
    ResponseExecutor                 mExecutor;
    CommitWatcher                    mCommitWatcher;
    ChunkFramer                      mChunkFramer;
    ByteIntervalSyncPolicy           mDefaultSyncPolicy;
    SyncPolicy*                      mSyncPolicyPtr;
    BlockData                        mBlockData;
    volatile Offset                  mWrittenLength;
    Offset                           mFlushedLength;
    ChunkFutures                     mChunkFutures;
    CommitFutures                    mCommitFutures;
    CloseFuturePtr                   mCloseFuturePtr;
    Stats                            mStats;

    static string MakeLogPrefix(
        const BlockId& inBlockId,
        const char*    inLogPrefixPtr)
    {
        ostringstream theStream;
        if (inLogPrefixPtr && *inLogPrefixPtr) {
            theStream << inLogPrefixPtr << " ";
        }
        theStream << "BW " << inBlockId.mContainerId <<
            "," << inBlockId.mLocalId << " ";
        return theStream.str();
    }
    int Latch(
        int           inStatus,
        const string& inMsg)
    {
        mFailure.Set(inStatus, inMsg);
        return mFailure.GetStatus();
    }
    int CheckOpen() const
    {
        if (mFailure.IsSet()) {
            return mFailure.GetStatus();
        }
        if (mState != kStateOpen) {
            return kErrorParameters;
        }
        return kErrorNone;
    }
    void UpdateFlushLength()
    {
        mFlushedLength = GetWrittenLength();
    }
    int ApplyBackpressure(
        size_t inLength)
    {
        if (mConfig.mStreamBufferMaxSize <= 0) {
            return kErrorNone;
        }
        while (mConfig.mStreamBufferMaxSize < GetWrittenLength() +
                    Offset(inLength) - mCommitWatcher.GetAckedWatermark() &&
                0 < mCommitWatcher.GetTrackedCount()) {
            mStats.mBackpressureCount++;
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "outstanding: " << (GetWrittenLength() -
                    mCommitWatcher.GetAckedWatermark()) <<
                " exceeds: " << mConfig.mStreamBufferMaxSize <<
                " waiting for earliest commit" <<
            RBS_LOG_EOM;
            const int theStatus = WatchForCommit(true);
            if (theStatus != kErrorNone) {
                return theStatus;
            }
        }
        return mFailure.GetStatus();
    }
    int WriteChunkToContainer(
        const char*      inBufPtr,
        const ChunkInfo& inChunk)
    {
        mBlockData.mChunks.push_back(inChunk);
        const bool theSyncFlag = mSyncPolicyPtr->NeedSync(inChunk.GetEnd());
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "writing chunk: " << inChunk <<
            " sync: " << theSyncFlag <<
        RBS_LOG_EOM;
        const SendFuturePtr theResultPtr = mTransportPtr->SendChunk(
            inBufPtr, (size_t)inChunk.mLength, inChunk.mOffset, theSyncFlag);
        const SendFuturePtr theDonePtr(new SendFuture());
        mChunkFutures.push_back(theDonePtr);
        SyncAddAndFetch(mWrittenLength, inChunk.mLength);
        if (! theResultPtr) {
            const string theMsg = "Failed to write chunk " + inChunk.mName +
                ": transport returned no result";
            theDonePtr->Done(SendResult(kErrorTransport, theMsg));
            return Latch(kErrorTransport, theMsg);
        }
        ChunkSendOp* const theOpPtr =
            new ChunkSendOp(*this, theResultPtr, theDonePtr, inChunk);
        theOpPtr->Start();
        return kErrorNone;
    }
    void ChunkSendDone(
        ChunkSendOp& inOp)
    {
        SendResult theResult = inOp.mResultPtr->Get();
        if (theResult.mStatus != 0) {
            ostringstream theStream;
            theStream << "Failed to write chunk " << inOp.mChunk.mName <<
                " into block " << GetBlockId() <<
                ": " << ErrorCodeToString(theResult.mStatus) <<
                (theResult.mStatusMsg.empty() ? "" : " ") <<
                theResult.mStatusMsg;
            Latch(kErrorTransport, theStream.str());
            theResult.mStatus    = kErrorTransport;
            theResult.mStatusMsg = theStream.str();
        }
        const SendFuturePtr theDonePtr = inOp.mDonePtr;
        delete &inOp;
        theDonePtr->Done(theResult);
    }
    void CommitDone(
        CommitOp& inOp)
    {
        CommitResult theResult = inOp.mResultPtr->Get();
        if (theResult.mStatus != 0) {
            ostringstream theStream;
            theStream << "metadata commit at watermark: " <<
                inOp.mWatermark << " failed: " <<
                ErrorCodeToString(theResult.mStatus) <<
                (theResult.mStatusMsg.empty() ? "" : " ") <<
                theResult.mStatusMsg;
            Latch(kErrorCommit, theStream.str());
            theResult.mStatus    = kErrorCommit;
            theResult.mStatusMsg = theStream.str();
        } else if (! theResult.mBlockId.IsSameBlock(GetBlockId())) {
            ostringstream theStream;
            theStream << "metadata commit at watermark: " <<
                inOp.mWatermark << " invalid block id in response: " <<
                theResult.mBlockId << " expected: " << GetBlockId();
            Latch(kErrorCommit, theStream.str());
            theResult.mStatus    = kErrorCommit;
            theResult.mStatusMsg = theStream.str();
        } else if (mFailure.Get(theResult.mStatus, theResult.mStatusMsg)) {
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "commit at watermark: " << inOp.mWatermark <<
                " ignored due to prior failure" <<
            RBS_LOG_EOM;
        } else {
            // Responses can arrive out of order, the identity never moves
            // back to an older commit sequence.
            if (GetBlockId().mCommitSeq < theResult.mBlockId.mCommitSeq) {
                boost::atomic_store(&mBlockIdPtr,
                    boost::shared_ptr<const BlockId>(
                        new BlockId(theResult.mBlockId)));
            } else {
                RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                    "commit at watermark: " << inOp.mWatermark <<
                    " stale response: " << theResult.mBlockId <<
                    " current: " << GetBlockId() <<
                RBS_LOG_EOM;
            }
            mCommitWatcher.UpdateCommitInfo(theResult.mLogIndex);
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "committed: " << theResult.mBlockId <<
                " watermark: " << inOp.mWatermark <<
                " log index: " << theResult.mLogIndex <<
                " final: " << inOp.mFinalFlag <<
            RBS_LOG_EOM;
        }
        const CommitFuturePtr theDonePtr = inOp.mDonePtr;
        delete &inOp;
        theDonePtr->Done(theResult);
    }
    int WaitForChunks()
    {
        for (ChunkFutures::const_iterator theIt = mChunkFutures.begin();
                theIt != mChunkFutures.end();
                ++theIt) {
            const int theStatus = mWaiter.Wait(**theIt, mConfig.mOpTimeoutMs);
            if (theStatus == AsyncResultBase::kWaitInterrupted) {
                return Latch(kErrorInterrupted,
                    "interrupted waiting for chunk send");
            }
            if (theStatus != AsyncResultBase::kWaitOk) {
                return Latch(kErrorTransport,
                    "timed out waiting for chunk send");
            }
            const SendResult& theResult = (*theIt)->Get();
            if (theResult.mStatus != 0) {
                return Latch(theResult.mStatus, theResult.mStatusMsg);
            }
        }
        mChunkFutures.clear();
        return mFailure.GetStatus();
    }
    int ExecutePutBlock(
        bool inCloseFlag,
        bool inForceFlag)
    {
        const Offset theWatermark = mFlushedLength;
        int          theStatus    = WaitForChunks();
        if (theStatus != kErrorNone) {
            return theStatus;
        }
        if (mCommitWatcher.IsTracked(theWatermark)) {
            ostringstream theStream;
            theStream << "commit at watermark: " << theWatermark <<
                " is already outstanding";
            return Latch(kErrorInvariant, theStream.str());
        }
        BlockData theSnapshot(mBlockData);
        theSnapshot.mBlockId = GetBlockId();
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "commit: " << theSnapshot.mBlockId <<
            " watermark: " << theWatermark <<
            " chunks: " << theSnapshot.mChunks.size() <<
            " final: " << inCloseFlag <<
            " forced: " << inForceFlag <<
        RBS_LOG_EOM;
        const CommitFuturePtr theResultPtr =
            mTransportPtr->SendMetadataCommit(theSnapshot, inCloseFlag);
        mStats.mCommitCount++;
        if (inForceFlag) {
            mStats.mForcedCommitCount++;
        }
        if (! theResultPtr) {
            return Latch(kErrorCommit,
                "metadata commit: transport returned no result");
        }
        const CommitFuturePtr theDonePtr(new CommitFuture());
        mCommitFutures.push_back(theDonePtr);
        theStatus = mCommitWatcher.Track(theWatermark, theDonePtr);
        CommitOp* const theOpPtr = new CommitOp(
            *this, theResultPtr, theDonePtr, theWatermark, inCloseFlag);
        theOpPtr->Start();
        if (theStatus != kErrorNone) {
            return Latch(theStatus, "failed to track metadata commit");
        }
        if (inCloseFlag) {
            mCloseFuturePtr = mTransportPtr->CloseStream();
            if (! mCloseFuturePtr) {
                return Latch(kErrorTransport,
                    "stream close: transport returned no result");
            }
        }
        return mFailure.GetStatus();
    }
    int WatchForCommit(
        bool inBufferFullFlag)
    {
        WatchReply theReply;
        string     theMsg;
        mStats.mWatchCount++;
        const int theStatus = inBufferFullFlag ?
            mCommitWatcher.WatchEarliest(
                mConfig.mWatchTimeoutMs, theReply, theMsg) :
            mCommitWatcher.WatchLatest(
                mConfig.mWatchTimeoutMs, theReply, theMsg);
        if (theStatus != kErrorNone) {
            return Latch(theStatus, theMsg);
        }
        if (! theReply.mLaggingReplicas.empty()) {
            RBS_LOG_STREAM_START(MsgLogger::kLogLevelWARN, theLogStream);
                ostream& theStream = theLogStream.GetStream();
                theStream << mLogPrefix <<
                    "failed to commit block: " << GetBlockId() <<
                    " on all replicas, committed log index: " <<
                        theReply.mCommittedIndex <<
                    " failed nodes:";
                for (Replicas::const_iterator
                        theIt = theReply.mLaggingReplicas.begin();
                        theIt != theReply.mLaggingReplicas.end();
                        ++theIt) {
                    theStream << " " << *theIt;
                }
            RBS_LOG_STREAM_END;
        }
        return mFailure.GetStatus();
    }
    int HandleFlush(
        bool inCloseFlag)
    {
        int theStatus = kErrorNone;
        if (mFlushedLength < GetWrittenLength()) {
            UpdateFlushLength();
            theStatus = ExecutePutBlock(inCloseFlag, false);
        } else if (inCloseFlag) {
            // Commit with the same watermark must be retired before the
            // forced final commit can be tracked.
            if (mCommitWatcher.IsTracked(mFlushedLength)) {
                theStatus = WatchForCommit(false);
            }
            if (theStatus == kErrorNone) {
                theStatus = ExecutePutBlock(true, true);
            }
        }
        if (theStatus != kErrorNone) {
            return theStatus;
        }
        string theMsg;
        if ((theStatus = mCommitWatcher.WaitForAll(
                mConfig.mOpTimeoutMs, theMsg)) != kErrorNone) {
            return Latch(theStatus, theMsg);
        }
        return WatchForCommit(false);
    }
    int WaitForClose()
    {
        if (! mCloseFuturePtr) {
            return Latch(kErrorInvariant, "stream close was not issued");
        }
        const int theStatus =
            mWaiter.Wait(*mCloseFuturePtr, mConfig.mOpTimeoutMs);
        if (theStatus == AsyncResultBase::kWaitInterrupted) {
            return Latch(kErrorInterrupted,
                "interrupted waiting for stream close");
        }
        if (theStatus != AsyncResultBase::kWaitOk) {
            return Latch(kErrorTransport,
                "timed out waiting for stream close");
        }
        const CloseResult& theResult = mCloseFuturePtr->Get();
        if (theResult.mStatus != 0) {
            ostringstream theStream;
            theStream << "stream close failed for block " << GetBlockId() <<
                ": " << ErrorCodeToString(theResult.mStatus) <<
                (theResult.mStatusMsg.empty() ? "" : " ") <<
                theResult.mStatusMsg;
            return Latch(kErrorTransport, theStream.str());
        }
        return mFailure.GetStatus();
    }
    template<typename T>
    bool WaitPending(
        T& inResult)
    {
        const int theStatus = mWaiter.Wait(inResult, mConfig.mOpTimeoutMs);
        if (theStatus != AsyncResultBase::kWaitOk) {
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "pending result wait: " << ErrorCodeToString(theStatus) <<
            RBS_LOG_EOM;
            return false;
        }
        return true;
    }
    // Results are awaited only to ensure that no operation is in flight
    // when the transport is released. The outcome is discarded.
    void WaitPendingResults()
    {
        bool theOkFlag = true;
        for (ChunkFutures::const_iterator theIt = mChunkFutures.begin();
                theOkFlag && theIt != mChunkFutures.end();
                ++theIt) {
            theOkFlag = WaitPending(**theIt);
        }
        for (CommitFutures::const_iterator theIt = mCommitFutures.begin();
                theOkFlag && theIt != mCommitFutures.end();
                ++theIt) {
            theOkFlag = WaitPending(**theIt);
        }
        if (theOkFlag && mCloseFuturePtr) {
            theOkFlag = WaitPending(*mCloseFuturePtr);
        }
        if (! theOkFlag) {
            RBS_LOG_STREAM_INFO << mLogPrefix <<
                "abandoning pending results wait, transport will be"
                " invalidated" <<
            RBS_LOG_EOM;
        }
    }
    void Cleanup(
        bool inInvalidateFlag)
    {
        if (mCleanupDoneFlag) {
            return;
        }
        mCleanupDoneFlag = true;
        if (mTransportPtr) {
            PipelineTransport& theTransport = *mTransportPtr;
            mTransportPtr = 0;
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "releasing pipeline: " << mPipeline.mId <<
                " invalidate: " << inInvalidateFlag <<
            RBS_LOG_EOM;
            mFactory.Release(theTransport, inInvalidateFlag);
        }
        mCommitWatcher.Drain();
        mExecutor.Shutdown();
        mChunkFutures.clear();
        mCommitFutures.clear();
        mCloseFuturePtr.reset();
    }
private:
    Impl(
        const Impl& inImpl);
    Impl& operator=(
        const Impl& inImpl);
};

BlockStreamWriter::BlockStreamWriter(
    const BlockId&            inBlockId,
    PipelineClientFactory&    inFactory,
    const PipelineDescriptor& inPipeline,
    const Config&             inConfig,
    const char*               inLogPrefixPtr)
    : mImpl(*new Impl(
        inBlockId, inFactory, inPipeline, inConfig, inLogPrefixPtr))
{}

BlockStreamWriter::~BlockStreamWriter()
{
    delete &mImpl;
}

    /* static */ int
BlockStreamWriter::ValidateConfig(
    const Config& inConfig,
    string*       outErrMsgPtr)
{
    ostringstream theStream;
    if (inConfig.mStreamBufferSize <= 0) {
        theStream << "invalid stream buffer size: " <<
            inConfig.mStreamBufferSize;
    } else if (inConfig.mStreamBufferFlushSize <= 0 ||
            inConfig.mStreamBufferFlushSize %
                inConfig.mStreamBufferSize != 0) {
        theStream << "stream flush size: " <<
            inConfig.mStreamBufferFlushSize <<
            " must be a positive multiple of buffer size: " <<
            inConfig.mStreamBufferSize;
    } else if (inConfig.mStreamBufferMaxSize < 0 ||
            (0 < inConfig.mStreamBufferMaxSize &&
                inConfig.mStreamBufferMaxSize <
                    inConfig.mStreamBufferFlushSize)) {
        theStream << "max outstanding size: " <<
            inConfig.mStreamBufferMaxSize <<
            " must be 0 or not less than flush size: " <<
            inConfig.mStreamBufferFlushSize;
    } else if (inConfig.mSyncSize < 0) {
        theStream << "invalid sync size: " << inConfig.mSyncSize;
    } else if (Checksum::GetDigestLength(inConfig.mChecksumType) < 0) {
        theStream << "invalid checksum type: " << inConfig.mChecksumType;
    } else if (inConfig.mBytesPerChecksum <= 0) {
        theStream << "invalid bytes per checksum: " <<
            inConfig.mBytesPerChecksum;
    } else if (inConfig.mOpTimeoutMs <= 0 || inConfig.mWatchTimeoutMs <= 0) {
        theStream << "invalid timeout: op: " << inConfig.mOpTimeoutMs <<
            " watch: " << inConfig.mWatchTimeoutMs;
    } else {
        return kErrorNone;
    }
    if (outErrMsgPtr) {
        *outErrMsgPtr = theStream.str();
    }
    return kErrorParameters;
}

    int
BlockStreamWriter::Open()
{
    return mImpl.Open();
}

    int
BlockStreamWriter::Write(
    const char* inBufPtr,
    size_t      inLength)
{
    return mImpl.Write(inBufPtr, inLength);
}

    int
BlockStreamWriter::Flush()
{
    return mImpl.Flush();
}

    int
BlockStreamWriter::Sync()
{
    return mImpl.Sync();
}

    int
BlockStreamWriter::Close()
{
    return mImpl.Close();
}

    void
BlockStreamWriter::Interrupt()
{
    mImpl.Interrupt();
}

    void
BlockStreamWriter::SetSyncPolicy(
    SyncPolicy* inPolicyPtr)
{
    mImpl.SetSyncPolicy(inPolicyPtr);
}

    bool
BlockStreamWriter::IsOpen() const
{
    return mImpl.IsOpen();
}

    bool
BlockStreamWriter::IsClosed() const
{
    return mImpl.IsClosed();
}

    bool
BlockStreamWriter::IsFailed() const
{
    return mImpl.IsFailed();
}

    BlockStreamWriter::Offset
BlockStreamWriter::GetWrittenLength() const
{
    return mImpl.GetWrittenLength();
}

    BlockStreamWriter::Offset
BlockStreamWriter::GetFlushedLength() const
{
    return mImpl.GetFlushedLength();
}

    Replicas
BlockStreamWriter::GetFailedReplicas() const
{
    return mImpl.GetFailedReplicas();
}

    bool
BlockStreamWriter::GetFailure(
    int&    outStatus,
    string& outMsg) const
{
    return mImpl.GetFailure(outStatus, outMsg);
}

    int
BlockStreamWriter::GetErrorCode() const
{
    return mImpl.GetErrorCode();
}

    BlockId
BlockStreamWriter::GetBlockId() const
{
    return mImpl.GetBlockId();
}

    void
BlockStreamWriter::GetStats(
    Stats& outStats) const
{
    mImpl.GetStats(outStats);
}

}} // namespace RBS::client
