#include <gtest/gtest.h>

#include "libclient/BlockStreamWriter.h"
#include "libclient/SyncPolicy.h"
#include "emulator/PipelineEmulator.h"
#include "common/Properties.h"
#include "common/Thread.h"
#include "common/rbsatomic.h"
#include "tests/rbstest.h"

#include <errno.h>
#include <unistd.h>

#include <string>
#include <vector>

using std::string;
using namespace RBS;
using namespace RBS::client;
using RBS::Test::RBSTestUtils;

namespace
{
const int kChunkSize = 64 << 10;

class BlockStreamWriterTest : public ::testing::Test
{
protected:
    BlockStreamWriterTest()
        : mEmulator(),
          mPipeline(PipelineEmulator::MakePipeline(5)),
          mBlockId(10, 20),
          mConfig(),
          mData(RBSTestUtils::MakeData(16 * kChunkSize))
    {
        mConfig.mStreamBufferSize      = kChunkSize;
        mConfig.mStreamBufferFlushSize = 2 * kChunkSize;
        mConfig.mStreamBufferMaxSize   = 0;
        mConfig.mBytesPerChecksum      = 16 << 10;
        mConfig.mOpTimeoutMs           = 10 * 1000;
        mConfig.mWatchTimeoutMs        = 10 * 1000;
    }
    int WriteChunk(BlockStreamWriter& writer, int index)
    {
        return writer.Write(mData.data() + index * kChunkSize, kChunkSize);
    }
    static bool ChunksContiguous(const BlockData& block)
    {
        blockOff_t end = 0;
        for (size_t i = 0; i < block.mChunks.size(); i++) {
            if (block.mChunks[i].mOffset != end ||
                    block.mChunks[i].mIndex != (int64_t)i + 1) {
                return false;
            }
            end = block.mChunks[i].GetEnd();
        }
        return (end == block.GetSize());
    }

    PipelineEmulator          mEmulator;
    const PipelineDescriptor  mPipeline;
    const BlockId             mBlockId;
    BlockStreamWriter::Config mConfig;
    const string              mData;
};

// Completes chunk sends and stream close immediately. Metadata commits are
// held until the test completes them, in any order.
class HeldTransport : public PipelineTransport, public PipelineClientFactory
{
public:
    typedef std::vector<CommitFuturePtr> Commits;

    HeldTransport()
        : mPipeline(PipelineEmulator::MakePipeline(7)),
          mAcquireStatus(0),
          mSendStatus(0),
          mHoldCommitsFlag(true),
          mCommits(),
          mCommitCount(0),
          mAcquireCount(0),
          mReleaseCount(0),
          mInvalidateCount(0),
          mWatchIndex(-1)
        {}
    virtual int Acquire(const PipelineDescriptor& /* pipeline */,
            PipelineTransport*& transport)
    {
        mAcquireCount++;
        transport = this;
        return mAcquireStatus;
    }
    virtual void Release(PipelineTransport& /* transport */, bool invalidate)
    {
        mReleaseCount++;
        if (invalidate) {
            mInvalidateCount++;
        }
        for (Commits::const_iterator it = mCommits.begin();
                it != mCommits.end();
                ++it) {
            if (! (*it)->IsDone()) {
                (*it)->Done(CommitResult(-ECANCELED, "released"));
            }
        }
    }
    virtual const PipelineDescriptor& GetPipeline() const
        { return mPipeline; }
    virtual int StartStream(const BlockId& /* blockId */)
        { return 0; }
    virtual SendFuturePtr SendChunk(const char* /* buf */, size_t len,
            blockOff_t offset, bool /* sync */)
    {
        SendFuturePtr const future(new SendFuture());
        SendResult          result(mSendStatus,
            mSendStatus == 0 ? "" : "connection reset");
        if (mSendStatus == 0) {
            result.mOffset = offset;
            result.mLength = (blockOff_t)len;
        }
        future->Done(result);
        return future;
    }
    virtual CommitFuturePtr SendMetadataCommit(const BlockData& data,
            bool /* final */)
    {
        CommitFuturePtr const future(new CommitFuture());
        mCommitCount++;
        mCommits.push_back(future);
        if (! mHoldCommitsFlag) {
            CompleteCommit(mCommits.size() - 1,
                data.mBlockId.mCommitSeq + 1, mCommitCount);
        }
        return future;
    }
    virtual CloseFuturePtr CloseStream()
    {
        CloseFuturePtr const future(new CloseFuture());
        future->Done(CloseResult());
        return future;
    }
    virtual int WatchForCommit(logIndex_t logIndex, int /* timeoutMs */,
            WatchReply& reply)
    {
        mWatchIndex           = logIndex;
        reply.mCommittedIndex = logIndex;
        return 0;
    }
    void CompleteCommit(size_t index, seq_t seq, logIndex_t logIndex)
    {
        CommitResult result;
        result.mBlockId  = BlockId(10, 20, seq);
        result.mLogIndex = logIndex;
        mCommits[index]->Done(result);
    }

    const PipelineDescriptor mPipeline;
    int                      mAcquireStatus;
    int                      mSendStatus;
    bool                     mHoldCommitsFlag;
    Commits                  mCommits;
    logIndex_t               mCommitCount;
    int                      mAcquireCount;
    int                      mReleaseCount;
    int                      mInvalidateCount;
    logIndex_t               mWatchIndex;
};

class AlwaysSyncPolicy : public SyncPolicy
{
public:
    virtual bool NeedSync(blockOff_t /* position */)
        { return true; }
};

class DelayedInterrupter : public Runnable
{
public:
    DelayedInterrupter(BlockStreamWriter& writer)
        : mWriter(writer)
        {}
    virtual void Run()
    {
        usleep(100 * 1000);
        mWriter.Interrupt();
    }
private:
    BlockStreamWriter& mWriter;
};

// Samples the writer identity and the committed replica snapshot while the
// writer is committing.
class IdentityReader : public Runnable
{
public:
    IdentityReader(BlockStreamWriter& writer, PipelineEmulator& emulator)
        : mWriter(writer),
          mEmulator(emulator),
          mStopFlag(0),
          mSampleCount(0),
          mErrorCount(0),
          mLastWritten(0)
        {}
    virtual void Run()
    {
        seq_t lastSeq = -1;
        while (SyncLoad(mStopFlag) == 0) {
            const BlockId blockId = mWriter.GetBlockId();
            if (blockId.mContainerId != 10 || blockId.mLocalId != 20 ||
                    blockId.mCommitSeq < lastSeq) {
                mErrorCount++;
            }
            lastSeq = blockId.mCommitSeq;
            const blockOff_t written = mWriter.GetWrittenLength();
            if (written < mLastWritten || written % kChunkSize != 0) {
                mErrorCount++;
            }
            mLastWritten = written;
            int    status = 0;
            string msg;
            if (mWriter.IsFailed() || mWriter.GetFailure(status, msg) ||
                    ! mWriter.GetFailedReplicas().empty()) {
                mErrorCount++;
            }
            const PipelineEmulator::BlockDataPtr block =
                mEmulator.GetCommittedBlock(0);
            if (block) {
                blockOff_t end = 0;
                for (size_t i = 0; i < block->mChunks.size(); i++) {
                    if (block->mChunks[i].mOffset != end) {
                        mErrorCount++;
                    }
                    end = block->mChunks[i].GetEnd();
                }
                if (block->mChunks.size() * kChunkSize !=
                        (size_t)block->GetSize()) {
                    mErrorCount++;
                }
            }
            mSampleCount++;
        }
    }
    void Stop()
        { SyncAddAndFetch(mStopFlag, 1); }

    BlockStreamWriter& mWriter;
    PipelineEmulator&  mEmulator;
    volatile int       mStopFlag;
    int64_t            mSampleCount;
    int64_t            mErrorCount;
    blockOff_t         mLastWritten;
};
}

TEST_F(BlockStreamWriterTest, PeriodicAndFinalCommit) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    EXPECT_TRUE(writer.IsOpen());

    BlockStreamWriter::Stats stats;
    ASSERT_EQ(0, WriteChunk(writer, 0));
    writer.GetStats(stats);
    EXPECT_EQ(0, stats.mCommitCount);
    ASSERT_EQ(0, WriteChunk(writer, 1));
    writer.GetStats(stats);
    EXPECT_EQ(1, stats.mCommitCount);
    EXPECT_EQ(2 * kChunkSize, writer.GetFlushedLength());
    ASSERT_EQ(0, WriteChunk(writer, 2));
    writer.GetStats(stats);
    EXPECT_EQ(1, stats.mCommitCount);
    EXPECT_EQ(3 * kChunkSize, writer.GetWrittenLength());

    ASSERT_EQ(0, writer.Close());
    EXPECT_TRUE(writer.IsClosed());
    EXPECT_FALSE(writer.IsFailed());

    const PipelineEmulator::Commits commits = mEmulator.GetCommits();
    ASSERT_EQ(2u, commits.size());
    EXPECT_FALSE(commits[0].mFinalFlag);
    EXPECT_EQ(2u, commits[0].mBlockData.mChunks.size());
    EXPECT_EQ(2 * kChunkSize, commits[0].mBlockData.GetSize());
    EXPECT_TRUE(commits[1].mFinalFlag);
    EXPECT_EQ(3u, commits[1].mBlockData.mChunks.size());
    EXPECT_EQ(3 * kChunkSize, commits[1].mBlockData.GetSize());
    EXPECT_EQ("20_chunk_3", commits[1].mBlockData.mChunks[2].mName);
    EXPECT_EQ("KEY", commits[1].mBlockData.mMetadata.find("TYPE")->second);

    EXPECT_EQ(BlockId(10, 20, 2), writer.GetBlockId());
    const PipelineEmulator::BlockDataPtr block = mEmulator.GetCommittedBlock(0);
    ASSERT_TRUE(block.get() != 0);
    EXPECT_EQ(3u, block->mChunks.size());
    EXPECT_TRUE(ChunksContiguous(*block));

    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mAcquireCount);
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(0, counters.mInvalidateCount);
    EXPECT_EQ(3, counters.mSendCount);
    EXPECT_EQ(1, counters.mCloseCount);
    EXPECT_TRUE(writer.GetFailedReplicas().empty());

    writer.GetStats(stats);
    EXPECT_EQ(3, stats.mWriteCount);
    EXPECT_EQ(3 * kChunkSize, stats.mWriteByteCount);
    EXPECT_EQ(2, stats.mCommitCount);
    EXPECT_EQ(0, stats.mForcedCommitCount);
}

TEST_F(BlockStreamWriterTest, CloseWithoutDataForcesEmptyFinalCommit) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, writer.Close());

    const PipelineEmulator::Commits commits = mEmulator.GetCommits();
    ASSERT_EQ(1u, commits.size());
    EXPECT_TRUE(commits[0].mFinalFlag);
    EXPECT_TRUE(commits[0].mBlockData.mChunks.empty());
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(0, counters.mSendCount);
    EXPECT_EQ(1, counters.mCloseCount);
    EXPECT_EQ(1, counters.mReleaseCount);
    BlockStreamWriter::Stats stats;
    writer.GetStats(stats);
    EXPECT_EQ(1, stats.mForcedCommitCount);
}

TEST_F(BlockStreamWriterTest, ForcedFinalCommitAfterFlushBoundary) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, WriteChunk(writer, 1));
    ASSERT_EQ(0, writer.Close());

    const PipelineEmulator::Commits commits = mEmulator.GetCommits();
    ASSERT_EQ(2u, commits.size());
    EXPECT_FALSE(commits[0].mFinalFlag);
    EXPECT_TRUE(commits[1].mFinalFlag);
    EXPECT_EQ(commits[0].mBlockData.mChunks, commits[1].mBlockData.mChunks);
    BlockStreamWriter::Stats stats;
    writer.GetStats(stats);
    EXPECT_EQ(1, stats.mForcedCommitCount);
}

TEST_F(BlockStreamWriterTest, ChunkSendFailureFailsFast) {
    mConfig.mStreamBufferFlushSize = 16 * kChunkSize;
    mEmulator.SetChunkSendStatus(2, -EIO);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    const int status = WriteChunk(writer, 1);
    EXPECT_TRUE(status == 0 || status == -ETRANSPORTFAILED);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Flush());
    EXPECT_TRUE(writer.IsFailed());

    EXPECT_EQ(-ETRANSPORTFAILED, WriteChunk(writer, 2));
    EXPECT_EQ(2, mEmulator.GetCounters().mSendCount);

    int    failure = 0;
    string msg;
    ASSERT_TRUE(writer.GetFailure(failure, msg));
    EXPECT_EQ(-ETRANSPORTFAILED, failure);
    EXPECT_NE(string::npos, msg.find("Failed to write chunk 20_chunk_2"));
    EXPECT_TRUE(writer.GetFailedReplicas().empty());

    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(1, counters.mInvalidateCount);
    EXPECT_EQ(0, counters.mCommitCount);
    EXPECT_EQ(0, counters.mCloseCount);
}

TEST_F(BlockStreamWriterTest, CloseTwiceReleasesOnce) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, writer.Close());
    ASSERT_EQ(0, writer.Close());
    EXPECT_EQ(-EINVAL, WriteChunk(writer, 1));
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(0, counters.mInvalidateCount);
    EXPECT_EQ(1, counters.mCommitCount);
    EXPECT_EQ(1, counters.mCloseCount);
}

TEST_F(BlockStreamWriterTest, InvalidConfigRejectedBeforeOpen) {
    mConfig.mStreamBufferFlushSize = kChunkSize * 3 / 2;
    string msg;
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(mConfig, &msg));
    EXPECT_FALSE(msg.empty());

    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    EXPECT_EQ(-EINVAL, writer.GetErrorCode());
    EXPECT_EQ(-EINVAL, writer.Open());
    EXPECT_EQ(-EINVAL, WriteChunk(writer, 0));
    EXPECT_EQ(-EINVAL, writer.Close());
    EXPECT_EQ(0, mEmulator.GetCounters().mAcquireCount);
    EXPECT_EQ(0, mEmulator.GetCounters().mReleaseCount);
}

TEST_F(BlockStreamWriterTest, ConfigValidation) {
    BlockStreamWriter::Config config = mConfig;
    EXPECT_EQ(0, BlockStreamWriter::ValidateConfig(config));
    config.mStreamBufferMaxSize = kChunkSize;
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(config));
    config = mConfig;
    config.mChecksumType = ChecksumType(42);
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(config));
    config = mConfig;
    config.mStreamBufferSize = 0;
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(config));
    config = mConfig;
    config.mWatchTimeoutMs = 0;
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(config));
    EXPECT_EQ(0, BlockStreamWriter::ValidateConfig(
        BlockStreamWriter::Config()));
}

TEST_F(BlockStreamWriterTest, ConfigFromProperties) {
    Properties props;
    props.setValue("w.stream.bufferSize", "1024");
    props.setValue("w.stream.flushSize", "4096");
    props.setValue("w.stream.maxOutstandingSize", "0");
    props.setValue("w.checksum.type", "md5");
    props.setValue("w.opTimeoutMs", "500");
    BlockStreamWriter::Config config;
    config.SetParameters(props, "w.");
    EXPECT_EQ(1024, config.mStreamBufferSize);
    EXPECT_EQ(4096, config.mStreamBufferFlushSize);
    EXPECT_EQ(0, config.mStreamBufferMaxSize);
    EXPECT_EQ(kChecksumTypeMd5, config.mChecksumType);
    EXPECT_EQ(500, config.mOpTimeoutMs);
    EXPECT_EQ(180 * 1000, config.mWatchTimeoutMs);
    EXPECT_EQ(0, BlockStreamWriter::ValidateConfig(config));

    props.setValue("w.checksum.type", "crc64");
    config.SetParameters(props, "w.");
    EXPECT_EQ(-EINVAL, BlockStreamWriter::ValidateConfig(config));
}

TEST_F(BlockStreamWriterTest, SyncWaitsForQuorum) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, writer.Sync());
    EXPECT_EQ(kChunkSize, writer.GetFlushedLength());
    EXPECT_EQ(BlockId(10, 20, 1), writer.GetBlockId());
    ASSERT_EQ(0, writer.Sync());
    EXPECT_EQ(1u, mEmulator.GetCommits().size());
    ASSERT_EQ(0, writer.Close());

    const PipelineEmulator::Commits commits = mEmulator.GetCommits();
    ASSERT_EQ(2u, commits.size());
    EXPECT_FALSE(commits[0].mFinalFlag);
    EXPECT_TRUE(commits[1].mFinalFlag);
    EXPECT_EQ(1u, commits[1].mBlockData.mChunks.size());
}

TEST_F(BlockStreamWriterTest, CommitFailure) {
    mEmulator.SetCommitStatus(1, -EIO);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, WriteChunk(writer, 1));
    const int status = WriteChunk(writer, 2);
    EXPECT_TRUE(status == 0 || status == -ECOMMITFAILED);
    EXPECT_EQ(-ECOMMITFAILED, writer.Close());
    EXPECT_EQ(BlockId(10, 20, 0), writer.GetBlockId());
    EXPECT_EQ(1, mEmulator.GetCounters().mInvalidateCount);
    EXPECT_EQ(1, mEmulator.GetCounters().mReleaseCount);
}

TEST_F(BlockStreamWriterTest, CommitResponseForAnotherBlock) {
    mEmulator.SetCommitResponseBlockId(1, BlockId(10, 21, 1));
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    EXPECT_EQ(-ECOMMITFAILED, writer.Close());
    EXPECT_EQ(BlockId(10, 20, 0), writer.GetBlockId());
}

TEST_F(BlockStreamWriterTest, StreamCloseFailure) {
    mEmulator.SetCloseStatus(-EIO);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    EXPECT_EQ(1, mEmulator.GetCounters().mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, LaggingReplicaReported) {
    mEmulator.SetReplicaLagging(2, true);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(0, WriteChunk(writer, i));
    }
    ASSERT_EQ(0, writer.Close());
    const Replicas failed = writer.GetFailedReplicas();
    ASSERT_EQ(1u, failed.size());
    EXPECT_EQ(mPipeline.mReplicas[2].mUuid, failed[0].mUuid);
    EXPECT_TRUE(mEmulator.GetCommittedBlock(2).get() == 0);
    EXPECT_EQ(0, mEmulator.GetCounters().mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, QuorumTimeout) {
    mConfig.mWatchTimeoutMs = 100;
    mEmulator.SetReplicaLagging(1, true);
    mEmulator.SetReplicaLagging(2, true);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(0, WriteChunk(writer, i));
    }
    EXPECT_EQ(-EQUORUMTIMEOUT, writer.Close());
    EXPECT_EQ(1, mEmulator.GetCounters().mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, BackpressureWaitsForEarliestCommit) {
    mConfig.mStreamBufferMaxSize = 2 * kChunkSize;
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    for (int i = 0; i < 6; i++) {
        ASSERT_EQ(0, WriteChunk(writer, i));
    }
    BlockStreamWriter::Stats stats;
    writer.GetStats(stats);
    EXPECT_LT(0, stats.mBackpressureCount);
    ASSERT_EQ(0, writer.Close());
    const PipelineEmulator::Commits commits = mEmulator.GetCommits();
    ASSERT_FALSE(commits.empty());
    EXPECT_TRUE(commits.back().mFinalFlag);
    EXPECT_EQ(6 * kChunkSize, commits.back().mBlockData.GetSize());
}

TEST_F(BlockStreamWriterTest, InterruptUnblocksClose) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    mEmulator.Pause();
    ASSERT_EQ(0, WriteChunk(writer, 0));

    DelayedInterrupter interrupter(writer);
    Thread             thread(&interrupter, "interrupter");
    thread.Start();
    EXPECT_EQ(-EWAITINTERRUPTED, writer.Close());
    thread.Join();
    mEmulator.Resume();

    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(1, counters.mInvalidateCount);
    EXPECT_LT(0, counters.mCancelCount);
    EXPECT_EQ(0, counters.mSendCount);
}

TEST_F(BlockStreamWriterTest, IdentityIsAlwaysConsistent) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    IdentityReader reader(writer, mEmulator);
    Thread         thread(&reader, "reader");
    thread.Start();
    for (int i = 0; i < 16; i++) {
        ASSERT_EQ(0, WriteChunk(writer, i));
    }
    const int status = writer.Close();
    reader.Stop();
    thread.Join();
    ASSERT_EQ(0, status);
    EXPECT_LT(0, reader.mSampleCount);
    EXPECT_EQ(0, reader.mErrorCount);
    EXPECT_EQ(seq_t(mEmulator.GetCommits().size()),
        writer.GetBlockId().mCommitSeq);
    const PipelineEmulator::BlockDataPtr block = mEmulator.GetCommittedBlock(1);
    ASSERT_TRUE(block.get() != 0);
    EXPECT_EQ(16u, block->mChunks.size());
    EXPECT_TRUE(ChunksContiguous(*block));
    EXPECT_EQ(writer.GetBlockId(), block->mBlockId);
}

TEST_F(BlockStreamWriterTest, SyncPolicyFlags) {
    mConfig.mSyncSize              = 2 * kChunkSize;
    mConfig.mStreamBufferFlushSize = 16 * kChunkSize;
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    ASSERT_EQ(0, writer.Open());
    for (int i = 0; i < 4; i++) {
        ASSERT_EQ(0, WriteChunk(writer, i));
    }
    ASSERT_EQ(0, writer.Close());
    const PipelineEmulator::SyncFlags flags = mEmulator.GetSyncFlags();
    ASSERT_EQ(4u, flags.size());
    EXPECT_FALSE(flags[0]);
    EXPECT_TRUE(flags[1]);
    EXPECT_FALSE(flags[2]);
    EXPECT_TRUE(flags[3]);
}

TEST_F(BlockStreamWriterTest, CustomSyncPolicy) {
    AlwaysSyncPolicy  policy;
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    writer.SetSyncPolicy(&policy);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, writer.Close());
    const PipelineEmulator::SyncFlags flags = mEmulator.GetSyncFlags();
    ASSERT_EQ(1u, flags.size());
    EXPECT_TRUE(flags[0]);
}

TEST_F(BlockStreamWriterTest, DestroyWithoutCloseInvalidates) {
    {
        BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
        ASSERT_EQ(0, writer.Open());
        ASSERT_EQ(0, WriteChunk(writer, 0));
    }
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(1, counters.mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, AcquireFailure) {
    mEmulator.SetAcquireStatus(-ECONNREFUSED);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Open());
    EXPECT_EQ(-ETRANSPORTFAILED, WriteChunk(writer, 0));
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    EXPECT_EQ(1, mEmulator.GetCounters().mAcquireCount);
    EXPECT_EQ(0, mEmulator.GetCounters().mReleaseCount);
}

TEST_F(BlockStreamWriterTest, StartStreamFailure) {
    mEmulator.SetStartStatus(-EIO);
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Open());
    EXPECT_TRUE(writer.IsClosed());
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mAcquireCount);
    EXPECT_EQ(1, counters.mReleaseCount);
    EXPECT_EQ(1, counters.mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, WriteArguments) {
    BlockStreamWriter writer(mBlockId, mEmulator, mPipeline, mConfig);
    EXPECT_EQ(-EINVAL, WriteChunk(writer, 0));
    ASSERT_EQ(0, writer.Open());
    EXPECT_EQ(-EINVAL, writer.Open());
    EXPECT_EQ(0, writer.Write(mData.data(), 0));
    EXPECT_EQ(-EINVAL, writer.Write(0, 10));
    EXPECT_FALSE(writer.IsFailed());
    EXPECT_EQ(0, writer.GetWrittenLength());
    ASSERT_EQ(0, writer.Close());
}

TEST_F(BlockStreamWriterTest, OutOfOrderCommitResponsesKeepNewestIdentity) {
    mConfig.mStreamBufferFlushSize = kChunkSize;
    HeldTransport     transport;
    BlockStreamWriter writer(
        mBlockId, transport, transport.GetPipeline(), mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(0, WriteChunk(writer, 1));
    ASSERT_EQ(2u, transport.mCommits.size());

    transport.CompleteCommit(1, 2, 2);
    transport.CompleteCommit(0, 1, 1);
    ASSERT_EQ(0, writer.Sync());
    EXPECT_EQ(2, transport.mWatchIndex);
    EXPECT_EQ(seq_t(2), writer.GetBlockId().mCommitSeq);

    transport.mHoldCommitsFlag = false;
    ASSERT_EQ(0, writer.Close());
    ASSERT_EQ(3u, transport.mCommits.size());
    EXPECT_EQ(3, transport.mWatchIndex);
    EXPECT_EQ(BlockId(10, 20, 3), writer.GetBlockId());
    EXPECT_EQ(1, transport.mReleaseCount);
    EXPECT_EQ(0, transport.mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, CommitAfterFailureKeepsFirstFailure) {
    mConfig.mStreamBufferFlushSize = kChunkSize;
    HeldTransport     transport;
    BlockStreamWriter writer(
        mBlockId, transport, transport.GetPipeline(), mConfig);
    ASSERT_EQ(0, writer.Open());
    ASSERT_EQ(0, WriteChunk(writer, 0));
    ASSERT_EQ(1u, transport.mCommits.size());

    transport.mSendStatus = -ECONNRESET;
    EXPECT_EQ(-ETRANSPORTFAILED, WriteChunk(writer, 1));
    int    status = 0;
    string msg;
    ASSERT_TRUE(writer.GetFailure(status, msg));
    EXPECT_EQ(-ETRANSPORTFAILED, status);
    EXPECT_NE(string::npos, msg.find("connection reset"));
    EXPECT_EQ(1u, transport.mCommits.size());

    // Successful response to the commit issued before the failure.
    transport.CompleteCommit(0, 1, 1);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    int    closeStatus = 0;
    string closeMsg;
    ASSERT_TRUE(writer.GetFailure(closeStatus, closeMsg));
    EXPECT_EQ(status, closeStatus);
    EXPECT_EQ(msg, closeMsg);
    EXPECT_EQ(mBlockId, writer.GetBlockId());
    EXPECT_EQ(-1, transport.mWatchIndex);
    EXPECT_EQ(1, transport.mReleaseCount);
    EXPECT_EQ(1, transport.mInvalidateCount);
}

TEST_F(BlockStreamWriterTest, AcquireFailureReleasesReturnedTransport) {
    HeldTransport transport;
    transport.mAcquireStatus = -EIO;
    BlockStreamWriter writer(
        mBlockId, transport, transport.GetPipeline(), mConfig);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Open());
    EXPECT_TRUE(writer.IsClosed());
    EXPECT_EQ(1, transport.mAcquireCount);
    EXPECT_EQ(1, transport.mReleaseCount);
    EXPECT_EQ(1, transport.mInvalidateCount);
    EXPECT_EQ(-ETRANSPORTFAILED, writer.Close());
    EXPECT_EQ(1, transport.mReleaseCount);
}
