#include <gtest/gtest.h>

#include "emulator/PipelineEmulator.h"
#include "libclient/ChunkFramer.h"
#include "tests/rbstest.h"

#include <errno.h>

#include <string>

using std::string;
using namespace RBS;
using namespace RBS::client;
using RBS::Test::RBSTestUtils;

namespace
{
class PipelineEmulatorTest : public ::testing::Test
{
protected:
    PipelineEmulatorTest()
        : mEmulator(),
          mTransport(0),
          mData(RBSTestUtils::MakeData(8 << 10))
        {}
    virtual void SetUp()
    {
        ASSERT_EQ(0, mEmulator.Acquire(
            PipelineEmulator::MakePipeline(1), mTransport));
        ASSERT_TRUE(mTransport != 0);
        ASSERT_EQ(0, mTransport->StartStream(BlockId(1, 2)));
    }
    virtual void TearDown()
    {
        if (mTransport) {
            mEmulator.Release(*mTransport, false);
        }
    }
    BlockData MakeBlock(ChunkFramer& framer, size_t length)
    {
        BlockData block(BlockId(1, 2));
        ChunkInfo chunk;
        EXPECT_EQ(1, framer.Frame(mData.data(), length, chunk));
        block.mChunks.push_back(chunk);
        return block;
    }

    PipelineEmulator   mEmulator;
    PipelineTransport* mTransport;
    const string       mData;
};
}

TEST_F(PipelineEmulatorTest, CommitAppliesToReplicas) {
    ChunkFramer     framer(2, Checksum());
    const BlockData block = MakeBlock(framer, mData.size());
    SendFuturePtr   send  = mTransport->SendChunk(
        mData.data(), mData.size(), 0, true);
    ASSERT_EQ(0, send->Wait(5000));
    EXPECT_EQ(0, send->Get().mStatus);
    EXPECT_EQ((blockOff_t)mData.size(), send->Get().mLength);

    CommitFuturePtr commit = mTransport->SendMetadataCommit(block, false);
    ASSERT_EQ(0, commit->Wait(5000));
    ASSERT_EQ(0, commit->Get().mStatus);
    EXPECT_EQ(1, commit->Get().mLogIndex);
    EXPECT_EQ(BlockId(1, 2, 1), commit->Get().mBlockId);

    WatchReply reply;
    EXPECT_EQ(0, mTransport->WatchForCommit(1, 1000, reply));
    EXPECT_EQ(1, reply.mCommittedIndex);
    EXPECT_TRUE(reply.mLaggingReplicas.empty());
    for (int i = 0; i < NUM_REPLICAS_PER_PIPELINE; i++) {
        const PipelineEmulator::BlockDataPtr committed =
            mEmulator.GetCommittedBlock(i);
        ASSERT_TRUE(committed.get() != 0);
        EXPECT_EQ(1u, committed->mChunks.size());
    }
    ASSERT_EQ(1u, mEmulator.GetSyncFlags().size());
    EXPECT_TRUE(mEmulator.GetSyncFlags()[0]);
}

TEST_F(PipelineEmulatorTest, CommitVerifiesChecksums) {
    ChunkFramer framer(2, Checksum());
    BlockData   block = MakeBlock(framer, mData.size());
    string      corrupt(mData);
    corrupt[100] ^= 0x40;
    ASSERT_EQ(0, mTransport->SendChunk(
        corrupt.data(), corrupt.size(), 0, false)->Wait(5000));

    CommitFuturePtr commit = mTransport->SendMetadataCommit(block, true);
    ASSERT_EQ(0, commit->Wait(5000));
    EXPECT_EQ(-EBADMSG, commit->Get().mStatus);
    EXPECT_TRUE(mEmulator.GetCommittedBlock(0).get() == 0);
    ASSERT_EQ(1u, mEmulator.GetCommits().size());
    EXPECT_EQ(-EBADMSG, mEmulator.GetCommits()[0].mStatus);
}

TEST_F(PipelineEmulatorTest, QuorumWithLaggingReplicas) {
    mEmulator.SetReplicaLagging(0, true);
    ASSERT_EQ(0, mTransport->SendMetadataCommit(
        BlockData(BlockId(1, 2)), false)->Wait(5000));

    WatchReply reply;
    EXPECT_EQ(0, mTransport->WatchForCommit(1, 1000, reply));
    ASSERT_EQ(1u, reply.mLaggingReplicas.size());

    mEmulator.SetReplicaLagging(1, true);
    ASSERT_EQ(0, mTransport->SendMetadataCommit(
        BlockData(BlockId(1, 2)), false)->Wait(5000));
    EXPECT_EQ(-ETIMEDOUT, mTransport->WatchForCommit(2, 50, reply));
    EXPECT_EQ(2u, reply.mLaggingReplicas.size());
}

TEST_F(PipelineEmulatorTest, OperationsAfterCloseFail) {
    CloseFuturePtr close = mTransport->CloseStream();
    ASSERT_EQ(0, close->Wait(5000));
    EXPECT_EQ(0, close->Get().mStatus);
    SendFuturePtr send = mTransport->SendChunk(mData.data(), 10, 0, false);
    ASSERT_TRUE(send->IsDone());
    EXPECT_EQ(-EPIPE, send->Get().mStatus);
    EXPECT_EQ(-EPIPE, mTransport->CloseStream()->Get().mStatus);
}

TEST_F(PipelineEmulatorTest, InvalidatingReleaseCancelsPending) {
    mEmulator.Pause();
    SendFuturePtr send = mTransport->SendChunk(mData.data(), 10, 0, false);
    EXPECT_FALSE(send->IsDone());
    EXPECT_EQ(1u, mEmulator.GetPendingCount());
    mEmulator.Release(*mTransport, true);
    mTransport = 0;
    ASSERT_TRUE(send->IsDone());
    EXPECT_EQ(-ECANCELED, send->Get().mStatus);
    mEmulator.Resume();
    const PipelineEmulator::Counters counters = mEmulator.GetCounters();
    EXPECT_EQ(1, counters.mInvalidateCount);
    EXPECT_EQ(1, counters.mCancelCount);
    EXPECT_TRUE(mEmulator.WaitForIdle(1000));
}
