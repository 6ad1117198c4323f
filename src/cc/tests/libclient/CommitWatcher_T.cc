#include <gtest/gtest.h>

#include "libclient/CommitWatcher.h"
#include "common/rbstypes.h"

#include <errno.h>

#include <string>

using std::string;
using namespace RBS;
using namespace RBS::client;

namespace
{
// Answers quorum watches from a scripted reply.
class WatchTransport : public PipelineTransport
{
public:
    WatchTransport()
        : mPipeline(),
          mStatus(0),
          mCommittedIndex(-1),
          mLagging(),
          mWatchCount(0),
          mLastIndex(-1)
        {}
    virtual const PipelineDescriptor& GetPipeline() const
        { return mPipeline; }
    virtual int StartStream(const BlockId& /* blockId */)
        { return 0; }
    virtual SendFuturePtr SendChunk(const char* /* buf */, size_t /* len */,
            blockOff_t /* offset */, bool /* sync */)
        { return SendFuturePtr(); }
    virtual CommitFuturePtr SendMetadataCommit(const BlockData& /* data */,
            bool /* final */)
        { return CommitFuturePtr(); }
    virtual CloseFuturePtr CloseStream()
        { return CloseFuturePtr(); }
    virtual int WatchForCommit(logIndex_t logIndex, int /* timeoutMs */,
            WatchReply& reply)
    {
        mWatchCount++;
        mLastIndex = logIndex;
        if (mStatus != 0) {
            return mStatus;
        }
        reply.mCommittedIndex  = mCommittedIndex < 0 ? logIndex :
            mCommittedIndex;
        reply.mLaggingReplicas = mLagging;
        return 0;
    }

    PipelineDescriptor mPipeline;
    int                mStatus;
    logIndex_t         mCommittedIndex;
    Replicas           mLagging;
    int                mWatchCount;
    logIndex_t         mLastIndex;
};

CommitFuturePtr
MakeCommitted(logIndex_t logIndex, int status = 0)
{
    CommitFuturePtr const future(new CommitFuture());
    CommitResult          result(status, status == 0 ? "" : "rejected");
    result.mBlockId  = BlockId(1, 2, logIndex);
    result.mLogIndex = status == 0 ? logIndex : -1;
    future->Done(result);
    return future;
}

ReplicaInfo
MakeReplica(const char* uuid)
{
    return ReplicaInfo(uuid, ServerLocation("10.0.0.1", 22000));
}

class CommitWatcherTest : public ::testing::Test
{
protected:
    CommitWatcherTest()
        : mWaiter(),
          mWatcher(mWaiter, "test "),
          mTransport(),
          mReply(),
          mMsg()
    {
        mWatcher.SetTransport(&mTransport);
    }

    ResultWaiter   mWaiter;
    CommitWatcher  mWatcher;
    WatchTransport mTransport;
    WatchReply     mReply;
    string         mMsg;
};
}

TEST_F(CommitWatcherTest, EmptyWatchReturnsImmediately) {
    EXPECT_EQ(0, mWatcher.WatchLatest(1000, mReply, mMsg));
    EXPECT_EQ(0, mWatcher.WatchEarliest(1000, mReply, mMsg));
    EXPECT_EQ(0, mTransport.mWatchCount);
}

TEST_F(CommitWatcherTest, DuplicateWatermarkIsInvariantViolation) {
    const CommitFuturePtr first = MakeCommitted(1);
    EXPECT_EQ(0, mWatcher.Track(128 << 10, first));
    EXPECT_EQ(CommitWatcher::kErrorInvariant,
        mWatcher.Track(128 << 10, MakeCommitted(2)));
    EXPECT_EQ(1u, mWatcher.GetTrackedCount());
    EXPECT_TRUE(mWatcher.IsTracked(128 << 10));
    EXPECT_FALSE(mWatcher.IsTracked(64 << 10));
}

TEST_F(CommitWatcherTest, WatchLatestReleasesAllCommitted) {
    mWatcher.Track(128 << 10, MakeCommitted(1));
    mWatcher.Track(192 << 10, MakeCommitted(2));
    mWatcher.UpdateCommitInfo(1);
    mWatcher.UpdateCommitInfo(2);
    EXPECT_EQ(2, mWatcher.GetLatestCommitIndex());

    EXPECT_EQ(0, mWatcher.WatchLatest(1000, mReply, mMsg));
    EXPECT_EQ(2, mTransport.mLastIndex);
    EXPECT_EQ(0u, mWatcher.GetTrackedCount());
    EXPECT_EQ(192 << 10, mWatcher.GetAckedWatermark());
}

TEST_F(CommitWatcherTest, WatchLatestWaitsForHighestCommitIndex) {
    // Earlier watermark was assigned the higher log index.
    mWatcher.Track(128 << 10, MakeCommitted(3));
    mWatcher.Track(192 << 10, MakeCommitted(2));
    mWatcher.UpdateCommitInfo(3);
    mWatcher.UpdateCommitInfo(2);
    EXPECT_EQ(3, mWatcher.GetLatestCommitIndex());

    EXPECT_EQ(0, mWatcher.WatchLatest(1000, mReply, mMsg));
    EXPECT_EQ(3, mTransport.mLastIndex);
    EXPECT_EQ(0u, mWatcher.GetTrackedCount());
    EXPECT_EQ(192 << 10, mWatcher.GetAckedWatermark());
}

TEST_F(CommitWatcherTest, WatchEarliestUsesOwnCommitIndex) {
    mWatcher.Track(128 << 10, MakeCommitted(1));
    mWatcher.Track(192 << 10, MakeCommitted(2));
    mWatcher.UpdateCommitInfo(2);

    EXPECT_EQ(0, mWatcher.WatchEarliest(1000, mReply, mMsg));
    EXPECT_EQ(1, mTransport.mLastIndex);
    EXPECT_EQ(1u, mWatcher.GetTrackedCount());
}

TEST_F(CommitWatcherTest, WatchEarliestReleasesOldestOnly) {
    mWatcher.Track(128 << 10, MakeCommitted(1));
    mWatcher.Track(256 << 10, MakeCommitted(2));

    EXPECT_EQ(0, mWatcher.WatchEarliest(1000, mReply, mMsg));
    EXPECT_EQ(1, mTransport.mLastIndex);
    EXPECT_EQ(1u, mWatcher.GetTrackedCount());
    EXPECT_TRUE(mWatcher.IsTracked(256 << 10));
    EXPECT_EQ(128 << 10, mWatcher.GetAckedWatermark());
}

TEST_F(CommitWatcherTest, LaggingReplicasAccumulate) {
    mTransport.mLagging.push_back(MakeReplica("r2"));
    mWatcher.Track(64 << 10, MakeCommitted(1));
    EXPECT_EQ(0, mWatcher.WatchLatest(1000, mReply, mMsg));
    ASSERT_EQ(1u, mReply.mLaggingReplicas.size());

    mTransport.mLagging.push_back(MakeReplica("r1"));
    mWatcher.Track(128 << 10, MakeCommitted(2));
    EXPECT_EQ(0, mWatcher.WatchLatest(1000, mReply, mMsg));

    const Replicas failed = mWatcher.GetFailedReplicas();
    ASSERT_EQ(2u, failed.size());
    EXPECT_EQ("r1", failed[0].mUuid);
    EXPECT_EQ("r2", failed[1].mUuid);
}

TEST_F(CommitWatcherTest, QuorumTimeout) {
    mTransport.mStatus = -ETIMEDOUT;
    mWatcher.Track(64 << 10, MakeCommitted(1));
    EXPECT_EQ(CommitWatcher::kErrorQuorumTimeout,
        mWatcher.WatchLatest(10, mReply, mMsg));
    EXPECT_FALSE(mMsg.empty());
    EXPECT_EQ(1u, mWatcher.GetTrackedCount());
}

TEST_F(CommitWatcherTest, CommitResponseTimeout) {
    mWatcher.Track(64 << 10, CommitFuturePtr(new CommitFuture()));
    EXPECT_EQ(CommitWatcher::kErrorQuorumTimeout,
        mWatcher.WatchLatest(10, mReply, mMsg));
    EXPECT_EQ(0, mTransport.mWatchCount);
}

TEST_F(CommitWatcherTest, FailedCommitIsReturnedAndReleased) {
    mWatcher.Track(64 << 10, MakeCommitted(1, -ECOMMITFAILED));
    EXPECT_EQ(-ECOMMITFAILED, mWatcher.WatchEarliest(1000, mReply, mMsg));
    EXPECT_EQ("rejected", mMsg);
    EXPECT_EQ(0u, mWatcher.GetTrackedCount());
    EXPECT_EQ(0, mTransport.mWatchCount);
}

TEST_F(CommitWatcherTest, EarlierFailureSurfacesOnLatestWatch) {
    mWatcher.Track(64 << 10, MakeCommitted(-1, -ECOMMITFAILED));
    mWatcher.Track(128 << 10, MakeCommitted(2));
    EXPECT_EQ(-ECOMMITFAILED, mWatcher.WatchLatest(1000, mReply, mMsg));
}

TEST_F(CommitWatcherTest, InterruptedWait) {
    mWatcher.Track(64 << 10, CommitFuturePtr(new CommitFuture()));
    mWaiter.Interrupt();
    EXPECT_EQ(CommitWatcher::kErrorInterrupted,
        mWatcher.WatchLatest(-1, mReply, mMsg));
}

TEST_F(CommitWatcherTest, WaitForAllAndDrain) {
    mWatcher.Track(64 << 10, MakeCommitted(1));
    mWatcher.Track(128 << 10, MakeCommitted(-1, -ECOMMITFAILED));
    EXPECT_EQ(-ECOMMITFAILED, mWatcher.WaitForAll(1000, mMsg));
    EXPECT_EQ(1u, mWatcher.GetTrackedCount());

    mWatcher.UpdateCommitInfo(1);
    mWatcher.Drain();
    EXPECT_EQ(0u, mWatcher.GetTrackedCount());
    EXPECT_EQ(-1, mWatcher.GetLatestCommitIndex());
    mWatcher.Track(256 << 10, MakeCommitted(3));
    EXPECT_EQ(CommitWatcher::kErrorInvariant,
        mWatcher.WatchLatest(1000, mReply, mMsg));
}
