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
// \brief Streaming block writer: writes one block through a replicated pipeline.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_BLOCK_STREAM_WRITER_H
#define LIBCLIENT_BLOCK_STREAM_WRITER_H

#include "PipelineTransport.h"
#include "rbsio/checksum.h"

#include <errno.h>
#include <string>

namespace RBS
{
class Properties;

namespace client
{
using std::string;

class SyncPolicy;

// Block write session. Each write is framed into one checksummed chunk, and
// sent to the pipeline asynchronously. Every "flush size" bytes, and on close,
// the complete chunk list is committed to the pipeline, and the commit is
// watched until it reaches quorum.
//
// Write(), Flush(), Sync(), and Close() must be invoked from a single caller
// thread. Transport completions are processed by the session's completion
// executor thread. GetBlockId(), GetWrittenLength(), IsFailed(), GetFailure(),
// GetFailedReplicas(), and Interrupt() can be invoked from any thread, the
// remaining getters only from the caller thread.
//
// The first failure is latched. Once failed all subsequent writes, flushes,
// and close return the latched status.
class BlockStreamWriter
{
public:
    typedef blockOff_t Offset;
    class Impl;

    enum
    {
        kErrorNone          = 0,
        kErrorParameters    = -EINVAL,
        kErrorTransport     = -ETRANSPORTFAILED,
        kErrorCommit        = -ECOMMITFAILED,
        kErrorQuorumTimeout = -EQUORUMTIMEOUT,
        kErrorInvariant     = -EINVARIANT,
        kErrorInterrupted   = -EWAITINTERRUPTED
    };

    struct Config
    {
        Config();
        // Loads the parameters with the given prefix:
        // stream.bufferSize -- per chunk buffer size.
        // stream.flushSize -- commit period, multiple of buffer size.
        // stream.maxOutstandingSize -- unconfirmed bytes limit, 0 disables
        //     backpressure.
        // stream.syncSize -- default sync policy byte interval, 0 disables.
        // checksum.type -- NONE, ADLER32, CRC32, MD5, or SHA256.
        // checksum.bytesPerChecksum
        // opTimeoutMs -- chunk send, commit response, and close wait.
        // watchTimeoutMs -- quorum watch wait.
        void SetParameters(
            const Properties& inProps,
            const char*       inPrefixPtr = 0);

        int64_t      mStreamBufferSize;
        int64_t      mStreamBufferFlushSize;
        int64_t      mStreamBufferMaxSize;
        int64_t      mSyncSize;
        ChecksumType mChecksumType;
        int          mBytesPerChecksum;
        int          mOpTimeoutMs;
        int          mWatchTimeoutMs;
    };
    struct Stats
    {
        typedef int64_t Counter;
        Stats()
            : mWriteCount(0),
              mWriteByteCount(0),
              mCommitCount(0),
              mForcedCommitCount(0),
              mWatchCount(0),
              mBackpressureCount(0)
            {}
        void Clear()
            { *this = Stats(); }
        template<typename T>
        void Enumerate(
            T& inFunctor) const
        {
            inFunctor("Writes",        mWriteCount);
            inFunctor("WriteBytes",    mWriteByteCount);
            inFunctor("Commits",       mCommitCount);
            inFunctor("ForcedCommits", mForcedCommitCount);
            inFunctor("Watches",       mWatchCount);
            inFunctor("Backpressure",  mBackpressureCount);
        }
        Counter mWriteCount;
        Counter mWriteByteCount;
        Counter mCommitCount;
        Counter mForcedCommitCount;
        Counter mWatchCount;
        Counter mBackpressureCount;
    };

    // Invalid configuration is detected here: GetErrorCode() returns
    // kErrorParameters, and the session can not be opened.
    BlockStreamWriter(
        const BlockId&            inBlockId,
        PipelineClientFactory&    inFactory,
        const PipelineDescriptor& inPipeline,
        const Config&             inConfig       = Config(),
        const char*               inLogPrefixPtr = 0);
    // Releases the transport with invalidation if the session was not
    // closed.
    ~BlockStreamWriter();
    // Returns 0 if the config is valid, otherwise kErrorParameters, and the
    // reason in outErrMsgPtr.
    static int ValidateConfig(
        const Config& inConfig,
        string*       outErrMsgPtr = 0);
    // Acquires the pipeline transport, and starts the block stream.
    int Open();
    // Returns 0 on success. Does not wait for the network, except when the
    // amount of unconfirmed data exceeds max outstanding size.
    int Write(
        const char* inBufPtr,
        size_t      inLength);
    // Waits for all chunk sends issued so far.
    int Flush();
    // Commits the data not yet committed, and waits for quorum.
    int Sync();
    // Issues final commit, waits for all outstanding operations, and
    // releases the transport. Idempotent.
    int Close();
    // Wakes up the caller thread blocked in a wait, the wait fails with
    // kErrorInterrupted.
    void Interrupt();
    // Must be invoked before Open(). Null restores default byte interval
    // policy. The policy is not owned by the writer.
    void SetSyncPolicy(
        SyncPolicy* inPolicyPtr);
    bool IsOpen() const;
    bool IsClosed() const;
    bool IsFailed() const;
    Offset GetWrittenLength() const;
    Offset GetFlushedLength() const;
    Replicas GetFailedReplicas() const;
    // Returns false if no failure was latched.
    bool GetFailure(
        int&    outStatus,
        string& outMsg) const;
    int GetErrorCode() const;
    BlockId GetBlockId() const;
    void GetStats(
        Stats& outStats) const;
private:
    Impl& mImpl;
private:
    BlockStreamWriter(
        const BlockStreamWriter& inWriter);
    BlockStreamWriter& operator=(
        const BlockStreamWriter& inWriter);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_BLOCK_STREAM_WRITER_H */
