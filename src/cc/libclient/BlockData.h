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
// \brief Block identity, chunk descriptor, and block metadata value types.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_BLOCK_DATA_H
#define LIBCLIENT_BLOCK_DATA_H

#include "common/rbstypes.h"
#include "rbsio/checksum.h"

#include <string>
#include <vector>
#include <map>
#include <ostream>

namespace RBS
{
namespace client
{
using std::string;
using std::vector;
using std::map;
using std::ostream;

// Container id and local id never change for a given block. Commit sequence
// number is assigned by the pipeline on each successful metadata commit.
struct BlockId
{
    BlockId(
        containerId_t inContainerId = -1,
        localId_t     inLocalId     = -1,
        seq_t         inCommitSeq   = 0)
        : mContainerId(inContainerId),
          mLocalId(inLocalId),
          mCommitSeq(inCommitSeq)
        {}
    bool IsSameBlock(const BlockId& inOther) const
    {
        return (
            mContainerId == inOther.mContainerId &&
            mLocalId     == inOther.mLocalId
        );
    }
    bool operator==(const BlockId& inOther) const
        { return (IsSameBlock(inOther) && mCommitSeq == inOther.mCommitSeq); }
    bool operator!=(const BlockId& inOther) const
        { return ! (*this == inOther); }
    ostream& Display(ostream& inStream) const
    {
        return (inStream << "container: " << mContainerId <<
            " block: " << mLocalId << " seq: " << mCommitSeq);
    }

    containerId_t mContainerId;
    localId_t     mLocalId;
    seq_t         mCommitSeq;
};

inline static ostream&
operator<<(ostream& inStream, const BlockId& inId)
    { return inId.Display(inStream); }

struct ChunkInfo
{
    ChunkInfo()
        : mName(),
          mIndex(0),
          mOffset(0),
          mLength(0),
          mChecksum()
        {}
    blockOff_t GetEnd() const
        { return (mOffset + mLength); }
    bool operator==(const ChunkInfo& inOther) const
    {
        return (
            mName     == inOther.mName &&
            mIndex    == inOther.mIndex &&
            mOffset   == inOther.mOffset &&
            mLength   == inOther.mLength &&
            mChecksum == inOther.mChecksum
        );
    }

    string       mName;
    int64_t      mIndex;
    blockOff_t   mOffset;
    blockOff_t   mLength;
    ChecksumData mChecksum;
};

inline static ostream&
operator<<(ostream& inStream, const ChunkInfo& inChunk)
{
    return (inStream << inChunk.mName <<
        " pos: " << inChunk.mOffset << " size: " << inChunk.mLength <<
        " checksum: " << inChunk.mChecksum);
}

// Block metadata sent with each metadata commit. The chunk list is the
// complete list of chunks written so far, and is applied by the pipeline as
// a single replace.
struct BlockData
{
    typedef vector<ChunkInfo>    Chunks;
    typedef map<string, string>  Metadata;

    BlockData(
        const BlockId& inBlockId = BlockId())
        : mBlockId(inBlockId),
          mChunks(),
          mMetadata()
        {}
    blockOff_t GetSize() const
        { return (mChunks.empty() ? blockOff_t(0) : mChunks.back().GetEnd()); }

    BlockId  mBlockId;
    Chunks   mChunks;
    Metadata mMetadata;
};

}} // namespace RBS::client

#endif /* LIBCLIENT_BLOCK_DATA_H */
