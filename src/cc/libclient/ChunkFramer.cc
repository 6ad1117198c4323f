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
// \brief Chunk framer: turns one write buffer into one chunk descriptor.
//
//----------------------------------------------------------------------------

#include "ChunkFramer.h"
#include "rbsio/blockname.h"
#include "common/rbsatomic.h"

#include <errno.h>

namespace RBS
{
namespace client
{

ChunkFramer::ChunkFramer(
    localId_t       inLocalId,
    const Checksum& inChecksum)
    : mLocalId(inLocalId),
      mChecksum(inChecksum),
      mOffset(0),
      mChunkIndex(0)
{}

    int
ChunkFramer::Frame(
    const char* inBufPtr,
    size_t      inLength,
    ChunkInfo&  outChunk)
{
    if (inLength <= 0) {
        return 0;
    }
    if (! inBufPtr) {
        return -EINVAL;
    }
    ChunkInfo theChunk;
    const int theStatus = mChecksum.Compute(
        inBufPtr, inLength, theChunk.mChecksum);
    if (theStatus != 0) {
        return theStatus;
    }
    const int64_t theLength = (int64_t)inLength;
    theChunk.mIndex  = ++mChunkIndex;
    theChunk.mName   = MakeChunkName(mLocalId, theChunk.mIndex);
    theChunk.mOffset = SyncAddAndFetch(mOffset, theLength) - theLength;
    theChunk.mLength = theLength;
    outChunk = theChunk;
    return 1;
}

    blockOff_t
ChunkFramer::GetOffset() const
{
    return SyncLoad(const_cast<volatile int64_t&>(mOffset));
}

}} // namespace RBS::client
