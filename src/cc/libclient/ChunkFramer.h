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

#ifndef LIBCLIENT_CHUNK_FRAMER_H
#define LIBCLIENT_CHUNK_FRAMER_H

#include "BlockData.h"
#include "rbsio/checksum.h"

namespace RBS
{
namespace client
{

// Assigns contiguous offsets and increasing chunk indexes, starting with
// offset 0 and index 1. The offset cursor is atomic, and can be read from any
// thread.
class ChunkFramer
{
public:
    ChunkFramer(
        localId_t       inLocalId,
        const Checksum& inChecksum);
    // Returns 1 if a chunk was framed, 0 if the input is empty, -EINVAL if
    // the buffer is null, or checksum computation error.
    int Frame(
        const char* inBufPtr,
        size_t      inLength,
        ChunkInfo&  outChunk);
    blockOff_t GetOffset() const;
    int64_t GetChunkCount() const
        { return mChunkIndex; }
private:
    const localId_t    mLocalId;
    const Checksum     mChecksum;
    volatile int64_t   mOffset;
    int64_t            mChunkIndex;
private:
    ChunkFramer(
        const ChunkFramer& inFramer);
    ChunkFramer& operator=(
        const ChunkFramer& inFramer);
};

}} // namespace RBS::client

#endif /* LIBCLIENT_CHUNK_FRAMER_H */
