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
// \brief Data sync policy used to set chunk send sync flag.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_SYNC_POLICY_H
#define LIBCLIENT_SYNC_POLICY_H

#include "common/rbstypes.h"

namespace RBS
{
namespace client
{

class SyncPolicy
{
public:
    // Invoked with the block position at the end of each chunk. Returns true
    // if the replicas should persist the data up to the position.
    virtual bool NeedSync(
        blockOff_t inPosition) = 0;
protected:
    SyncPolicy()
        {}
    virtual ~SyncPolicy()
        {}
};

// Sync every inSyncSize bytes, 0 disables sync.
class ByteIntervalSyncPolicy : public SyncPolicy
{
public:
    ByteIntervalSyncPolicy(
        int64_t inSyncSize = 0)
        : SyncPolicy(),
          mSyncSize(inSyncSize),
          mSyncPosition(0)
        {}
    virtual ~ByteIntervalSyncPolicy()
        {}
    virtual bool NeedSync(
        blockOff_t inPosition)
    {
        if (mSyncSize <= 0 || inPosition < mSyncPosition + mSyncSize) {
            return false;
        }
        mSyncPosition = inPosition;
        return true;
    }
    void SetSyncSize(
        int64_t inSyncSize)
        { mSyncSize = inSyncSize; }
    int64_t GetSyncSize() const
        { return mSyncSize; }
private:
    int64_t    mSyncSize;
    blockOff_t mSyncPosition;
};

}} // namespace RBS::client

#endif /* LIBCLIENT_SYNC_POLICY_H */
