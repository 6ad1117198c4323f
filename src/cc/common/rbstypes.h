//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2006/10/20
// Author: Sriram Rao
//
// Copyright 2008-2012,2016 Quantcast Corporation. All rights reserved.
// Copyright 2006-2008 Kosmix Corp.
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
// \brief Common declarations: identifiers, sizes, and RBS error codes.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RBSTYPES_H
#define COMMON_RBSTYPES_H

#include <stdint.h>
#include <stddef.h>

namespace RBS {

typedef int64_t seq_t;         //!< request / log sequence no.
typedef int64_t containerId_t; //!< storage container ID
typedef int64_t localId_t;     //!< block ID within the container
typedef int64_t blockOff_t;    //!< byte offset within a block
typedef int64_t logIndex_t;    //!< replication log position

const int NUM_REPLICAS_PER_PIPELINE = 3; //!< default pipeline width
const int MAX_REPLICAS_PER_PIPELINE = 16;

//!< Error codes for RBS specific errors. Returned negated, like errno.

// chunk send or stream close failed
const int ETRANSPORTFAILED = 1100;

// metadata commit rejected by the pipeline, or malformed response
const int ECOMMITFAILED = 1101;

// quorum watch exceeded its deadline
const int EQUORUMTIMEOUT = 1102;

// programming or protocol contract violation, not recoverable
const int EINVARIANT = 1103;

// the waiting thread was interrupted
const int EWAITINTERRUPTED = 1104;

inline static bool IsRbsError(int status)
{
    return (
        -EWAITINTERRUPTED <= status &&
        status <= -ETRANSPORTFAILED
    );
}

}

#endif // COMMON_RBSTYPES_H
