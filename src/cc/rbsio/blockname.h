//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2016/8/9
// Author: Mike Ovsiannikov
//
// Copyright 2014,2016 Quantcast Corporation. All rights reserved.
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
// \brief Chunk name construction and parsing.
//
//----------------------------------------------------------------------------

#ifndef RBSIO_BLOCK_NAME_H
#define RBSIO_BLOCK_NAME_H

#include "common/rbstypes.h"

#include <string>

namespace RBS
{
using std::string;

// Chunk name: <block local id>_chunk_<chunk index>
    string
MakeChunkName(
    localId_t inLocalId,
    int64_t   inChunkIndex);

    bool
AppendChunkName(
    string&   ioName,
    localId_t inLocalId,
    int64_t   inChunkIndex);

    bool
ParseChunkName(
    const string& inName,
    localId_t&    outLocalId,
    int64_t&      outChunkIndex);

} // namespace RBS

#endif /* RBSIO_BLOCK_NAME_H */
