//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2011/05/15
// Author: Mike Ovsiannikov
//
// Copyright 2011-2012 Quantcast Corp.
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
// \brief Atomic counter and pointer helpers built on gcc __sync builtins.
//
//----------------------------------------------------------------------------

#ifndef RBS_ATOMIC_H
#define RBS_ATOMIC_H

namespace RBS
{

template<typename T> T SyncAddAndFetch(volatile T& val, T inc)
{
    return __sync_add_and_fetch(&val, inc);
}

// Returns true if val was equal to oldVal, and was replaced by newVal.
template<typename T> bool SyncCompareAndSwap(volatile T& val, T oldVal, T newVal)
{
    return __sync_bool_compare_and_swap(&val, oldVal, newVal);
}

// Full barrier load.
template<typename T> T SyncLoad(volatile T& val)
{
    return __sync_val_compare_and_swap(&val, T(), T());
}

}

#endif /* RBS_ATOMIC_H */
