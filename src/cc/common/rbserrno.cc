//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2012/14/11
// Author: Mike Ovsiannikov
//
// Copyright 2012 Quantcast Corp.
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
// \brief Status code to message conversion.
//
//----------------------------------------------------------------------------

#include "rbserrno.h"
#include "rbstypes.h"
#include "rbsutils.h"

namespace RBS
{

    string
ErrorCodeToString(
    int inStatus)
{
    switch (-inStatus) {
        case ETRANSPORTFAILED: return "transport failure";
        case ECOMMITFAILED:    return "metadata commit failure";
        case EQUORUMTIMEOUT:   return "quorum commit timed out";
        case EINVARIANT:       return "invariant violation";
        case EWAITINTERRUPTED: return "wait interrupted";
        case 0:                return "";
        default:               break;
    }
    return Utils::SysError(inStatus < 0 ? -inStatus : inStatus);
}

}
