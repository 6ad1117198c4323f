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
// \brief Common declarations shared by client and emulator.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RBSDECLS_H
#define COMMON_RBSDECLS_H

#include "rbstypes.h"

#include <string>
#include <sstream>

namespace RBS
{
using std::string;

///
/// Define a server process' location: hostname and the port at which
/// it is listening for incoming connections
///
struct ServerLocation
{
    ServerLocation()
        : hostname(),
          port(-1)
        {}
    ServerLocation(const string& h, int p)
        : hostname(h),
          port(p)
        {}
    bool operator == (const ServerLocation& other) const
        { return (hostname == other.hostname && port == other.port); }
    bool operator != (const ServerLocation& other) const
        { return (hostname != other.hostname || port != other.port); }
    bool operator < (const ServerLocation& other) const
    {
        const int res = hostname.compare(other.hostname);
        return (res < 0 || (res == 0 && port < other.port));
    }
    bool IsValid() const
        { return (! hostname.empty() && port > 0); }
    template<typename T>
    T& Display(T& os) const
    {
        os << hostname;
        os << ' ';
        os << port;
        return os;
    }
    string ToString() const
    {
        std::ostringstream os;
        Display(os);
        return os.str();
    }
    string hostname; //!< Location of the server: machine name/IP addr
    int    port;     //!< Location of the server: port to connect to
};

template<typename T>
inline static T&
operator<<(T& os, const ServerLocation& loc)
    { return loc.Display(os); }

}

#endif // COMMON_RBSDECLS_H
