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

#ifndef COMMON_RBSERRNO_H
#define COMMON_RBSERRNO_H

#include <string>

namespace RBS
{
using std::string;

// Converts negative status code, either errno or one of the RBS codes
// declared in rbstypes.h, into human readable form.
string ErrorCodeToString(int inStatus);

}

#endif /* COMMON_RBSERRNO_H */
