//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2004/05/05
//
// Copyright 2008-2012 Quantcast Corp.
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
// \brief Key / value configuration properties.
//
//----------------------------------------------------------------------------

#include "Properties.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <string.h>
#include <errno.h>

namespace RBS
{

using std::string;
using std::istream;
using std::istringstream;
using std::ifstream;
using std::endl;
using std::pair;
using std::make_pair;

inline static void
removeLTSpaces(const string& str, string::size_type start,
    string::size_type end, string& outStr)
{
    char const* const delims = " \t\r\n";

    if (start >= str.length()) {
        outStr.clear();
        return;
    }
    string::size_type const first = str.find_first_not_of(delims, start);
    if (end <= first || first == string::npos) {
        outStr.clear();
        return;
    }
    string::size_type const last = str.find_last_not_of(
        delims, end == string::npos ? string::npos : end - 1);
    outStr.assign(str, first,
        (last == string::npos ? str.size() : last + 1) - first);
}

Properties::Properties(int base)
    : intbase(base),
      propmap()
{
}

Properties::Properties(const Properties &p)
    : intbase(p.intbase),
      propmap(p.propmap)
{
}

Properties::~Properties()
{
}

int
Properties::loadProperties(
    const char* fileName,
    char        delimiter,
    ostream*    verbose /* = 0 */)
{
    ifstream input(fileName);
    if(! input.is_open()) {
        const int err = errno;
        return (err > 0 ? -err : -ENOENT);
    }
    const int ret = loadProperties(input, delimiter, verbose);
    input.close();
    return ret;
}

int
Properties::loadProperties(
    istream& ist,
    char     delimiter,
    ostream* verbose /* = 0 */)
{
    string line;
    string key;
    string val;
    if (ist) {
        line.reserve(512);
    }
    while (getline(ist, line)) { //read one line at a time
        string::size_type const start = line.find_first_not_of(" \t");
        if (start == string::npos || line[start] == '#') {
            continue; // ignore comments
        }
        // find the delimiter
        string::size_type const pos = line.find(delimiter);
        if (pos == string::npos) {
            continue; // ignore if no delimiter is found
        }
        removeLTSpaces(line, 0, pos, key);
        removeLTSpaces(line, pos + 1, string::npos, val);
        if (key.empty()) {
            continue;
        }
        propmap[key] = val;
        if (verbose) {
            (*verbose) << "Loading key " << key  <<
                " with value " << val << endl;
        }
    }
    return 0;
}

int
Properties::loadProperties(
    const char* buf,
    size_t      len,
    char        delimiter,
    ostream*    verbose /* = 0 */)
{
    if (! buf && len > 0) {
        return -EINVAL;
    }
    istringstream ist(string(buf ? buf : "", len));
    return loadProperties(ist, delimiter, verbose);
}

template<typename T> T
Properties::getIntValue(const string& key, T def) const
{
    PropMap::const_iterator const i = propmap.find(key);
    if (i == propmap.end()) {
        return def;
    }
    const char* const p = i->second.c_str();
    char*             e = 0;
    errno = 0;
    const long long   v = strtoll(p, &e, intbase);
    if (e <= p || *e > ' ' || errno != 0) {
        return def;
    }
    return (T)v;
}

string
Properties::getValue(const string& key, const string& def) const
{
    PropMap::const_iterator const i = propmap.find(key);
    return (i == propmap.end() ? def : i->second);
}

const char*
Properties::getValue(const string& key, const char* def) const
{
    PropMap::const_iterator const i = propmap.find(key);
    return (i == propmap.end() ? def : i->second.c_str());
}

int
Properties::getValue(const string& key, int def) const
{
    return getIntValue(key, def);
}

unsigned int
Properties::getValue(const string& key, unsigned int def) const
{
    return getIntValue(key, def);
}

long
Properties::getValue(const string& key, long def) const
{
    return getIntValue(key, def);
}

unsigned long
Properties::getValue(const string& key, unsigned long def) const
{
    return (unsigned long)getValue(key, (unsigned long long)def);
}

long long
Properties::getValue(const string& key, long long def) const
{
    return getIntValue(key, def);
}

unsigned long long
Properties::getValue(const string& key, unsigned long long def) const
{
    PropMap::const_iterator const i = propmap.find(key);
    if (i == propmap.end()) {
        return def;
    }
    const char* const        p = i->second.c_str();
    char*                    e = 0;
    errno = 0;
    const unsigned long long v = strtoull(p, &e, intbase);
    return ((p < e && *e <= ' ' && errno == 0) ? v : def);
}

double
Properties::getValue(const string& key, double def) const
{
    PropMap::const_iterator const i = propmap.find(key);
    if (i == propmap.end()) {
        return def;
    }
    char*             e   = 0;
    const char* const p   = i->second.c_str();
    const double      ret = strtod(p, &e);
    return ((p < e && *e <= ' ') ? ret : def);
}

void
Properties::getList(string& outBuf,
    const string& linePrefix, const string& lineSuffix) const
{
    for (PropMap::const_iterator iter = propmap.begin();
            iter != propmap.end();
            ++iter) {
        if (! iter->first.empty()) {
            outBuf += linePrefix;
            outBuf += iter->first;
            outBuf += '=';
            outBuf += iter->second;
            outBuf += lineSuffix;
        }
    }
}

size_t
Properties::copyWithPrefix(const char* prefix, Properties& props) const
{
    const size_t prefixLen = prefix ? strlen(prefix) : size_t(0);
    size_t       ret       = 0;
    for (PropMap::const_iterator it = prefixLen > 0 ?
                propmap.lower_bound(string(prefix, prefixLen)) :
                propmap.begin();
            it != propmap.end();
            ++it) {
        const string& key = it->first;
        if (key.compare(0, prefixLen, prefix, prefixLen) != 0) {
            break;
        }
        pair<PropMap::iterator, bool> const res = props.propmap.insert(
            make_pair(key, it->second));
        if (res.second) {
            ret++;
        } else if (res.first->second != it->second) {
            res.first->second = it->second;
            ret++;
        }
    }
    return ret;
}

}
