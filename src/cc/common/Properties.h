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

#ifndef COMMON_PROPERTIES_H
#define COMMON_PROPERTIES_H

#include <iosfwd>
#include <string>
#include <map>

namespace RBS
{

using std::map;
using std::string;
using std::istream;
using std::ostream;

// Key: value properties, loaded from configuration files or in-core buffers.
class Properties
{
private:
    typedef map<string, string> PropMap;

    int     intbase;
    PropMap propmap;

    template<typename T> T getIntValue(const string& key, T def) const;

public:
    typedef PropMap::const_iterator iterator;
    iterator begin() const { return propmap.begin(); }
    iterator end() const { return propmap.end(); }
    // load the properties from a file
    int loadProperties(const char* fileName, char delimiter,
        ostream* verbose = 0);
    // load the properties from a stream
    int loadProperties(istream& ist, char delimiter,
        ostream* verbose = 0);
    // load the properties from an in-core buffer
    int loadProperties(const char* buf, size_t len, char delimiter,
        ostream* verbose = 0);
    string getValue(const string& key, const string& def) const;
    const char* getValue(const string& key, const char* def) const;
    int getValue(const string& key, int def) const;
    unsigned int getValue(const string& key, unsigned int def) const;
    long getValue(const string& key, long def) const;
    unsigned long getValue(const string& key, unsigned long def) const;
    long long getValue(const string& key, long long def) const;
    unsigned long long getValue(const string& key, unsigned long long def)
        const;
    double getValue(const string& key, double def) const;
    const string* getValue(const string& key) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        return (it != propmap.end() ? &(it->second) : 0);
    }
    void setValue(const string& key, const string& value)
        { propmap[key] = value; }
    void getList(string &outBuf, const string& linePrefix,
        const string& lineSuffix = string("\n")) const;
    bool remove(const string& key)
        { return (propmap.erase(key) > 0); }
    void clear() { propmap.clear(); }
    bool empty() const { return propmap.empty(); }
    size_t size() const { return propmap.size(); }
    size_t copyWithPrefix(const char* prefix, Properties& props) const;
    size_t copyWithPrefix(const string& prefix, Properties& props) const
        { return copyWithPrefix(prefix.c_str(), props); }
    void setIntBase(int base)
        { intbase = base; }
    bool operator==(const Properties& p) const
        { return (intbase == p.intbase && propmap == p.propmap); }
    bool operator!=(const Properties& p) const
        { return (! (*this == p)); }
    Properties(int base = 10);
    Properties(const Properties& p);
    ~Properties();
};

}

#endif // COMMON_PROPERTIES_H
