//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2010/03/02
// Author: Mike Ovsiannikov
//
// Copyright 2010-2012 Quantcast Corp.
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
// \brief Message log writer.
//
//----------------------------------------------------------------------------

#include "BufferedLogWriter.h"
#include "Properties.h"
#include "Mutex.h"
#include "time.h"

#include <sstream>
#include <string>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

namespace RBS
{
using std::string;
using std::ostringstream;

const int kLogWriterDefaulOpenFlags = O_WRONLY | O_CREAT | O_APPEND;

class BufferedLogWriter::Impl
{
public:
    Impl(
        int         inFd,
        const char* inFileNamePtr,
        const char* inTimeStampFormatPtr,
        bool        inUseGMTFlag)
        : mMutex(),
          mFd(-1),
          mCloseFdFlag(false),
          mFileName(),
          mTimeStampFormat(inTimeStampFormatPtr ?
            inTimeStampFormatPtr : "%m-%d-%Y %H:%M:%S"),
          mUseGMTFlag(inUseGMTFlag),
          mAppendCount(0),
          mWriteErrorCount(0)
    {
        if (inFileNamePtr && *inFileNamePtr) {
            if (Open(inFileNamePtr) != 0 && inFd >= 0) {
                mFd = inFd;
            }
        } else {
            mFd = inFd;
        }
    }
    ~Impl()
        { Close(); }
    void SetParameters(
        const string&     inPrefix,
        const Properties& inProps)
    {
        StMutexLocker theLock(mMutex);
        mTimeStampFormat = inProps.getValue(
            inPrefix + "timeStampFormat", mTimeStampFormat);
        mUseGMTFlag = inProps.getValue(
            inPrefix + "useGMT", mUseGMTFlag ? 1 : 0) != 0;
        const string theFileName = inProps.getValue(
            inPrefix + "logFile", mFileName);
        if (theFileName != mFileName && ! theFileName.empty()) {
            theLock.Unlock();
            Open(theFileName.c_str());
        }
    }
    int Open(
        const char* inFileNamePtr)
    {
        const int theFd = open(inFileNamePtr, kLogWriterDefaulOpenFlags, 0644);
        if (theFd < 0) {
            const int theErr = errno;
            return (theErr > 0 ? -theErr : -EIO);
        }
        StMutexLocker theLock(mMutex);
        CloseSelf();
        mFd          = theFd;
        mCloseFdFlag = true;
        mFileName    = inFileNamePtr;
        return 0;
    }
    void Close()
    {
        StMutexLocker theLock(mMutex);
        CloseSelf();
    }
    void Append(
        BufferedLogWriter::LogLevel inLogLevel,
        const char*                 inFmtStrPtr,
        va_list                     inArgs)
    {
        char theBuf[1 << 12];
        const int theLen = vsnprintf(theBuf, sizeof(theBuf), inFmtStrPtr,
            inArgs);
        if (theLen < 0) {
            return;
        }
        Write(inLogLevel, theBuf,
            theLen < (int)sizeof(theBuf) ? theLen : (int)sizeof(theBuf) - 1);
    }
    void Write(
        BufferedLogWriter::LogLevel inLogLevel,
        const char*                 inMsgPtr,
        size_t                      inMsgLen)
    {
        char theTimeBuf[64];
        string theMsg;
        theMsg.reserve(inMsgLen + 96);
        StMutexLocker theLock(mMutex);
        mAppendCount++;
        if (mFd < 0) {
            return;
        }
        FormatTimeStamp(microseconds(), mTimeStampFormat.c_str(), mUseGMTFlag,
            theTimeBuf, (int)sizeof(theTimeBuf));
        theMsg += theTimeBuf;
        theMsg += ' ';
        theMsg += GetLogLevelNamePtr(inLogLevel);
        theMsg += ' ';
        theMsg.append(inMsgPtr, inMsgLen);
        if (theMsg.empty() || theMsg[theMsg.size() - 1] != '\n') {
            theMsg += '\n';
        }
        const char*       thePtr = theMsg.data();
        const char* const theEnd = thePtr + theMsg.size();
        while (thePtr < theEnd) {
            const ssize_t theNWr = write(mFd, thePtr, theEnd - thePtr);
            if (theNWr < 0) {
                if (errno == EINTR) {
                    continue;
                }
                mWriteErrorCount++;
                break;
            }
            thePtr += theNWr;
        }
    }
    void GetCounters(
        BufferedLogWriter::Counters& outCounters)
    {
        StMutexLocker theLock(mMutex);
        outCounters.mAppendCount     = mAppendCount;
        outCounters.mWriteErrorCount = mWriteErrorCount;
    }
    ostream& GetStream(
        BufferedLogWriter::LogLevel inLogLevel)
        { return *(new MsgStream(inLogLevel)); }
    void PutStream(
        ostream& inStream)
    {
        MsgStream& theStream = static_cast<MsgStream&>(inStream);
        const string theMsg = theStream.str();
        Write(theStream.GetLogLevel(), theMsg.data(), theMsg.size());
        delete &theStream;
    }
    static const char* GetLogLevelNamePtr(
        BufferedLogWriter::LogLevel inLogLevel)
    {
        switch (inLogLevel) {
            case kLogLevelEMERG:  return "FATAL";
            case kLogLevelALERT:  return "ALERT";
            case kLogLevelCRIT:   return "CRIT";
            case kLogLevelERROR:  return "ERROR";
            case kLogLevelWARN:   return "WARN";
            case kLogLevelNOTICE: return "NOTICE";
            case kLogLevelINFO:   return "INFO";
            case kLogLevelDEBUG:  return "DEBUG";
            case kLogLevelNOTSET: return "NOTSET";
            default: break;
        }
        return "UNKNOWN";
    }
private:
    class MsgStream : public ostringstream
    {
    public:
        MsgStream(
            BufferedLogWriter::LogLevel inLogLevel)
            : ostringstream(),
              mLogLevel(inLogLevel)
            {}
        BufferedLogWriter::LogLevel GetLogLevel() const
            { return mLogLevel; }
    private:
        const BufferedLogWriter::LogLevel mLogLevel;
    };

    Mutex   mMutex;
    int     mFd;
    bool    mCloseFdFlag;
    string  mFileName;
    string  mTimeStampFormat;
    bool    mUseGMTFlag;
    int64_t mAppendCount;
    int64_t mWriteErrorCount;

    void CloseSelf()
    {
        if (mCloseFdFlag && mFd >= 0 && close(mFd) != 0) {
            mWriteErrorCount++;
        }
        mFd          = -1;
        mCloseFdFlag = false;
        mFileName.clear();
    }
private:
    Impl(
        const Impl& inImpl);
    Impl& operator=(
        const Impl& inImpl);
};

BufferedLogWriter::BufferedLogWriter(
    int         inFd,
    const char* inFileNamePtr,
    LogLevel    inLogLevel,
    const char* inTimeStampFormatPtr,
    bool        inUseGMTFlag)
    : mLogLevel(inLogLevel),
      mImpl(*(new Impl(
        inFd,
        inFileNamePtr,
        inTimeStampFormatPtr,
        inUseGMTFlag)
      ))
{
}

BufferedLogWriter::~BufferedLogWriter()
{
    delete &mImpl;
}

void
BufferedLogWriter::SetParameters(
    const Properties& inProps,
    const char*       inPropsPrefixPtr /* = 0 */)
{
    const string thePropsPrefix = inPropsPrefixPtr ? inPropsPrefixPtr : "";
    mImpl.SetParameters(thePropsPrefix, inProps);
    SetLogLevel(inProps.getValue(thePropsPrefix + "logLevel",
        Impl::GetLogLevelNamePtr(mLogLevel)
    ));
}

int
BufferedLogWriter::Open(
    const char* inFileNamePtr)
{
    if (! inFileNamePtr || ! *inFileNamePtr) {
        return -EINVAL;
    }
    return mImpl.Open(inFileNamePtr);
}

void
BufferedLogWriter::Close()
{
    mImpl.Close();
}

void
BufferedLogWriter::Append(
    BufferedLogWriter::LogLevel inLogLevel,
    const char*                 inFmtStrPtr,
    va_list                     inArgs)
{
    if (mLogLevel < inLogLevel) {
        return;
    }
    mImpl.Append(inLogLevel, inFmtStrPtr, inArgs);
}

bool
BufferedLogWriter::SetLogLevel(
    const char* inLogLevelNamePtr)
{
    if (! inLogLevelNamePtr || ! *inLogLevelNamePtr) {
        return false;
    }
    struct { const char* mNamePtr; LogLevel mLevel; } const kLogLevels[] = {
        { "EMERG",  kLogLevelEMERG  },
        { "FATAL",  kLogLevelFATAL  },
        { "ALERT",  kLogLevelALERT  },
        { "CRIT",   kLogLevelCRIT   },
        { "ERROR",  kLogLevelERROR  },
        { "WARN",   kLogLevelWARN   },
        { "NOTICE", kLogLevelNOTICE },
        { "INFO",   kLogLevelINFO   },
        { "DEBUG",  kLogLevelDEBUG  },
        { "NOTSET", kLogLevelNOTSET }
    };
    const size_t kNumLogLevels = sizeof(kLogLevels) / sizeof(kLogLevels[0]);
    for (size_t i = 0; i < kNumLogLevels; i++) {
        if (::strcmp(kLogLevels[i].mNamePtr, inLogLevelNamePtr) == 0) {
            mLogLevel = kLogLevels[i].mLevel;
            return true;
        }
    }
    return false;
}

/* static */ const char*
BufferedLogWriter::GetLogLevelNamePtr(
    BufferedLogWriter::LogLevel inLogLevel)
{
    return Impl::GetLogLevelNamePtr(inLogLevel);
}

void
BufferedLogWriter::GetCounters(
    BufferedLogWriter::Counters& outCounters)
{
    mImpl.GetCounters(outCounters);
}

ostream&
BufferedLogWriter::GetStream(
    BufferedLogWriter::LogLevel inLogLevel)
{
    return mImpl.GetStream(inLogLevel);
}

void
BufferedLogWriter::PutStream(
    ostream& inStream)
{
    mImpl.PutStream(inStream);
}

}
