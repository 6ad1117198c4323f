//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2007/10/17
//
// Copyright 2008-2012 Quantcast Corp.
// Copyright 2007-2008 Kosmix Corp.
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
// \brief A message logging facility.
//
//----------------------------------------------------------------------------

#ifndef COMMON_MSG_LOGGER_H
#define COMMON_MSG_LOGGER_H

#include "BufferedLogWriter.h"
#include <string.h>

namespace RBS
{
    // Have a singleton logger for an application
    class MsgLogger : public BufferedLogWriter
    {
    private:
        MsgLogger(const char *filename, LogLevel logLevel,
            const Properties* props, const char* propPrefix);
        ~MsgLogger();
        MsgLogger(const MsgLogger &other);
        MsgLogger& operator=(const MsgLogger &other);
        static MsgLogger *logger;
    public:
        static MsgLogger* GetLogger() { return logger; }
        static void Init(const char *filename);
        static void Init(const char *filename, LogLevel logLevel);
        static void Init(const Properties& props, const char* propPrefix = 0);
        static void Init(const char *filename, LogLevel logLevel,
            const Properties* props, const char* propPrefix);
        static void SetLevel(LogLevel logLevel) {
            if (logger) {
                logger->SetLogLevel(logLevel);
            }
        }
        static bool IsLoggerInited() { return (logger != 0); }
        static const char* SourceFileName(const char* name) {
            if (! name) {
                return "";
            }
            const char* const ret = strrchr(name, '/');
            if (! ret || ! ret[1]) {
                return name;
            }
            return ret + 1;
        }
    };

// The following if prevents arguments evaluation (and possible side effect).
// The insertion has to be always terminated with RBS_LOG_EOM.
#ifndef RBS_LOG_STREAM_START
#   define RBS_LOG_STREAM_START(logLevel, streamVarName) \
    if (RBS::MsgLogger::GetLogger() && \
            RBS::MsgLogger::GetLogger()->IsLogLevelEnabled(logLevel)) {\
        RBS::MsgLogger::StStream streamVarName( \
            *RBS::MsgLogger::GetLogger(), logLevel); \
        streamVarName.GetStream() << "(" << \
            RBS::MsgLogger::SourceFileName(__FILE__) << ":" << __LINE__ << ") "
#endif
#ifndef RBS_LOG_STREAM_END
#   define RBS_LOG_STREAM_END \
    } (void)0
#endif

#ifndef RBS_LOG_STREAM
#   define RBS_LOG_STREAM(logLevel) \
        RBS_LOG_STREAM_START(logLevel, _msgStream_015351104260035312)
#endif
#ifndef RBS_LOG_EOM
#   define RBS_LOG_EOM \
        std::flush; \
        RBS_LOG_STREAM_END
#endif

#ifndef RBS_LOG_STREAM_DEBUG
#   define RBS_LOG_STREAM_DEBUG \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelDEBUG)
#endif
#ifndef RBS_LOG_STREAM_INFO
#   define RBS_LOG_STREAM_INFO \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelINFO)
#endif
#ifndef RBS_LOG_STREAM_NOTICE
#   define RBS_LOG_STREAM_NOTICE \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelNOTICE)
#endif
#ifndef RBS_LOG_STREAM_WARN
#   define RBS_LOG_STREAM_WARN \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelWARN)
#endif
#ifndef RBS_LOG_STREAM_ERROR
#   define RBS_LOG_STREAM_ERROR \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelERROR)
#endif
#ifndef RBS_LOG_STREAM_FATAL
#   define RBS_LOG_STREAM_FATAL \
        RBS_LOG_STREAM(RBS::MsgLogger::kLogLevelFATAL)
#endif

} // namespace RBS

#endif // COMMON_MSG_LOGGER_H
