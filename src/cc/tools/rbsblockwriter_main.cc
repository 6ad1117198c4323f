//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
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
// \brief Streams a local file through the block writer into an emulated replica
// pipeline, and prints the committed block identity and writer stats.
//
//----------------------------------------------------------------------------

#include "libclient/BlockStreamWriter.h"
#include "emulator/PipelineEmulator.h"
#include "common/MsgLogger.h"
#include "common/Properties.h"
#include "common/rbserrno.h"

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <unistd.h>
#include <stdlib.h>

#include <iostream>
#include <string>
#include <vector>

using std::cout;
using std::cerr;
using std::string;
using std::vector;

using namespace RBS;
using namespace RBS::client;

struct StatsPrinter
{
    void operator()(const char* name, int64_t value) const
        { cout << name << ": " << value << "\n"; }
};

static int doWrite(const string& filename, BlockStreamWriter& writer,
    size_t bufferSize);

int
main(int argc, char **argv)
{
    int         optchar;
    string      filename;
    bool        help           = false;
    bool        verboseLogging = false;
    const char* config         = 0;
    int         replicas       = NUM_REPLICAS_PER_PIPELINE;
    int64_t     bufferSize     = -1;

    while ((optchar = getopt(argc, argv, "hf:c:r:b:v")) != -1) {
        switch (optchar) {
            case 'f':
                filename = optarg;
                break;
            case 'c':
                config = optarg;
                break;
            case 'r':
                replicas = atoi(optarg);
                break;
            case 'b':
                bufferSize = atoll(optarg);
                break;
            case 'h':
                help = true;
                break;
            case 'v':
                verboseLogging = true;
                break;
            default:
                cout << "Unrecognized flag : " << optchar << "\n";
                help = true;
                break;
        }
    }

    if (help || filename.empty() || replicas <= 0 ||
            MAX_REPLICAS_PER_PIPELINE < replicas) {
        cout << "Usage: " << argv[0] <<
            " -f <file> [-c <config>] [-r <replicas>] [-b <buffer size>]"
            " [-v]\n"
            "Writes the file into a single block of an emulated "
            "replica pipeline.\n";
        return 1;
    }

    Properties props;
    if (config && props.loadProperties(config, '=') != 0) {
        cerr << "failed to load configuration: " << config << "\n";
        return 1;
    }
    MsgLogger::Init(props, "rbs.log.");
    if (verboseLogging) {
        MsgLogger::SetLevel(MsgLogger::kLogLevelDEBUG);
    } else if (! props.getValue("rbs.log.logLevel")) {
        MsgLogger::SetLevel(MsgLogger::kLogLevelINFO);
    }

    BlockStreamWriter::Config writerConfig;
    writerConfig.SetParameters(props, "rbs.writer.");
    if (0 < bufferSize) {
        writerConfig.mStreamBufferSize = bufferSize;
    }
    string errMsg;
    if (BlockStreamWriter::ValidateConfig(writerConfig, &errMsg) != 0) {
        cerr << "invalid writer configuration: " << errMsg << "\n";
        return 1;
    }

    PipelineEmulator emulator;
    const BlockId    blockId(
        props.getValue("rbs.block.containerId", containerId_t(1)),
        props.getValue("rbs.block.localId",     localId_t(1))
    );
    BlockStreamWriter writer(blockId, emulator,
        PipelineEmulator::MakePipeline(1, replicas), writerConfig);
    int status = writer.Open();
    if (status == 0) {
        status = doWrite(filename, writer, (size_t)writerConfig.mStreamBufferSize);
    }
    const int closeStatus = writer.Close();
    if (status == 0) {
        status = closeStatus;
    }
    if (status != 0) {
        int    failure = 0;
        string failureMsg;
        writer.GetFailure(failure, failureMsg);
        cerr << filename << ": " << ErrorCodeToString(status) <<
            (failureMsg.empty() ? "" : " ") << failureMsg << "\n";
        return 1;
    }

    const PipelineEmulator::BlockDataPtr block = emulator.GetCommittedBlock(0);
    cout <<
        "block: "  << writer.GetBlockId() << "\n"
        "bytes: "  << writer.GetWrittenLength() << "\n"
        "chunks: " << (block ? block->mChunks.size() : size_t(0)) << "\n";
    const Replicas failed = writer.GetFailedReplicas();
    for (Replicas::const_iterator it = failed.begin(); it != failed.end();
            ++it) {
        cout << "failed replica: " << *it << "\n";
    }
    BlockStreamWriter::Stats stats;
    writer.GetStats(stats);
    StatsPrinter printer;
    stats.Enumerate(printer);
    return 0;
}

static int
doWrite(const string& filename, BlockStreamWriter& writer, size_t bufferSize)
{
    const int fd = open(filename.c_str(), O_RDONLY);
    if (fd < 0) {
        const int err = errno;
        cerr << filename << ": " << ErrorCodeToString(-err) << "\n";
        return -err;
    }
    vector<char> buf(bufferSize);
    int          status = 0;
    for (; ;) {
        const ssize_t nread = read(fd, &buf[0], buf.size());
        if (nread < 0) {
            status = errno == EINTR ? 0 : -errno;
            if (status == 0) {
                continue;
            }
            cerr << filename << ": read: " << ErrorCodeToString(status) <<
                "\n";
            break;
        }
        if (nread == 0) {
            break;
        }
        if ((status = writer.Write(&buf[0], (size_t)nread)) != 0) {
            break;
        }
    }
    close(fd);
    return status;
}
