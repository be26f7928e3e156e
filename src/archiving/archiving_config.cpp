// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archiving_config.h>
#include <archiving/archiving_params.h>
#include <util.h>

#include <atomic>
#include <stdexcept>

namespace archiving {

static std::atomic<int> g_archive_threads{DEFAULT_ARCHIVE_THREADS};

/** Options that may only be given on regtest */
static const char* const REGTEST_ONLY_ARGS[] = {
    "-segmentcapacity", "-shardsize", "-sourceshards",
    "-parityshards", "-padbyte", "-commitmenthash",
};

std::string GetArchivingHelpMessage()
{
    const ArchivingParams& regtest = RegtestArchivingParams();
    std::string strUsage;

    strUsage += HelpMessageGroup("Archiving options:");
    strUsage += HelpMessageOpt("-chain=<net>", strprintf("Parameter set to use: main, test or regtest (default: %s)", DEFAULT_ARCHIVE_CHAIN));
    strUsage += HelpMessageOpt("-archivethreads=<n>", strprintf("Number of threads computing parity shards, 1 to %d (default: %d)", MAX_ARCHIVE_THREADS, DEFAULT_ARCHIVE_THREADS));

    strUsage += HelpMessageGroup("Regtest archiving options:");
    strUsage += HelpMessageOpt("-segmentcapacity=<n>", strprintf("Source bytes per segment (default: %u)", regtest.nSegmentCapacity));
    strUsage += HelpMessageOpt("-shardsize=<n>", strprintf("Bytes per shard (default: %u)", regtest.nShardSize));
    strUsage += HelpMessageOpt("-sourceshards=<n>", strprintf("Source shards per segment (default: %u)", regtest.nSourceShards));
    strUsage += HelpMessageOpt("-parityshards=<n>", strprintf("Parity shards per segment (default: %u)", regtest.nParityShards));
    strUsage += HelpMessageOpt("-padbyte=<n>", strprintf("Value used to pad the last source shard (default: %u)", regtest.nPadByte));
    strUsage += HelpMessageOpt("-commitmenthash=<algo>", strprintf("Commitment hash: sha256d, sha256 or sha3-256 (default: %s)", GetHashAlgorithmName(regtest.commitmentHash)));

    strUsage += HelpMessageGroup("Debugging/Logging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Specify location of debug log file (default: %s)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));

    return strUsage;
}

static bool ApplyRegtestOverrides()
{
    ArchivingParams params = RegtestArchivingParams();

    int64_t capacity = gArgs.GetArg("-segmentcapacity", (int64_t)params.nSegmentCapacity);
    int64_t shardSize = gArgs.GetArg("-shardsize", (int64_t)params.nShardSize);
    int64_t sourceShards = gArgs.GetArg("-sourceshards", (int64_t)params.nSourceShards);
    int64_t parityShards = gArgs.GetArg("-parityshards", (int64_t)params.nParityShards);
    int64_t padByte = gArgs.GetArg("-padbyte", (int64_t)params.nPadByte);

    if (capacity <= 0 || shardSize <= 0 || shardSize > (int64_t)MAX_RECORD_PAYLOAD_SIZE) {
        return error("%s: -segmentcapacity and -shardsize must be positive", __func__);
    }
    if (sourceShards <= 0 || parityShards <= 0 ||
        sourceShards > (int64_t)MAX_TOTAL_SHARDS || parityShards > (int64_t)MAX_TOTAL_SHARDS) {
        return error("%s: -sourceshards and -parityshards must be between 1 and %u", __func__, MAX_TOTAL_SHARDS);
    }
    if (padByte < 0 || padByte > 0xff) {
        return error("%s: -padbyte must be between 0 and 255", __func__);
    }

    params.nSegmentCapacity = (uint64_t)capacity;
    params.nShardSize = (uint32_t)shardSize;
    params.nSourceShards = (uint32_t)sourceShards;
    params.nParityShards = (uint32_t)parityShards;
    params.nPadByte = (unsigned char)padByte;

    if (gArgs.IsArgSet("-commitmenthash")) {
        std::string strAlgo = gArgs.GetArg("-commitmenthash", "");
        if (!ParseHashAlgorithm(strAlgo, params.commitmentHash)) {
            return error("%s: unknown -commitmenthash '%s'", __func__, strAlgo);
        }
    }

    ArchiveState state;
    if (!UpdateRegtestArchivingParams(params, state)) {
        return error("%s: invalid regtest parameters: %s", __func__, state.ToString());
    }
    return true;
}

bool InitArchivingConfig()
{
    std::string network = gArgs.GetArg("-chain", DEFAULT_ARCHIVE_CHAIN);
    try {
        SelectArchivingParams(network);
    } catch (const std::runtime_error& e) {
        return error("%s", e.what());
    }

    if (network == NETWORK_REGTEST) {
        if (!ApplyRegtestOverrides()) {
            return false;
        }
    } else {
        for (const char* arg : REGTEST_ONLY_ARGS) {
            if (gArgs.IsArgSet(arg)) {
                return error("%s: %s is only supported on regtest", __func__, arg);
            }
        }
    }

    const ArchivingParams& params = GetArchivingParams();
    ArchiveState state;
    if (!ValidateArchivingParams(params, state)) {
        return error("%s: invalid parameters for %s: %s", __func__, network, state.ToString());
    }

    int64_t threads = gArgs.GetArg("-archivethreads", (int64_t)DEFAULT_ARCHIVE_THREADS);
    if (threads < 1 || threads > MAX_ARCHIVE_THREADS) {
        LogPrintf("Archiving: Invalid -archivethreads value %d, using default (%d)\n", threads, DEFAULT_ARCHIVE_THREADS);
        threads = DEFAULT_ARCHIVE_THREADS;
    }
    SetArchiveThreads((int)threads);

    LogPrintf("Archiving: Initialized - %s, threads=%d\n", params.ToString(), GetArchiveThreads());
    LogPrint(BCLog::CONFIG, "Archiving: proof depth %u, padding %u bytes per segment\n",
             params.GetCommitmentDepth(), params.GetPaddingSize());
    return true;
}

int GetArchiveThreads()
{
    return g_archive_threads.load();
}

void SetArchiveThreads(int threads)
{
    g_archive_threads = threads;
}

} // namespace archiving
