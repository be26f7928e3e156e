// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archiving_params.h>

#include <tinyformat.h>
#include <util.h>

#include <stdexcept>

namespace archiving {

const std::string NETWORK_MAIN = "main";
const std::string NETWORK_TESTNET = "test";
const std::string NETWORK_REGTEST = "regtest";

// Mainnet archiving parameters
static const ArchivingParams mainnetArchivingParams = {
    .strNetworkID = NETWORK_MAIN,
    .nSourceShards = 32,                            // 32 source shards
    .nParityShards = 32,                            // rate 1/2
    .nShardSize = 32 * 1024,                        // 32 KiB shards
    .nSegmentCapacity = 1024 * 1024,                // 1 MiB of history
    .nPadByte = 0x00,
    .commitmentHash = HashAlgorithm::SHA256D
};

// Testnet archiving parameters (capacity leaves room for padding)
static const ArchivingParams testnetArchivingParams = {
    .strNetworkID = NETWORK_TESTNET,
    .nSourceShards = 16,
    .nParityShards = 16,
    .nShardSize = 4096,
    .nSegmentCapacity = 65000,                      // 536 pad bytes
    .nPadByte = 0x00,
    .commitmentHash = HashAlgorithm::SHA256D
};

// Regtest archiving parameters (small, fast, overridable)
static const ArchivingParams defaultRegtestArchivingParams = {
    .strNetworkID = NETWORK_REGTEST,
    .nSourceShards = 4,
    .nParityShards = 4,
    .nShardSize = 1024,
    .nSegmentCapacity = 4096,
    .nPadByte = 0x00,
    .commitmentHash = HashAlgorithm::SHA256D
};

// Regtest parameters in effect, after any command-line overrides
static ArchivingParams regtestArchivingParams = defaultRegtestArchivingParams;

// Currently selected archiving params
static const ArchivingParams* pCurrentArchivingParams = &mainnetArchivingParams;

uint32_t ArchivingParams::GetCommitmentDepth() const
{
    uint32_t depth = 0;
    uint64_t width = 1;
    while (width < GetTotalShards()) {
        width <<= 1;
        ++depth;
    }
    return depth;
}

std::string ArchivingParams::ToString() const
{
    return strprintf("ArchivingParams(network=%s, shards=%u+%u, shardSize=%u, capacity=%u, pad=0x%02x, hash=%s)",
                     strNetworkID, nSourceShards, nParityShards, nShardSize,
                     nSegmentCapacity, nPadByte, GetHashAlgorithmName(commitmentHash));
}

bool ValidateArchivingParams(const ArchivingParams& params, ArchiveState& state)
{
    if (params.nSourceShards == 0) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "source-shards-zero");
    }
    if (params.nParityShards == 0) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "parity-shards-zero");
    }
    if (params.GetTotalShards() > MAX_TOTAL_SHARDS) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "too-many-shards",
                             strprintf("%u + %u exceeds %u", params.nSourceShards,
                                       params.nParityShards, MAX_TOTAL_SHARDS));
    }
    if (params.nShardSize == 0) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "shard-size-zero");
    }
    if (params.nSegmentCapacity > MAX_SEGMENT_CAPACITY) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "capacity-too-large",
                             strprintf("capacity %u exceeds %u", params.nSegmentCapacity, MAX_SEGMENT_CAPACITY));
    }
    if (params.nSegmentCapacity > params.GetPaddedSegmentSize()) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "capacity-exceeds-shards",
                             strprintf("capacity %u > %u * %u", params.nSegmentCapacity,
                                       params.nSourceShards, params.nShardSize));
    }
    // Every source shard must carry at least one byte of history
    if (params.nSegmentCapacity <= params.GetPaddedSegmentSize() - params.nShardSize) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "padding-only-shard",
                             strprintf("capacity %u leaves a source shard without history",
                                       params.nSegmentCapacity));
    }
    return true;
}

const ArchivingParams& MainnetArchivingParams()
{
    return mainnetArchivingParams;
}

const ArchivingParams& TestnetArchivingParams()
{
    return testnetArchivingParams;
}

const ArchivingParams& RegtestArchivingParams()
{
    return regtestArchivingParams;
}

const ArchivingParams& GetArchivingParams()
{
    return *pCurrentArchivingParams;
}

void SelectArchivingParams(const std::string& network)
{
    if (network == NETWORK_MAIN) {
        pCurrentArchivingParams = &mainnetArchivingParams;
    } else if (network == NETWORK_TESTNET) {
        pCurrentArchivingParams = &testnetArchivingParams;
    } else if (network == NETWORK_REGTEST) {
        pCurrentArchivingParams = &regtestArchivingParams;
    } else {
        throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
    }
}

bool UpdateRegtestArchivingParams(const ArchivingParams& params, ArchiveState& state)
{
    if (!ValidateArchivingParams(params, state)) {
        return false;
    }
    regtestArchivingParams = params;
    regtestArchivingParams.strNetworkID = NETWORK_REGTEST;
    return true;
}

void ResetRegtestArchivingParams()
{
    regtestArchivingParams = defaultRegtestArchivingParams;
}

} // namespace archiving
