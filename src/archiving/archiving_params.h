// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ARCHIVING_PARAMS_H
#define SEGARC_ARCHIVING_ARCHIVING_PARAMS_H

/**
 * @file archiving_params.h
 * @brief Network-wide archiving parameters
 *
 * Every node of a network must derive byte-identical pieces from identical
 * history, so segment capacity, shard geometry, the pad byte and the
 * commitment hash are fixed per network rather than chosen per call. The
 * parameter set is selected once at startup (see SelectArchivingParams) and
 * validated before any archiving component is constructed.
 */

#include <archiving/archiving_common.h>
#include <hash.h>

#include <cstdint>
#include <string>

namespace archiving {

/** Network names accepted by SelectArchivingParams() */
extern const std::string NETWORK_MAIN;
extern const std::string NETWORK_TESTNET;
extern const std::string NETWORK_REGTEST;

/**
 * Archiving parameters of one network (mainnet/testnet/regtest)
 */
struct ArchivingParams {
    /** Network this parameter set belongs to */
    std::string strNetworkID;

    /** Number of source shards per segment (k) */
    uint32_t nSourceShards;

    /** Number of parity shards per segment (m) */
    uint32_t nParityShards;

    /** Size of every shard, source or parity (bytes) */
    uint32_t nShardSize;

    /** Source-history bytes held by one segment (bytes) */
    uint64_t nSegmentCapacity;

    /** Byte used to fill the last source shard up to nShardSize */
    unsigned char nPadByte;

    /** Digest used for piece commitments and header hashes */
    HashAlgorithm commitmentHash;

    /** Total pieces emitted per segment (k + m) */
    uint32_t GetTotalShards() const { return nSourceShards + nParityShards; }

    /** Bytes spanned by the k source shards, padding included */
    uint64_t GetPaddedSegmentSize() const {
        return static_cast<uint64_t>(nSourceShards) * nShardSize;
    }

    /** Pad bytes appended after the segment's source bytes */
    uint64_t GetPaddingSize() const {
        return GetPaddedSegmentSize() - nSegmentCapacity;
    }

    /** Length of every piece's inclusion proof */
    uint32_t GetCommitmentDepth() const;

    std::string ToString() const;
};

/**
 * Check the structural constraints a parameter set must satisfy:
 * k > 0, m > 0, k + m <= 256, shard size > 0,
 * (k - 1) * shardSize < capacity <= k * shardSize.
 */
bool ValidateArchivingParams(const ArchivingParams& params, ArchiveState& state);

/** Parameters for mainnet */
const ArchivingParams& MainnetArchivingParams();

/** Parameters for testnet */
const ArchivingParams& TestnetArchivingParams();

/**
 * Parameters for regtest
 * Note: regtest uses a tiny geometry (4 + 4 shards of 1 KiB) for fast tests
 */
const ArchivingParams& RegtestArchivingParams();

/** Parameters of the currently selected network */
const ArchivingParams& GetArchivingParams();

/**
 * Select the parameter set for a network
 * @throws std::runtime_error if the network name is unknown
 */
void SelectArchivingParams(const std::string& network);

/**
 * Replace the regtest parameter set (used by -segmentcapacity and friends).
 * Rejected, leaving regtest untouched, if the new set fails validation.
 */
bool UpdateRegtestArchivingParams(const ArchivingParams& params, ArchiveState& state);

/** Restore the built-in regtest parameter set */
void ResetRegtestArchivingParams();

} // namespace archiving

#endif // SEGARC_ARCHIVING_ARCHIVING_PARAMS_H
