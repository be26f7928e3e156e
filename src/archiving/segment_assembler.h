// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_SEGMENT_ASSEMBLER_H
#define SEGARC_ARCHIVING_SEGMENT_ASSEMBLER_H

/**
 * @file segment_assembler.h
 * @brief Turns one segment of source bytes into k + m committed pieces
 *
 * The segment's capacity bytes are followed by k * shardSize - capacity
 * copies of the pad byte and cut into k source shards. The erasure coder
 * adds m parity shards, the commitment builder binds all k + m shards, and
 * each shard is packaged as a piece carrying its inclusion proof. The
 * output depends only on the input bytes and the network parameters.
 */

#include <archiving/archiving_common.h>
#include <archiving/archiving_params.h>
#include <archiving/erasure_coding.h>
#include <archiving/piece.h>
#include <uint256.h>

#include <cstdint>
#include <vector>

namespace archiving {

/**
 * @brief Pieces and commitment of one segment
 */
struct AssembledSegment {
    uint64_t segmentIndex;
    uint256 commitment;
    std::vector<Piece> pieces;

    AssembledSegment() : segmentIndex(0) {}
};

class SegmentAssembler {
private:
    ArchivingParams params;
    ErasureCoder coder;
    int nThreads;

public:
    /**
     * @throws std::runtime_error if params fail ValidateArchivingParams()
     */
    explicit SegmentAssembler(const ArchivingParams& paramsIn, int nThreadsIn = 1);

    const ArchivingParams& GetParams() const { return params; }
    const ErasureCoder& GetCoder() const { return coder; }
    int GetThreads() const { return nThreads; }

    /** Pad capacity bytes and cut them into k source shards */
    bool SplitIntoShards(const std::vector<unsigned char>& segmentBytes,
                         std::vector<std::vector<unsigned char>>& shardsOut,
                         ArchiveState& state) const;

    /**
     * Inverse of SplitIntoShards: concatenate the source shards and strip
     * the padding. Fails with CORRUPT_SHARD if the pad bytes are wrong.
     */
    bool JoinShards(const std::vector<std::vector<unsigned char>>& sourceShards,
                    std::vector<unsigned char>& segmentBytesOut,
                    ArchiveState& state) const;

    /** Package k + m shards as pieces with proofs against their commitment */
    AssembledSegment BuildPieces(uint64_t segmentIndex,
                                 std::vector<std::vector<unsigned char>> allShards) const;

    /** Split, encode and commit one segment */
    bool Assemble(uint64_t segmentIndex, const std::vector<unsigned char>& segmentBytes,
                  AssembledSegment& segmentOut, ArchiveState& state) const;
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_SEGMENT_ASSEMBLER_H
