// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_PIECE_H
#define SEGARC_ARCHIVING_PIECE_H

/**
 * @file piece.h
 * @brief Piece - the unit handed to the distribution layer
 *
 * A piece is one shard of a segment together with its position and its
 * inclusion proof against the segment commitment, so that a holder can
 * check it knowing nothing but the segment header.
 */

#include <archiving/archiving_common.h>
#include <archiving/archiving_params.h>
#include <serialize.h>
#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace archiving {

struct Piece {
    /** Segment this piece belongs to */
    uint64_t segmentIndex;

    /** Position among the segment's k + m shards */
    uint32_t pieceIndex;

    /** True for parity shards (pieceIndex >= k) */
    bool isParity;

    /** Shard bytes, exactly nShardSize long */
    std::vector<unsigned char> data;

    /** Sibling hashes from the leaf up to the segment commitment */
    std::vector<uint256> proof;

    Piece() : segmentIndex(0), pieceIndex(0), isParity(false) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(segmentIndex);
        READWRITE(pieceIndex);
        READWRITE(isParity);
        READWRITE(data);
        READWRITE(proof);
    }

    /**
     * Check the piece against its segment commitment.
     * CORRUPT_SHARD: index out of range, kind flag inconsistent with the
     * index, or wrong data length. COMMITMENT_MISMATCH: proof fails.
     */
    bool Verify(const uint256& segmentCommitment, const ArchivingParams& params, ArchiveState& state) const;

    std::string ToString() const;

    bool operator==(const Piece& other) const;
    bool operator!=(const Piece& other) const { return !(*this == other); }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_PIECE_H
