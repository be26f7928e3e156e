// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/piece.h>
#include <archiving/segment_commitment.h>

#include <tinyformat.h>
#include <util.h>

namespace archiving {

bool Piece::Verify(const uint256& segmentCommitment, const ArchivingParams& params, ArchiveState& state) const
{
    if (pieceIndex >= params.GetTotalShards()) {
        return state.Invalid(ArchiveError::CORRUPT_SHARD, "piece-index-out-of-range",
                             strprintf("segment %u piece %u of %u", segmentIndex, pieceIndex,
                                       params.GetTotalShards()));
    }
    if (isParity != (pieceIndex >= params.nSourceShards)) {
        return state.Invalid(ArchiveError::CORRUPT_SHARD, "piece-kind-mismatch",
                             strprintf("segment %u piece %u", segmentIndex, pieceIndex));
    }
    if (data.size() != params.nShardSize) {
        return state.Invalid(ArchiveError::CORRUPT_SHARD, "bad-shard-size",
                             strprintf("segment %u piece %u has %u bytes, expected %u",
                                       segmentIndex, pieceIndex, data.size(), params.nShardSize));
    }
    if (!VerifyPiece(segmentCommitment, pieceIndex, params.GetTotalShards(), data, proof,
                     params.commitmentHash)) {
        return state.Invalid(ArchiveError::COMMITMENT_MISMATCH, "bad-inclusion-proof",
                             strprintf("segment %u piece %u", segmentIndex, pieceIndex));
    }
    return true;
}

std::string Piece::ToString() const
{
    return strprintf("Piece(segment=%u, index=%u, %s, %u bytes, proof=%u)",
                     segmentIndex, pieceIndex, isParity ? "parity" : "source",
                     data.size(), proof.size());
}

bool Piece::operator==(const Piece& other) const
{
    return segmentIndex == other.segmentIndex &&
           pieceIndex == other.pieceIndex &&
           isParity == other.isParity &&
           data == other.data &&
           proof == other.proof;
}

} // namespace archiving
