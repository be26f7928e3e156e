// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/segment_assembler.h>
#include <archiving/segment_commitment.h>

#include <util.h>

#include <iterator>
#include <stdexcept>

namespace archiving {

static const ArchivingParams& CheckedParams(const ArchivingParams& params)
{
    ArchiveState state;
    if (!ValidateArchivingParams(params, state)) {
        throw std::runtime_error(strprintf("SegmentAssembler: invalid parameters: %s", state.ToString()));
    }
    return params;
}

SegmentAssembler::SegmentAssembler(const ArchivingParams& paramsIn, int nThreadsIn)
    : params(CheckedParams(paramsIn)),
      coder(paramsIn.nSourceShards, paramsIn.nParityShards, paramsIn.nShardSize),
      nThreads(nThreadsIn)
{
}

bool SegmentAssembler::SplitIntoShards(const std::vector<unsigned char>& segmentBytes,
                                       std::vector<std::vector<unsigned char>>& shardsOut,
                                       ArchiveState& state) const
{
    if (segmentBytes.size() < params.nSegmentCapacity) {
        return state.Invalid(ArchiveError::BUFFER_UNDERFLOW, "short-segment",
                             strprintf("have %u bytes, need %u", segmentBytes.size(), params.nSegmentCapacity));
    }
    if (segmentBytes.size() > params.nSegmentCapacity) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "oversized-segment",
                             strprintf("have %u bytes, capacity %u", segmentBytes.size(), params.nSegmentCapacity));
    }

    std::vector<unsigned char> padded(segmentBytes);
    padded.resize(params.GetPaddedSegmentSize(), params.nPadByte);

    std::vector<std::vector<unsigned char>> shards(params.nSourceShards);
    for (uint32_t i = 0; i < params.nSourceShards; ++i) {
        auto first = padded.begin() + static_cast<size_t>(i) * params.nShardSize;
        shards[i].assign(first, first + params.nShardSize);
    }
    shardsOut = std::move(shards);
    return true;
}

bool SegmentAssembler::JoinShards(const std::vector<std::vector<unsigned char>>& sourceShards,
                                  std::vector<unsigned char>& segmentBytesOut,
                                  ArchiveState& state) const
{
    if (sourceShards.size() != params.nSourceShards) {
        return state.Invalid(ArchiveError::INSUFFICIENT_SHARDS, "wrong-source-shard-count",
                             strprintf("have %u, need %u", sourceShards.size(), params.nSourceShards));
    }

    std::vector<unsigned char> joined;
    joined.reserve(params.GetPaddedSegmentSize());
    for (const auto& shard : sourceShards) {
        if (shard.size() != params.nShardSize) {
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "bad-shard-size");
        }
        joined.insert(joined.end(), shard.begin(), shard.end());
    }

    // Padding is covered by the commitment; a mismatch means a bad shard
    for (size_t i = params.nSegmentCapacity; i < joined.size(); ++i) {
        if (joined[i] != params.nPadByte) {
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "bad-padding",
                                 strprintf("byte %u is 0x%02x, expected 0x%02x", i, joined[i], params.nPadByte));
        }
    }
    joined.resize(params.nSegmentCapacity);
    segmentBytesOut = std::move(joined);
    return true;
}

AssembledSegment SegmentAssembler::BuildPieces(uint64_t segmentIndex,
                                               std::vector<std::vector<unsigned char>> allShards) const
{
    SegmentMerkleTree tree(allShards, params.commitmentHash);

    AssembledSegment segment;
    segment.segmentIndex = segmentIndex;
    segment.commitment = tree.GetRoot();
    segment.pieces.resize(allShards.size());
    for (size_t i = 0; i < allShards.size(); ++i) {
        Piece& piece = segment.pieces[i];
        piece.segmentIndex = segmentIndex;
        piece.pieceIndex = static_cast<uint32_t>(i);
        piece.isParity = i >= params.nSourceShards;
        piece.proof = tree.GetProof(i);
        piece.data = std::move(allShards[i]);
    }
    return segment;
}

bool SegmentAssembler::Assemble(uint64_t segmentIndex, const std::vector<unsigned char>& segmentBytes,
                                AssembledSegment& segmentOut, ArchiveState& state) const
{
    std::vector<std::vector<unsigned char>> shards;
    if (!SplitIntoShards(segmentBytes, shards, state)) {
        return false;
    }

    std::vector<std::vector<unsigned char>> parity;
    if (!coder.Encode(shards, parity, state, nThreads)) {
        return false;
    }
    shards.insert(shards.end(), std::make_move_iterator(parity.begin()),
                  std::make_move_iterator(parity.end()));

    segmentOut = BuildPieces(segmentIndex, std::move(shards));

    LogPrint(BCLog::ARCHIVE, "SegmentAssembler: segment %u -> %u pieces, commitment %s\n",
             segmentIndex, segmentOut.pieces.size(), segmentOut.commitment.ToString());
    return true;
}

} // namespace archiving
