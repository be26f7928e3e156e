// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_RECONSTRUCTOR_H
#define SEGARC_ARCHIVING_RECONSTRUCTOR_H

/**
 * @file reconstructor.h
 * @brief Recovery of segments and block records from archived pieces
 *
 * The reconstructor runs the archiving pipeline backwards: it checks every
 * supplied piece against the segment header's commitment, decodes the
 * source shards from any k of them, strips the padding and splits the
 * bytes back into block records using their length prefixes.
 *
 * Verification is strict: a single piece that fails its checks fails the
 * whole call. Nothing unauthenticated is ever returned.
 */

#include <archiving/archiving_common.h>
#include <archiving/archiving_params.h>
#include <archiving/block_record.h>
#include <archiving/piece.h>
#include <archiving/segment_assembler.h>
#include <archiving/segment_header.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archiving {

/**
 * @brief Outcome of feeding one segment to the reconstructor
 */
struct ReconstructionResult {
    bool success;
    ArchiveError error;
    std::string errorMessage;

    /** Complete records recovered, in stream order */
    std::vector<NumberedRecord> records;

    ReconstructionResult() : success(false), error(ArchiveError::NONE) {}

    static ReconstructionResult Success(std::vector<NumberedRecord> recordsIn);
    static ReconstructionResult Failure(const ArchiveState& state);
};

class Reconstructor {
private:
    /** A record whose head was seen but whose tail lies in later segments */
    struct PartialRecord {
        uint64_t number;
        std::vector<unsigned char> bytes;
    };

    SegmentAssembler assembler;

    /** Index of the last segment fed to AddSegment() */
    std::optional<uint64_t> lastSegmentIndex;

    /** Head of a record continuing into the next segment */
    std::optional<PartialRecord> partial;

    bool VerifyPieces(const SegmentHeader& header, const std::vector<Piece>& pieces,
                      ArchiveState& state) const;

    bool DecodeSourceShards(const SegmentHeader& header, const std::vector<Piece>& pieces,
                            std::vector<std::vector<unsigned char>>& sourceShardsOut,
                            ArchiveState& state) const;

    /**
     * Split the bytes of one segment at record boundaries.
     * Records that start and end inside the segment go to completeOut; a
     * record starting in the segment but continuing past it goes to
     * trailingOut. Numbers are derived from header.lastArchivedRecord.
     */
    bool SplitRecords(const SegmentHeader& header, const std::vector<unsigned char>& segmentBytes,
                      std::vector<NumberedRecord>& completeOut,
                      std::optional<PartialRecord>& trailingOut,
                      ArchiveState& state) const;

    static bool FinishRecord(const PartialRecord& partial, NumberedRecord& recordOut, ArchiveState& state);

public:
    /**
     * @throws std::runtime_error if params fail ValidateArchivingParams()
     */
    explicit Reconstructor(const ArchivingParams& params, int nThreads = 1);

    /**
     * Recover the source bytes of one segment from any k valid pieces.
     * CORRUPT_SHARD / COMMITMENT_MISMATCH: a supplied piece fails
     * verification. INSUFFICIENT_SHARDS: fewer than k distinct pieces.
     */
    bool ReconstructSegmentBytes(const SegmentHeader& header, const std::vector<Piece>& pieces,
                                 std::vector<unsigned char>& segmentBytesOut, ArchiveState& state) const;

    /**
     * Recover the records that start and end inside one segment.
     * Stateless; records straddling the segment's edges are not returned.
     */
    ReconstructionResult ReconstructSegment(const SegmentHeader& header, const std::vector<Piece>& pieces) const;

    /**
     * Regenerate all k + m pieces of a segment, proofs included, from any
     * k valid pieces. Fails with COMMITMENT_MISMATCH if the regenerated
     * commitment differs from the header's.
     */
    bool ReconstructPieces(const SegmentHeader& header, const std::vector<Piece>& pieces,
                           std::vector<Piece>& piecesOut, ArchiveState& state) const;

    /**
     * Feed the next segment of the archive and collect every record it
     * completes, including records begun in earlier segments. A segment
     * that does not directly follow the previous one discards any pending
     * partial record. On failure the reconstructor's state is unchanged.
     */
    ReconstructionResult AddSegment(const SegmentHeader& header, const std::vector<Piece>& pieces);

    /** True if a record begun in the last segment awaits its tail */
    bool HasPartialRecord() const { return partial.has_value(); }

    /** Forget the pending partial record and segment position */
    void Reset();

    const ArchivingParams& GetParams() const { return assembler.GetParams(); }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_RECONSTRUCTOR_H
