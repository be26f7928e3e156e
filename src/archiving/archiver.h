// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ARCHIVER_H
#define SEGARC_ARCHIVING_ARCHIVER_H

/**
 * @file archiver.h
 * @brief Archiving pipeline: records in, committed segments out
 *
 * Block records are pushed in finalization order. Whenever a full segment's
 * worth of bytes is buffered the archiver assembles it into k + m pieces,
 * appends its header to the segment header chain and hands the segment to
 * the caller. Publishing is atomic: the header is appended only after every
 * piece and the commitment exist, and the buffered bytes are consumed only
 * after the header was accepted.
 *
 * An archiver can resume an existing chain. If the chain's tip ends in the
 * middle of a record, that record must be supplied again through
 * ResumePartialRecord() before any new record is accepted.
 */

#include <archiving/archiving_common.h>
#include <archiving/archiving_params.h>
#include <archiving/block_record.h>
#include <archiving/piece.h>
#include <archiving/record_buffer.h>
#include <archiving/segment_assembler.h>
#include <archiving/segment_header.h>
#include <sync.h>

#include <cstdint>
#include <deque>
#include <vector>

namespace archiving {

/**
 * @brief A published segment: its header and all k + m pieces
 */
struct ArchivedSegment {
    SegmentHeader header;
    std::vector<Piece> pieces;
};

class Archiver {
private:
    mutable CCriticalSection cs_archiver;

    SegmentAssembler assembler;
    SegmentHeaderChain& chain;
    RecordBuffer buffer;

    /** Records with bytes not yet archived, oldest first */
    std::deque<NumberedRecord> unarchivedRecords;

    /** Tip ends inside a record that has not been re-supplied yet */
    bool fAwaitingPartialRecord;
    LastArchivedRecord resumePoint;

    bool PublishSegment(ArchivedSegment& segmentOut, ArchiveState& state);
    void DropArchivedRecords(const LastArchivedRecord& last);

public:
    /**
     * Start archiving at the tip of chain (an empty chain starts a new
     * archive). The chain must outlive the archiver.
     * @throws std::runtime_error if params are invalid or the chain hashes
     *         headers with a different algorithm
     */
    Archiver(const ArchivingParams& params, SegmentHeaderChain& chainIn, int nThreads = 1);

    /** True until the record straddling the chain tip has been re-supplied */
    bool NeedsPartialRecord() const;

    /** Number of the record ResumePartialRecord() expects */
    uint64_t GetPartialRecordNumber() const;

    /**
     * Re-supply the record the chain tip archived partially; its unarchived
     * tail is buffered again. Fails with INVALID_RECORD if no partial record
     * is expected or the record's size does not fit the tip.
     */
    bool ResumePartialRecord(const BlockRecord& record, ArchiveState& state);

    /**
     * Push one record and publish every segment that became full.
     * Published segments are appended to segmentsOut even if a later one
     * fails. On failure of the push itself nothing is buffered.
     */
    bool AddRecord(const BlockRecord& record, std::vector<ArchivedSegment>& segmentsOut, ArchiveState& state);

    /** Bytes buffered towards the next segment */
    uint64_t GetBufferedBytes() const;

    /** Number the next pushed record will get */
    uint64_t GetNextRecordNumber() const;

    /** Records not yet fully archived, the partially archived one first */
    std::vector<BlockRecord> GetUnarchivedRecords() const;

    const ArchivingParams& GetParams() const { return assembler.GetParams(); }
    const SegmentHeaderChain& GetChain() const { return chain; }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_ARCHIVER_H
