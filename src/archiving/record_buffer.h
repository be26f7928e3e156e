// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_RECORD_BUFFER_H
#define SEGARC_ARCHIVING_RECORD_BUFFER_H

/**
 * @file record_buffer.h
 * @brief Raw record buffer feeding the segment assembler
 *
 * Accumulates framed block records as one ordered byte stream and hands out
 * exactly one segment's worth of bytes at a time. Besides the bytes it keeps
 * track of where each buffered record starts, so that every segment taken
 * can be labelled with the history range it covers, the offset of the first
 * record starting inside it and the last record it touches.
 *
 * The buffer has a single producer and is not thread-safe.
 */

#include <archiving/archiving_common.h>
#include <archiving/block_record.h>

#include <cstdint>
#include <deque>
#include <vector>

namespace archiving {

/**
 * @brief Position of one taken segment within the record stream
 */
struct SegmentBoundary {
    /** Stream offset of the segment's first byte */
    uint64_t historyStart;

    /** Stream offset one past the segment's last byte */
    uint64_t historyEnd;

    /** Leading bytes continuing an earlier record (capacity if none starts here) */
    uint32_t firstRecordOffset;

    /** Record holding the segment's last byte */
    LastArchivedRecord lastRecord;

    SegmentBoundary() : historyStart(0), historyEnd(0), firstRecordOffset(0) {}
};

class RecordBuffer {
private:
    /** A buffered record that has not been fully taken yet */
    struct PendingRecord {
        uint64_t number;
        uint64_t streamOffset;
        uint64_t framedSize;

        uint64_t End() const { return streamOffset + framedSize; }
    };

    /** Buffered bytes, starting at stream offset nHistoryTaken */
    std::vector<unsigned char> vBuffer;

    /** Records with bytes still in vBuffer, in stream order */
    std::deque<PendingRecord> pendingRecords;

    /** Bytes of the stream already handed out by TakeSegmentBytes */
    uint64_t nHistoryTaken;

    /** Number assigned to the next pushed record */
    uint64_t nNextRecordNumber;

public:
    RecordBuffer() : nHistoryTaken(0), nNextRecordNumber(0) {}

    /** Start a buffer whose stream continues an existing archive */
    RecordBuffer(uint64_t historyOffset, uint64_t nextRecordNumber)
        : nHistoryTaken(historyOffset), nNextRecordNumber(nextRecordNumber) {}

    /**
     * Append one record's framed bytes to the end of the stream.
     * Fails with INVALID_RECORD if the payload exceeds MAX_RECORD_PAYLOAD_SIZE.
     */
    bool Push(const BlockRecord& record, ArchiveState& state);

    /**
     * Re-buffer the unarchived tail of a record that an earlier run archived
     * partially. Only valid on an empty buffer; the record keeps the number
     * the buffer was constructed with.
     */
    bool PushPartial(const BlockRecord& record, uint32_t archivedBytes, ArchiveState& state);

    /** True if at least capacity bytes are buffered */
    bool HasFullSegment(uint64_t capacity) const { return vBuffer.size() >= capacity; }

    /**
     * Remove exactly capacity bytes from the front of the stream.
     * Fails with BUFFER_UNDERFLOW, leaving the buffer untouched, if fewer
     * bytes are buffered.
     */
    bool TakeSegmentBytes(uint64_t capacity, std::vector<unsigned char>& bytesOut,
                          SegmentBoundary& boundaryOut, ArchiveState& state);

    /**
     * Describe the segment TakeSegmentBytes would produce without
     * consuming anything.
     */
    bool PeekSegment(uint64_t capacity, std::vector<unsigned char>& bytesOut,
                     SegmentBoundary& boundaryOut, ArchiveState& state) const;

    /** Drop capacity bytes previously described by PeekSegment */
    bool Consume(uint64_t capacity, ArchiveState& state);

    /** Bytes buffered but not yet taken */
    uint64_t Size() const { return vBuffer.size(); }

    bool Empty() const { return vBuffer.empty(); }

    uint64_t GetHistoryTaken() const { return nHistoryTaken; }
    uint64_t GetNextRecordNumber() const { return nNextRecordNumber; }

    /** Number of records with at least one byte still buffered */
    size_t GetPendingRecordCount() const { return pendingRecords.size(); }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_RECORD_BUFFER_H
