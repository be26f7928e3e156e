// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/record_buffer.h>

#include <util.h>

namespace archiving {

bool RecordBuffer::Push(const BlockRecord& record, ArchiveState& state)
{
    if (record.payload.size() > MAX_RECORD_PAYLOAD_SIZE) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "record-too-large",
                             strprintf("payload %u bytes exceeds %u", record.payload.size(),
                                       MAX_RECORD_PAYLOAD_SIZE));
    }

    std::vector<unsigned char> framed = record.GetFramedBytes();

    PendingRecord pending;
    pending.number = nNextRecordNumber++;
    pending.streamOffset = nHistoryTaken + vBuffer.size();
    pending.framedSize = framed.size();
    pendingRecords.push_back(pending);

    vBuffer.insert(vBuffer.end(), framed.begin(), framed.end());

    LogPrint(BCLog::ARCHIVE, "RecordBuffer: pushed record %u (%u framed bytes), %u buffered\n",
             pending.number, pending.framedSize, vBuffer.size());
    return true;
}

bool RecordBuffer::PushPartial(const BlockRecord& record, uint32_t archivedBytes, ArchiveState& state)
{
    if (!vBuffer.empty()) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "partial-record-not-first",
                             "partial record must be re-buffered before any other record");
    }
    if (record.payload.size() > MAX_RECORD_PAYLOAD_SIZE) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "record-too-large");
    }

    std::vector<unsigned char> framed = record.GetFramedBytes();
    if (archivedBytes == 0 || archivedBytes >= framed.size()) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "bad-archived-bytes",
                             strprintf("archived %u of a %u byte record", archivedBytes, framed.size()));
    }

    PendingRecord pending;
    pending.number = nNextRecordNumber++;
    pending.streamOffset = nHistoryTaken - archivedBytes;
    pending.framedSize = framed.size();
    pendingRecords.push_back(pending);

    vBuffer.assign(framed.begin() + archivedBytes, framed.end());

    LogPrint(BCLog::ARCHIVE, "RecordBuffer: resumed record %u with %u of %u bytes left\n",
             pending.number, vBuffer.size(), framed.size());
    return true;
}

bool RecordBuffer::PeekSegment(uint64_t capacity, std::vector<unsigned char>& bytesOut,
                               SegmentBoundary& boundaryOut, ArchiveState& state) const
{
    if (capacity == 0 || !HasFullSegment(capacity)) {
        return state.Invalid(ArchiveError::BUFFER_UNDERFLOW, "buffer-underflow",
                             strprintf("have %u bytes, need %u", vBuffer.size(), capacity));
    }

    SegmentBoundary boundary;
    boundary.historyStart = nHistoryTaken;
    boundary.historyEnd = nHistoryTaken + capacity;
    boundary.firstRecordOffset = static_cast<uint32_t>(capacity);

    bool fFoundFirst = false;
    for (const PendingRecord& pending : pendingRecords) {
        if (pending.streamOffset >= boundary.historyEnd) {
            break;
        }
        if (!fFoundFirst && pending.streamOffset >= boundary.historyStart) {
            boundary.firstRecordOffset = static_cast<uint32_t>(pending.streamOffset - boundary.historyStart);
            fFoundFirst = true;
        }
        // Every buffered byte belongs to a record, so the last one seen
        // before historyEnd holds the segment's final byte
        boundary.lastRecord.number = pending.number;
        boundary.lastRecord.archivedBytes = pending.End() <= boundary.historyEnd
            ? 0 : static_cast<uint32_t>(boundary.historyEnd - pending.streamOffset);
    }

    bytesOut.assign(vBuffer.begin(), vBuffer.begin() + capacity);
    boundaryOut = boundary;
    return true;
}

bool RecordBuffer::Consume(uint64_t capacity, ArchiveState& state)
{
    if (capacity == 0 || !HasFullSegment(capacity)) {
        return state.Invalid(ArchiveError::BUFFER_UNDERFLOW, "buffer-underflow",
                             strprintf("have %u bytes, need %u", vBuffer.size(), capacity));
    }

    vBuffer.erase(vBuffer.begin(), vBuffer.begin() + capacity);
    nHistoryTaken += capacity;

    while (!pendingRecords.empty() && pendingRecords.front().End() <= nHistoryTaken) {
        pendingRecords.pop_front();
    }
    return true;
}

bool RecordBuffer::TakeSegmentBytes(uint64_t capacity, std::vector<unsigned char>& bytesOut,
                                    SegmentBoundary& boundaryOut, ArchiveState& state)
{
    if (!PeekSegment(capacity, bytesOut, boundaryOut, state)) {
        return false;
    }
    return Consume(capacity, state);
}

} // namespace archiving
