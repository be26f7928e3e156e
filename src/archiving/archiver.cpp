// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archiver.h>

#include <util.h>

#include <stdexcept>

namespace archiving {

/** Buffer positioned right after the chain tip */
static RecordBuffer BufferAtTip(const SegmentHeaderChain& chain)
{
    std::optional<SegmentHeader> tip = chain.GetTip();
    if (!tip) {
        return RecordBuffer();
    }
    const LastArchivedRecord& last = tip->lastArchivedRecord;
    return RecordBuffer(tip->historyEnd, last.IsComplete() ? last.number + 1 : last.number);
}

Archiver::Archiver(const ArchivingParams& params, SegmentHeaderChain& chainIn, int nThreads)
    : assembler(params, nThreads),
      chain(chainIn),
      buffer(BufferAtTip(chainIn)),
      fAwaitingPartialRecord(false)
{
    if (chain.GetHashAlgorithm() != params.commitmentHash) {
        throw std::runtime_error(strprintf("Archiver: chain uses %s, parameters use %s",
                                           GetHashAlgorithmName(chain.GetHashAlgorithm()),
                                           GetHashAlgorithmName(params.commitmentHash)));
    }

    std::optional<SegmentHeader> tip = chain.GetTip();
    if (tip) {
        resumePoint = tip->lastArchivedRecord;
        fAwaitingPartialRecord = !resumePoint.IsComplete();
        LogPrintf("Archiver: resuming after segment %u at history offset %u (%s)\n",
                  tip->segmentIndex, tip->historyEnd, resumePoint.ToString());
    }
}

bool Archiver::NeedsPartialRecord() const
{
    LOCK(cs_archiver);
    return fAwaitingPartialRecord;
}

uint64_t Archiver::GetPartialRecordNumber() const
{
    LOCK(cs_archiver);
    return resumePoint.number;
}

bool Archiver::ResumePartialRecord(const BlockRecord& record, ArchiveState& state)
{
    LOCK(cs_archiver);

    if (!fAwaitingPartialRecord) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "no-partial-record-expected");
    }
    if (!buffer.PushPartial(record, resumePoint.archivedBytes, state)) {
        return false;
    }
    unarchivedRecords.emplace_back(resumePoint.number, record);
    fAwaitingPartialRecord = false;
    return true;
}

void Archiver::DropArchivedRecords(const LastArchivedRecord& last)
{
    while (!unarchivedRecords.empty()) {
        const uint64_t number = unarchivedRecords.front().number;
        if (number < last.number || (number == last.number && last.IsComplete())) {
            unarchivedRecords.pop_front();
        } else {
            break;
        }
    }
}

bool Archiver::PublishSegment(ArchivedSegment& segmentOut, ArchiveState& state)
{
    const ArchivingParams& params = GetParams();

    std::vector<unsigned char> segmentBytes;
    SegmentBoundary boundary;
    if (!buffer.PeekSegment(params.nSegmentCapacity, segmentBytes, boundary, state)) {
        return false;
    }

    AssembledSegment assembled;
    if (!assembler.Assemble(chain.Size(), segmentBytes, assembled, state)) {
        return false;
    }

    // Pieces and commitment exist; only now may the header be published
    SegmentHeader header;
    if (!chain.Append(assembled.commitment, boundary.historyStart, boundary.historyEnd,
                      boundary.firstRecordOffset, boundary.lastRecord, header, state)) {
        return false;
    }
    if (header.segmentIndex != assembled.segmentIndex) {
        // Chain tip moved between assembly and append; unreachable while
        // this archiver is the chain's only producer
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "segment-index-race");
    }

    if (!buffer.Consume(params.nSegmentCapacity, state)) {
        return false;
    }
    DropArchivedRecords(header.lastArchivedRecord);

    segmentOut.header = header;
    segmentOut.pieces = std::move(assembled.pieces);

    LogPrint(BCLog::ARCHIVE, "Archiver: published %s\n", header.ToString());
    return true;
}

bool Archiver::AddRecord(const BlockRecord& record, std::vector<ArchivedSegment>& segmentsOut,
                         ArchiveState& state)
{
    LOCK(cs_archiver);

    if (fAwaitingPartialRecord) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "awaiting-partial-record",
                             strprintf("record %u must be re-supplied first", resumePoint.number));
    }

    const uint64_t number = buffer.GetNextRecordNumber();
    if (!buffer.Push(record, state)) {
        return false;
    }
    unarchivedRecords.emplace_back(number, record);

    const uint64_t capacity = GetParams().nSegmentCapacity;
    while (buffer.HasFullSegment(capacity)) {
        ArchivedSegment segment;
        if (!PublishSegment(segment, state)) {
            LogPrintf("Archiver: failed to publish segment %u: %s\n", chain.Size(), state.ToString());
            return false;
        }
        segmentsOut.push_back(std::move(segment));
    }
    return true;
}

uint64_t Archiver::GetBufferedBytes() const
{
    LOCK(cs_archiver);
    return buffer.Size();
}

uint64_t Archiver::GetNextRecordNumber() const
{
    LOCK(cs_archiver);
    return buffer.GetNextRecordNumber();
}

std::vector<BlockRecord> Archiver::GetUnarchivedRecords() const
{
    LOCK(cs_archiver);
    std::vector<BlockRecord> records;
    records.reserve(unarchivedRecords.size());
    for (const NumberedRecord& entry : unarchivedRecords) {
        records.push_back(entry.record);
    }
    return records;
}

} // namespace archiving
