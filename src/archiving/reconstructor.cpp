// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/reconstructor.h>

#include <util.h>

#include <iterator>
#include <utility>

namespace archiving {

/** Decode the 4-byte little-endian length prefix at p */
static uint32_t ReadLengthPrefix(const unsigned char* p)
{
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

ReconstructionResult ReconstructionResult::Success(std::vector<NumberedRecord> recordsIn)
{
    ReconstructionResult result;
    result.success = true;
    result.records = std::move(recordsIn);
    return result;
}

ReconstructionResult ReconstructionResult::Failure(const ArchiveState& state)
{
    ReconstructionResult result;
    result.success = false;
    result.error = state.GetError();
    result.errorMessage = state.ToString();
    return result;
}

Reconstructor::Reconstructor(const ArchivingParams& params, int nThreads)
    : assembler(params, nThreads)
{
}

void Reconstructor::Reset()
{
    lastSegmentIndex.reset();
    partial.reset();
}

bool Reconstructor::VerifyPieces(const SegmentHeader& header, const std::vector<Piece>& pieces,
                                 ArchiveState& state) const
{
    const ArchivingParams& params = GetParams();
    if (!header.ValidateStructure(params)) {
        return state.Invalid(ArchiveError::INVALID_PARAMS, "bad-header-structure", header.ToString());
    }
    for (const Piece& piece : pieces) {
        if (piece.segmentIndex != header.segmentIndex) {
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "piece-wrong-segment",
                                 strprintf("piece %u of segment %u supplied for segment %u",
                                           piece.pieceIndex, piece.segmentIndex, header.segmentIndex));
        }
        if (!piece.Verify(header.segmentCommitment, params, state)) {
            LogPrint(BCLog::RECONSTRUCT, "Reconstructor: rejected %s: %s\n", piece.ToString(), state.ToString());
            return false;
        }
    }
    return true;
}

bool Reconstructor::DecodeSourceShards(const SegmentHeader& header, const std::vector<Piece>& pieces,
                                       std::vector<std::vector<unsigned char>>& sourceShardsOut,
                                       ArchiveState& state) const
{
    if (!VerifyPieces(header, pieces, state)) {
        return false;
    }

    std::vector<IndexedShard> shards;
    shards.reserve(pieces.size());
    for (const Piece& piece : pieces) {
        shards.emplace_back(piece.pieceIndex, piece.data);
    }
    if (!assembler.GetCoder().Decode(shards, sourceShardsOut, state)) {
        LogPrint(BCLog::RECONSTRUCT, "Reconstructor: segment %u: %s\n", header.segmentIndex, state.ToString());
        return false;
    }
    return true;
}

bool Reconstructor::ReconstructSegmentBytes(const SegmentHeader& header, const std::vector<Piece>& pieces,
                                            std::vector<unsigned char>& segmentBytesOut,
                                            ArchiveState& state) const
{
    std::vector<std::vector<unsigned char>> sourceShards;
    if (!DecodeSourceShards(header, pieces, sourceShards, state)) {
        return false;
    }
    if (!assembler.JoinShards(sourceShards, segmentBytesOut, state)) {
        return false;
    }

    LogPrint(BCLog::RECONSTRUCT, "Reconstructor: recovered segment %u from %u pieces\n",
             header.segmentIndex, pieces.size());
    return true;
}

bool Reconstructor::ReconstructPieces(const SegmentHeader& header, const std::vector<Piece>& pieces,
                                      std::vector<Piece>& piecesOut, ArchiveState& state) const
{
    std::vector<std::vector<unsigned char>> sourceShards;
    if (!DecodeSourceShards(header, pieces, sourceShards, state)) {
        return false;
    }

    std::vector<unsigned char> segmentBytes;
    if (!assembler.JoinShards(sourceShards, segmentBytes, state)) {
        return false;
    }

    std::vector<std::vector<unsigned char>> parity;
    if (!assembler.GetCoder().Encode(sourceShards, parity, state, assembler.GetThreads())) {
        return false;
    }
    sourceShards.insert(sourceShards.end(), std::make_move_iterator(parity.begin()),
                        std::make_move_iterator(parity.end()));

    AssembledSegment segment = assembler.BuildPieces(header.segmentIndex, std::move(sourceShards));
    if (segment.commitment != header.segmentCommitment) {
        return state.Invalid(ArchiveError::COMMITMENT_MISMATCH, "regenerated-commitment-mismatch",
                             strprintf("segment %u", header.segmentIndex));
    }

    LogPrint(BCLog::RECONSTRUCT, "Reconstructor: regenerated %u pieces of segment %u\n",
             segment.pieces.size(), header.segmentIndex);
    piecesOut = std::move(segment.pieces);
    return true;
}

bool Reconstructor::FinishRecord(const PartialRecord& partialIn, NumberedRecord& recordOut, ArchiveState& state)
{
    const std::vector<unsigned char>& bytes = partialIn.bytes;
    if (bytes.size() < RECORD_LENGTH_PREFIX_SIZE) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "truncated-length-prefix",
                             strprintf("record %u", partialIn.number));
    }
    const uint32_t nLength = ReadLengthPrefix(bytes.data());
    if (bytes.size() != RECORD_LENGTH_PREFIX_SIZE + static_cast<uint64_t>(nLength)) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "record-length-mismatch",
                             strprintf("record %u: prefix says %u bytes, have %u", partialIn.number,
                                       nLength, bytes.size() - RECORD_LENGTH_PREFIX_SIZE));
    }
    recordOut.number = partialIn.number;
    recordOut.record.payload.assign(bytes.begin() + RECORD_LENGTH_PREFIX_SIZE, bytes.end());
    return true;
}

bool Reconstructor::SplitRecords(const SegmentHeader& header, const std::vector<unsigned char>& segmentBytes,
                                 std::vector<NumberedRecord>& completeOut,
                                 std::optional<PartialRecord>& trailingOut,
                                 ArchiveState& state) const
{
    const uint64_t capacity = GetParams().nSegmentCapacity;
    if (segmentBytes.size() != capacity || header.firstRecordOffset > capacity) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "bad-segment-layout");
    }

    struct RecordStart {
        uint64_t offset;
        uint64_t framedSize;
        bool fComplete;
    };
    std::vector<RecordStart> starts;

    uint64_t pos = header.firstRecordOffset;
    while (pos < capacity) {
        if (capacity - pos < RECORD_LENGTH_PREFIX_SIZE) {
            // Length prefix itself straddles the boundary
            starts.push_back({pos, 0, false});
            break;
        }
        const uint32_t nLength = ReadLengthPrefix(&segmentBytes[pos]);
        if (nLength > MAX_RECORD_PAYLOAD_SIZE) {
            return state.Invalid(ArchiveError::INVALID_RECORD, "record-too-large",
                                 strprintf("segment %u offset %u: %u bytes", header.segmentIndex, pos, nLength));
        }
        const uint64_t framedSize = RECORD_LENGTH_PREFIX_SIZE + static_cast<uint64_t>(nLength);
        if (pos + framedSize <= capacity) {
            starts.push_back({pos, framedSize, true});
            pos += framedSize;
        } else {
            starts.push_back({pos, framedSize, false});
            break;
        }
    }

    completeOut.clear();
    trailingOut.reset();
    if (starts.empty()) {
        return true;
    }

    const LastArchivedRecord& last = header.lastArchivedRecord;
    const RecordStart& lastStart = starts.back();
    const uint64_t expectedArchived = lastStart.fComplete ? 0 : capacity - lastStart.offset;
    if (last.archivedBytes != expectedArchived) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "record-boundary-mismatch",
                             strprintf("segment %u: header says %u bytes archived, layout says %u",
                                       header.segmentIndex, last.archivedBytes, expectedArchived));
    }
    if (last.number + 1 < starts.size()) {
        return state.Invalid(ArchiveError::INVALID_RECORD, "record-number-underflow",
                             strprintf("segment %u", header.segmentIndex));
    }

    const uint64_t firstNumber = last.number + 1 - starts.size();
    for (size_t i = 0; i < starts.size(); ++i) {
        const RecordStart& start = starts[i];
        auto first = segmentBytes.begin() + start.offset;
        if (start.fComplete) {
            NumberedRecord record;
            record.number = firstNumber + i;
            record.record.payload.assign(first + RECORD_LENGTH_PREFIX_SIZE, first + start.framedSize);
            completeOut.push_back(std::move(record));
        } else {
            PartialRecord trailing;
            trailing.number = firstNumber + i;
            trailing.bytes.assign(first, segmentBytes.end());
            trailingOut = std::move(trailing);
        }
    }
    return true;
}

ReconstructionResult Reconstructor::ReconstructSegment(const SegmentHeader& header,
                                                       const std::vector<Piece>& pieces) const
{
    ArchiveState state;
    std::vector<unsigned char> segmentBytes;
    if (!ReconstructSegmentBytes(header, pieces, segmentBytes, state)) {
        return ReconstructionResult::Failure(state);
    }

    std::vector<NumberedRecord> records;
    std::optional<PartialRecord> trailing;
    if (!SplitRecords(header, segmentBytes, records, trailing, state)) {
        return ReconstructionResult::Failure(state);
    }
    return ReconstructionResult::Success(std::move(records));
}

ReconstructionResult Reconstructor::AddSegment(const SegmentHeader& header, const std::vector<Piece>& pieces)
{
    ArchiveState state;
    std::vector<unsigned char> segmentBytes;
    if (!ReconstructSegmentBytes(header, pieces, segmentBytes, state)) {
        return ReconstructionResult::Failure(state);
    }

    const uint64_t capacity = GetParams().nSegmentCapacity;
    std::optional<PartialRecord> carried = partial;
    if (carried && (!lastSegmentIndex || header.segmentIndex != *lastSegmentIndex + 1)) {
        LogPrint(BCLog::RECONSTRUCT, "Reconstructor: segment %u does not follow %u, dropping partial record %u\n",
                 header.segmentIndex, lastSegmentIndex ? *lastSegmentIndex : 0, carried->number);
        carried.reset();
    }

    std::vector<NumberedRecord> records;
    const uint32_t nContinuation = header.firstRecordOffset;
    if (carried) {
        if (nContinuation == capacity && header.lastArchivedRecord.number != carried->number) {
            state.Invalid(ArchiveError::INVALID_RECORD, "continuation-number-mismatch",
                          strprintf("segment %u continues record %u, expected %u", header.segmentIndex,
                                    header.lastArchivedRecord.number, carried->number));
            return ReconstructionResult::Failure(state);
        }
        carried->bytes.insert(carried->bytes.end(), segmentBytes.begin(), segmentBytes.begin() + nContinuation);
        if (nContinuation < capacity || header.lastArchivedRecord.IsComplete()) {
            NumberedRecord record;
            if (!FinishRecord(*carried, record, state)) {
                return ReconstructionResult::Failure(state);
            }
            records.push_back(std::move(record));
            carried.reset();
        }
    } else if (nContinuation > 0) {
        LogPrint(BCLog::RECONSTRUCT, "Reconstructor: skipping %u leading bytes of segment %u (record head unavailable)\n",
                 nContinuation, header.segmentIndex);
    }

    std::vector<NumberedRecord> complete;
    std::optional<PartialRecord> trailing;
    if (!SplitRecords(header, segmentBytes, complete, trailing, state)) {
        return ReconstructionResult::Failure(state);
    }

    if (!records.empty()) {
        const uint64_t nextNumber = records.back().number + 1;
        const bool fHasStart = !complete.empty() || trailing;
        const uint64_t firstStart = !complete.empty() ? complete.front().number
                                                      : (trailing ? trailing->number : nextNumber);
        if (fHasStart && firstStart != nextNumber) {
            state.Invalid(ArchiveError::INVALID_RECORD, "record-number-gap",
                          strprintf("segment %u starts record %u after %u", header.segmentIndex,
                                    firstStart, records.back().number));
            return ReconstructionResult::Failure(state);
        }
    }

    for (NumberedRecord& record : complete) {
        records.push_back(std::move(record));
    }
    if (trailing) {
        carried = std::move(trailing);
    }

    // Commit only once the whole segment has been processed
    partial = std::move(carried);
    lastSegmentIndex = header.segmentIndex;

    LogPrint(BCLog::RECONSTRUCT, "Reconstructor: segment %u yielded %u records%s\n",
             header.segmentIndex, records.size(), partial ? " (record pending)" : "");
    return ReconstructionResult::Success(std::move(records));
}

} // namespace archiving
