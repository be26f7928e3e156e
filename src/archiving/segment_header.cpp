// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/segment_header.h>

#include <util.h>

namespace archiving {

// ============================================================================
// SegmentHeader
// ============================================================================

uint256 SegmentHeader::GetHash(HashAlgorithm algo) const
{
    CHashWriter ss(SER_GETHASH, 0, algo);
    ss << *this;
    return ss.GetHash();
}

bool SegmentHeader::ValidateStructure(const ArchivingParams& params) const
{
    if (version != ARCHIVE_PROTOCOL_VERSION) {
        return false;
    }
    if (historyEnd < historyStart || GetHistorySize() != params.nSegmentCapacity) {
        return false;
    }
    if (historyStart != segmentIndex * params.nSegmentCapacity) {
        return false;
    }
    if (firstRecordOffset > params.nSegmentCapacity) {
        return false;
    }
    if (segmentIndex == 0 && !prevSegmentHeaderHash.IsNull()) {
        return false;
    }
    // A record always starts at the very beginning of the stream
    if (segmentIndex == 0 && firstRecordOffset != 0) {
        return false;
    }
    return true;
}

std::string SegmentHeader::ToString() const
{
    return strprintf("SegmentHeader(index=%u, commitment=%s, prev=%s, history=[%u, %u), firstRecordOffset=%u, %s)",
                     segmentIndex, segmentCommitment.ToString().substr(0, 16),
                     prevSegmentHeaderHash.ToString().substr(0, 16),
                     historyStart, historyEnd, firstRecordOffset, lastArchivedRecord.ToString());
}

bool SegmentHeader::operator==(const SegmentHeader& other) const
{
    return version == other.version &&
           segmentIndex == other.segmentIndex &&
           segmentCommitment == other.segmentCommitment &&
           prevSegmentHeaderHash == other.prevSegmentHeaderHash &&
           historyStart == other.historyStart &&
           historyEnd == other.historyEnd &&
           firstRecordOffset == other.firstRecordOffset &&
           lastArchivedRecord == other.lastArchivedRecord;
}

// ============================================================================
// Chain verification
// ============================================================================

bool VerifyChain(const std::vector<SegmentHeader>& headers, HashAlgorithm algo, ArchiveState& state,
                 const std::optional<uint256>& expectedTipHash)
{
    if (headers.empty()) {
        if (expectedTipHash && !expectedTipHash->IsNull()) {
            return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "tip-hash-mismatch", "empty chain");
        }
        return true;
    }

    if (headers[0].segmentIndex == 0 && !headers[0].prevSegmentHeaderHash.IsNull()) {
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "bad-genesis-prev-hash");
    }

    uint256 prevHash = headers[0].GetHash(algo);
    for (size_t i = 1; i < headers.size(); ++i) {
        const SegmentHeader& prev = headers[i - 1];
        const SegmentHeader& header = headers[i];
        if (header.segmentIndex != prev.segmentIndex + 1) {
            return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "non-consecutive-index",
                                 strprintf("segment %u follows %u", header.segmentIndex, prev.segmentIndex));
        }
        if (header.prevSegmentHeaderHash != prevHash) {
            return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "prev-hash-mismatch",
                                 strprintf("segment %u", header.segmentIndex));
        }
        if (header.historyStart != prev.historyEnd) {
            return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "history-gap",
                                 strprintf("segment %u starts at %u, previous ends at %u",
                                           header.segmentIndex, header.historyStart, prev.historyEnd));
        }
        prevHash = header.GetHash(algo);
    }

    if (expectedTipHash && *expectedTipHash != prevHash) {
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "tip-hash-mismatch",
                             strprintf("segment %u", headers.back().segmentIndex));
    }
    return true;
}

// ============================================================================
// SegmentHeaderChain
// ============================================================================

SegmentHeaderChain::SegmentHeaderChain(HashAlgorithm algoIn)
    : algo(algoIn)
{
}

bool SegmentHeaderChain::CheckLinkage(const SegmentHeader& header, const SegmentHeader* pprev,
                                      const uint256& prevHash, ArchiveState& state) const
{
    const uint64_t expectedIndex = pprev ? pprev->segmentIndex + 1 : 0;
    if (header.segmentIndex != expectedIndex) {
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "non-consecutive-index",
                             strprintf("got segment %u, expected %u", header.segmentIndex, expectedIndex));
    }
    if (header.prevSegmentHeaderHash != prevHash) {
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "prev-hash-mismatch",
                             strprintf("segment %u references %s, tip is %s", header.segmentIndex,
                                       header.prevSegmentHeaderHash.ToString(), prevHash.ToString()));
    }
    const uint64_t expectedStart = pprev ? pprev->historyEnd : 0;
    if (header.historyStart != expectedStart || header.historyEnd < header.historyStart) {
        return state.Invalid(ArchiveError::MISSING_PREDECESSOR, "history-gap",
                             strprintf("segment %u covers [%u, %u), expected start %u", header.segmentIndex,
                                       header.historyStart, header.historyEnd, expectedStart));
    }
    return true;
}

bool SegmentHeaderChain::Append(const SegmentHeader& header, ArchiveState& state)
{
    LOCK(cs_chain);

    const SegmentHeader* pprev = vHeaders.empty() ? nullptr : &vHeaders.back();
    if (!CheckLinkage(header, pprev, tipHash, state)) {
        LogPrint(BCLog::ARCHIVE, "SegmentHeaderChain: rejected header %u: %s\n",
                 header.segmentIndex, state.ToString());
        return false;
    }

    vHeaders.push_back(header);
    tipHash = header.GetHash(algo);

    LogPrint(BCLog::ARCHIVE, "SegmentHeaderChain: appended %s\n", header.ToString());
    return true;
}

bool SegmentHeaderChain::Append(const uint256& segmentCommitment, uint64_t historyStart, uint64_t historyEnd,
                                uint32_t firstRecordOffset, const LastArchivedRecord& lastRecord,
                                SegmentHeader& headerOut, ArchiveState& state)
{
    LOCK(cs_chain);

    SegmentHeader header;
    header.segmentIndex = vHeaders.size();
    header.segmentCommitment = segmentCommitment;
    header.prevSegmentHeaderHash = tipHash;
    header.historyStart = historyStart;
    header.historyEnd = historyEnd;
    header.firstRecordOffset = firstRecordOffset;
    header.lastArchivedRecord = lastRecord;

    if (!Append(header, state)) {
        return false;
    }
    headerOut = header;
    return true;
}

bool SegmentHeaderChain::Extend(const std::vector<SegmentHeader>& headers, ArchiveState& state)
{
    LOCK(cs_chain);

    // Validate the whole run against the tip before touching the chain
    const SegmentHeader* pprev = vHeaders.empty() ? nullptr : &vHeaders.back();
    uint256 prevHash = tipHash;
    std::vector<uint256> hashes;
    hashes.reserve(headers.size());
    for (const SegmentHeader& header : headers) {
        if (!CheckLinkage(header, pprev, prevHash, state)) {
            LogPrintf("SegmentHeaderChain: rejected extension of %u headers at segment %u: %s\n",
                      headers.size(), header.segmentIndex, state.ToString());
            return false;
        }
        pprev = &header;
        prevHash = header.GetHash(algo);
        hashes.push_back(prevHash);
    }

    vHeaders.insert(vHeaders.end(), headers.begin(), headers.end());
    if (!hashes.empty()) {
        tipHash = hashes.back();
    }

    LogPrint(BCLog::ARCHIVE, "SegmentHeaderChain: extended by %u headers, tip %u\n",
             headers.size(), vHeaders.size());
    return true;
}

uint64_t SegmentHeaderChain::Size() const
{
    LOCK(cs_chain);
    return vHeaders.size();
}

bool SegmentHeaderChain::IsEmpty() const
{
    LOCK(cs_chain);
    return vHeaders.empty();
}

std::optional<SegmentHeader> SegmentHeaderChain::GetTip() const
{
    LOCK(cs_chain);
    if (vHeaders.empty()) {
        return std::nullopt;
    }
    return vHeaders.back();
}

uint256 SegmentHeaderChain::GetTipHash() const
{
    LOCK(cs_chain);
    return tipHash;
}

std::optional<SegmentHeader> SegmentHeaderChain::GetHeader(uint64_t segmentIndex) const
{
    LOCK(cs_chain);
    if (segmentIndex >= vHeaders.size()) {
        return std::nullopt;
    }
    return vHeaders[segmentIndex];
}

std::vector<SegmentHeader> SegmentHeaderChain::GetHeaders(uint64_t first, uint64_t count) const
{
    LOCK(cs_chain);
    std::vector<SegmentHeader> result;
    if (first >= vHeaders.size()) {
        return result;
    }
    const uint64_t last = (count > vHeaders.size() - first) ? vHeaders.size() : first + count;
    result.assign(vHeaders.begin() + first, vHeaders.begin() + last);
    return result;
}

} // namespace archiving
