// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_SEGMENT_HEADER_H
#define SEGARC_ARCHIVING_SEGMENT_HEADER_H

/**
 * @file segment_header.h
 * @brief Segment headers and the append-only segment header chain
 *
 * Every archived segment is described by a header binding its piece
 * commitment, the range of history it covers and the hash of the previous
 * header. Header i links to header i-1 by hash; segment 0 links to the
 * all-zero hash. The chain never forks: each index has exactly one header.
 */

#include <archiving/archiving_common.h>
#include <archiving/archiving_params.h>
#include <archiving/block_record.h>
#include <hash.h>
#include <serialize.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archiving {

/**
 * @brief Metadata of one archived segment
 */
struct SegmentHeader {
    /** Archive protocol version */
    uint32_t version;

    /** Position of the segment in the archive, starting at 0 */
    uint64_t segmentIndex;

    /** Merkle root over the segment's k + m pieces */
    uint256 segmentCommitment;

    /** Hash of the previous header (null for segment 0) */
    uint256 prevSegmentHeaderHash;

    /** First byte of the record stream covered by this segment */
    uint64_t historyStart;

    /** One past the last byte covered by this segment */
    uint64_t historyEnd;

    /** Leading bytes that continue an earlier record (capacity if none starts here) */
    uint32_t firstRecordOffset;

    /** Record holding the segment's last byte */
    LastArchivedRecord lastArchivedRecord;

    SegmentHeader()
        : version(ARCHIVE_PROTOCOL_VERSION), segmentIndex(0),
          historyStart(0), historyEnd(0), firstRecordOffset(0) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(version);
        READWRITE(segmentIndex);
        READWRITE(segmentCommitment);
        READWRITE(prevSegmentHeaderHash);
        READWRITE(historyStart);
        READWRITE(historyEnd);
        READWRITE(firstRecordOffset);
        READWRITE(lastArchivedRecord);
    }

    /** Hash of the serialized header under the given algorithm */
    uint256 GetHash(HashAlgorithm algo) const;

    /** Bytes of history covered */
    uint64_t GetHistorySize() const {
        return historyEnd >= historyStart ? historyEnd - historyStart : 0;
    }

    /** Check the header is consistent with the network's segment geometry */
    bool ValidateStructure(const ArchivingParams& params) const;

    std::string ToString() const;

    bool operator==(const SegmentHeader& other) const;
    bool operator!=(const SegmentHeader& other) const { return !(*this == other); }
};

/**
 * Check that headers form a contiguous, correctly linked run.
 *
 * Consecutive headers must have consecutive indices, contiguous history
 * ranges and prev hashes equal to the hash of their predecessor; a run
 * starting at segment 0 must link to the null hash. The last header of a
 * run is only bound if expectedTipHash is supplied. Fails with
 * MISSING_PREDECESSOR on the first break.
 */
bool VerifyChain(const std::vector<SegmentHeader>& headers, HashAlgorithm algo, ArchiveState& state,
                 const std::optional<uint256>& expectedTipHash = std::nullopt);

/**
 * @brief Append-only chain of segment headers
 *
 * The tip is the only shared mutable state of the archiving pipeline;
 * appends are serialized by cs_chain so concurrent segment producers
 * publish headers in strictly increasing index order.
 */
class SegmentHeaderChain {
private:
    mutable CCriticalSection cs_chain;

    HashAlgorithm algo;
    std::vector<SegmentHeader> vHeaders;
    uint256 tipHash;

    bool CheckLinkage(const SegmentHeader& header, const SegmentHeader* pprev,
                      const uint256& prevHash, ArchiveState& state) const;

public:
    explicit SegmentHeaderChain(HashAlgorithm algoIn = HashAlgorithm::SHA256D);

    /**
     * Append one header. Fails with MISSING_PREDECESSOR unless the header's
     * index is tip + 1 (0 on an empty chain) and its prev hash is the tip's
     * hash (null on an empty chain).
     */
    bool Append(const SegmentHeader& header, ArchiveState& state);

    /**
     * Build the next header from its commitment and history position, and
     * append it. The filled-in header is returned through headerOut.
     */
    bool Append(const uint256& segmentCommitment, uint64_t historyStart, uint64_t historyEnd,
                uint32_t firstRecordOffset, const LastArchivedRecord& lastRecord,
                SegmentHeader& headerOut, ArchiveState& state);

    /** Append a run of headers, all or nothing */
    bool Extend(const std::vector<SegmentHeader>& headers, ArchiveState& state);

    /** Number of headers; also the index of the next segment */
    uint64_t Size() const;
    bool IsEmpty() const;

    std::optional<SegmentHeader> GetTip() const;

    /** Hash of the tip, or null on an empty chain */
    uint256 GetTipHash() const;

    std::optional<SegmentHeader> GetHeader(uint64_t segmentIndex) const;

    /** Copy of headers [first, first + count), clamped to the chain */
    std::vector<SegmentHeader> GetHeaders(uint64_t first = 0, uint64_t count = UINT64_MAX) const;

    HashAlgorithm GetHashAlgorithm() const { return algo; }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_SEGMENT_HEADER_H
