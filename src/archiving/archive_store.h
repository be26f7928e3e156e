// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ARCHIVE_STORE_H
#define SEGARC_ARCHIVING_ARCHIVE_STORE_H

/**
 * @file archive_store.h
 * @brief On-disk layout of an archive directory
 *
 *   <dir>/headers.dat                  serialized header chain
 *   <dir>/pending.dat                  records not yet fully archived
 *   <dir>/segment-<n>/piece-<i>.dat    one serialized piece per file
 *
 * Files are written to a temporary name and renamed into place, so a crash
 * never leaves a half-written file under its final name.
 */

#include <archiving/archiver.h>
#include <archiving/block_record.h>
#include <archiving/piece.h>
#include <archiving/segment_header.h>
#include <util.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace archiving {

class ArchiveStore {
private:
    fs::path dir;

public:
    explicit ArchiveStore(const fs::path& dirIn) : dir(dirIn) {}

    const fs::path& GetDir() const { return dir; }

    fs::path GetHeadersPath() const;
    fs::path GetPendingPath() const;
    fs::path GetSegmentDir(uint64_t segmentIndex) const;
    fs::path GetPiecePath(uint64_t segmentIndex, uint32_t pieceIndex) const;

    /** True if the directory holds an archive (headers.dat exists) */
    bool HasHeaders() const;

    /** Create the archive directory if needed */
    bool Create() const;

    bool ReadHeaders(std::vector<SegmentHeader>& headersOut) const;
    bool WriteHeaders(const std::vector<SegmentHeader>& headers) const;

    /**
     * Read headers.dat into an empty chain. Every header must match params
     * and link to its predecessor. The last header is only authenticated
     * when expectedTipHash is given.
     */
    bool LoadChain(const ArchivingParams& params, SegmentHeaderChain& chain,
                   const std::optional<uint256>& expectedTipHash = std::nullopt) const;

    /** A missing pending.dat reads as no pending records */
    bool ReadPendingRecords(std::vector<BlockRecord>& recordsOut) const;
    bool WritePendingRecords(const std::vector<BlockRecord>& records) const;

    /** Write every piece of a segment */
    bool WriteSegment(const ArchivedSegment& segment) const;

    bool WritePiece(const Piece& piece) const;

    /**
     * Read whatever pieces of a segment are present. Files that cannot be
     * parsed are logged and skipped; their content is never trusted.
     */
    bool ReadPieces(uint64_t segmentIndex, std::vector<Piece>& piecesOut) const;

    /** Write one recovered record as <outdir>/record-<n>.dat */
    static bool WriteRecord(const fs::path& outdir, const NumberedRecord& record);
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_ARCHIVE_STORE_H
