// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archive_store.h>

#include <streams.h>

#include <algorithm>
#include <iterator>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

namespace archiving {

static const char* const HEADERS_FILENAME = "headers.dat";
static const char* const PENDING_FILENAME = "pending.dat";

/** Write bytes to path via a temporary file and an atomic rename */
static bool WriteFileAtomic(const fs::path& path, const CDataStream& ss)
{
    fs::path tmp = path;
    tmp += ".tmp";
    {
        fs::ofstream file(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return error("%s: cannot open %s for writing", __func__, tmp.string());
        }
        file.write(ss.data(), ss.size());
        file.close();
        if (file.fail()) {
            return error("%s: failed to write %s", __func__, tmp.string());
        }
    }
    boost::system::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return error("%s: cannot rename %s to %s: %s", __func__, tmp.string(), path.string(), ec.message());
    }
    return true;
}

static bool ReadFileBytes(const fs::path& path, std::vector<unsigned char>& bytesOut)
{
    fs::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return error("%s: cannot open %s", __func__, path.string());
    }
    bytesOut.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return error("%s: failed to read %s", __func__, path.string());
    }
    return true;
}

/** Deserialize a whole file into obj; trailing bytes are an error */
template <typename T>
static bool ReadSerializedFile(const fs::path& path, T& obj)
{
    std::vector<unsigned char> bytes;
    if (!ReadFileBytes(path, bytes)) {
        return false;
    }
    CDataStream ss(bytes, SER_DISK, 0);
    try {
        ss >> obj;
    } catch (const std::exception& e) {
        return error("%s: cannot deserialize %s: %s", __func__, path.string(), e.what());
    }
    if (!ss.empty()) {
        return error("%s: %u trailing bytes in %s", __func__, ss.size(), path.string());
    }
    return true;
}

template <typename T>
static bool WriteSerializedFile(const fs::path& path, const T& obj)
{
    CDataStream ss(SER_DISK, 0);
    ss << obj;
    return WriteFileAtomic(path, ss);
}

fs::path ArchiveStore::GetHeadersPath() const
{
    return dir / HEADERS_FILENAME;
}

fs::path ArchiveStore::GetPendingPath() const
{
    return dir / PENDING_FILENAME;
}

fs::path ArchiveStore::GetSegmentDir(uint64_t segmentIndex) const
{
    return dir / strprintf("segment-%u", segmentIndex);
}

fs::path ArchiveStore::GetPiecePath(uint64_t segmentIndex, uint32_t pieceIndex) const
{
    return GetSegmentDir(segmentIndex) / strprintf("piece-%u.dat", pieceIndex);
}

bool ArchiveStore::HasHeaders() const
{
    return fs::exists(GetHeadersPath());
}

bool ArchiveStore::Create() const
{
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return error("%s: cannot create %s: %s", __func__, dir.string(), ec.message());
    }
    return true;
}

bool ArchiveStore::ReadHeaders(std::vector<SegmentHeader>& headersOut) const
{
    return ReadSerializedFile(GetHeadersPath(), headersOut);
}

bool ArchiveStore::WriteHeaders(const std::vector<SegmentHeader>& headers) const
{
    return WriteSerializedFile(GetHeadersPath(), headers);
}

bool ArchiveStore::LoadChain(const ArchivingParams& params, SegmentHeaderChain& chain,
                             const std::optional<uint256>& expectedTipHash) const
{
    std::vector<SegmentHeader> headers;
    if (!ReadHeaders(headers)) {
        return false;
    }
    for (const SegmentHeader& header : headers) {
        if (!header.ValidateStructure(params)) {
            return error("%s: header does not match %s parameters: %s", __func__,
                         params.strNetworkID, header.ToString());
        }
    }
    ArchiveState state;
    if (expectedTipHash && !VerifyChain(headers, chain.GetHashAlgorithm(), state, expectedTipHash)) {
        return error("%s: %s does not end at tip %s: %s", __func__, GetHeadersPath().string(),
                     expectedTipHash->GetHex(), state.ToString());
    }
    if (!chain.Extend(headers, state)) {
        return error("%s: broken header chain in %s: %s", __func__,
                     GetHeadersPath().string(), state.ToString());
    }
    return true;
}

bool ArchiveStore::ReadPendingRecords(std::vector<BlockRecord>& recordsOut) const
{
    if (!fs::exists(GetPendingPath())) {
        recordsOut.clear();
        return true;
    }
    return ReadSerializedFile(GetPendingPath(), recordsOut);
}

bool ArchiveStore::WritePendingRecords(const std::vector<BlockRecord>& records) const
{
    return WriteSerializedFile(GetPendingPath(), records);
}

bool ArchiveStore::WritePiece(const Piece& piece) const
{
    return WriteSerializedFile(GetPiecePath(piece.segmentIndex, piece.pieceIndex), piece);
}

bool ArchiveStore::WriteSegment(const ArchivedSegment& segment) const
{
    boost::system::error_code ec;
    fs::create_directories(GetSegmentDir(segment.header.segmentIndex), ec);
    if (ec) {
        return error("%s: cannot create segment directory: %s", __func__, ec.message());
    }
    for (const Piece& piece : segment.pieces) {
        if (!WritePiece(piece)) {
            return false;
        }
    }
    LogPrint(BCLog::ARCHIVE, "ArchiveStore: wrote %u pieces of segment %u\n",
             segment.pieces.size(), segment.header.segmentIndex);
    return true;
}

bool ArchiveStore::ReadPieces(uint64_t segmentIndex, std::vector<Piece>& piecesOut) const
{
    piecesOut.clear();
    const fs::path segmentDir = GetSegmentDir(segmentIndex);
    if (!fs::is_directory(segmentDir)) {
        LogPrint(BCLog::RECONSTRUCT, "ArchiveStore: no pieces stored for segment %u\n", segmentIndex);
        return true;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(segmentDir), end; it != end; ++it) {
        const fs::path& path = it->path();
        if (fs::is_regular_file(path) && path.extension() == ".dat") {
            files.push_back(path);
        }
    }
    std::sort(files.begin(), files.end());

    for (const fs::path& path : files) {
        Piece piece;
        if (!ReadSerializedFile(path, piece)) {
            LogPrintf("ArchiveStore: skipping unreadable piece file %s\n", path.string());
            continue;
        }
        piecesOut.push_back(std::move(piece));
    }
    return true;
}

bool ArchiveStore::WriteRecord(const fs::path& outdir, const NumberedRecord& record)
{
    CDataStream ss(SER_DISK, 0);
    ss.write(reinterpret_cast<const char*>(record.record.payload.data()), record.record.payload.size());
    return WriteFileAtomic(outdir / strprintf("record-%u.dat", record.number), ss);
}

} // namespace archiving
