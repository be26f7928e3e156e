// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archive_store.h>
#include <archiving/archiver.h>
#include <archiving/archiving_config.h>
#include <archiving/archiving_params.h>
#include <archiving/reconstructor.h>
#include <archiving/segment_header.h>
#include <util.h>
#include <utilstrencodings.h>

#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

using namespace archiving;

static const int CONTINUE_EXECUTION = -1;

static std::string HelpMessage()
{
    std::string strUsage = "Segarc archive utility\n\n";
    strUsage += "Usage:\n";
    strUsage += "  segarc-util [options] archive <dir> <file>...   Archive each file as one block record\n";
    strUsage += "  segarc-util [options] verify <dir>              Verify the header chain and stored pieces\n";
    strUsage += "  segarc-util [options] reconstruct <dir> <outdir> Recover records from the stored pieces\n\n";

    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", SEGARC_CONF_FILENAME));
    strUsage += HelpMessageOpt("-tiphash=<hex>", "verify: require the last header to have this hash");
    strUsage += GetArchivingHelpMessage();
    return strUsage;
}

//
// This function returns either one of EXIT_ codes when it's expected to stop the process or
// CONTINUE_EXECUTION when it's expected to continue further.
//
static int AppInitUtil(int argc, char* argv[])
{
    gArgs.ParseParameters(argc, argv);

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    gArgs.ReadConfigFile(gArgs.GetArg("-conf", SEGARC_CONF_FILENAME));
    InitLogging();

    if (!InitArchivingConfig()) {
        fprintf(stderr, "Error: invalid archiving configuration, see the log for details\n");
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static bool ReadInputFile(const fs::path& path, BlockRecord& recordOut)
{
    fs::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return error("cannot open input file %s", path.string());
    }
    recordOut.payload.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return error("failed to read input file %s", path.string());
    }
    return true;
}

/** Verified pieces of one segment; failing pieces are logged and dropped */
static std::vector<Piece> LoadVerifiedPieces(const ArchiveStore& store, const SegmentHeader& header,
                                             size_t& nRejectedOut)
{
    std::vector<Piece> stored;
    std::vector<Piece> verified;
    nRejectedOut = 0;
    if (!store.ReadPieces(header.segmentIndex, stored)) {
        return verified;
    }
    for (Piece& piece : stored) {
        ArchiveState state;
        if (piece.segmentIndex != header.segmentIndex ||
            !piece.Verify(header.segmentCommitment, GetArchivingParams(), state)) {
            LogPrintf("Discarding %s: %s\n", piece.ToString(),
                      state.IsValid() ? "piece-wrong-segment" : state.ToString());
            ++nRejectedOut;
            continue;
        }
        verified.push_back(std::move(piece));
    }
    return verified;
}

static bool PersistSegments(const ArchiveStore& store, const std::vector<ArchivedSegment>& segments)
{
    for (const ArchivedSegment& segment : segments) {
        if (!store.WriteSegment(segment)) {
            return false;
        }
        fprintf(stdout, "segment %llu: %s\n", (unsigned long long)segment.header.segmentIndex,
                segment.header.GetHash(GetArchivingParams().commitmentHash).GetHex().c_str());
    }
    return true;
}

static bool CommandArchive(const std::vector<std::string>& args)
{
    if (args.size() < 2) {
        return error("archive: usage: archive <dir> <file>...");
    }
    const ArchivingParams& params = GetArchivingParams();
    ArchiveStore store{fs::path(args[0])};
    if (!store.Create()) {
        return false;
    }

    SegmentHeaderChain chain(params.commitmentHash);
    if (store.HasHeaders() && !store.LoadChain(params, chain)) {
        return false;
    }

    std::vector<BlockRecord> pending;
    if (!store.ReadPendingRecords(pending)) {
        return false;
    }

    Archiver archiver(params, chain, GetArchiveThreads());
    ArchiveState state;
    size_t nextPending = 0;
    if (archiver.NeedsPartialRecord()) {
        if (pending.empty()) {
            return error("archive: record %u is partially archived but missing from %s",
                         archiver.GetPartialRecordNumber(), store.GetPendingPath().string());
        }
        if (!archiver.ResumePartialRecord(pending[0], state)) {
            return error("archive: cannot resume record %u: %s", archiver.GetPartialRecordNumber(), state.ToString());
        }
        nextPending = 1;
    }

    std::vector<BlockRecord> records(pending.begin() + nextPending, pending.end());
    for (size_t i = 1; i < args.size(); ++i) {
        BlockRecord record;
        if (!ReadInputFile(fs::path(args[i]), record)) {
            return false;
        }
        records.push_back(std::move(record));
    }

    for (const BlockRecord& record : records) {
        std::vector<ArchivedSegment> segments;
        const bool fAdded = archiver.AddRecord(record, segments, state);
        // Segments published before a failure are already in the chain
        if (!PersistSegments(store, segments)) {
            return false;
        }
        if (!fAdded) {
            return error("archive: %s", state.ToString());
        }
    }

    if (!store.WriteHeaders(chain.GetHeaders())) {
        return false;
    }
    if (!store.WritePendingRecords(archiver.GetUnarchivedRecords())) {
        return false;
    }

    fprintf(stdout, "%llu segments, %llu bytes buffered\n",
            (unsigned long long)chain.Size(), (unsigned long long)archiver.GetBufferedBytes());
    return true;
}

static bool CommandVerify(const std::vector<std::string>& args)
{
    if (args.size() != 1) {
        return error("verify: usage: verify <dir>");
    }
    const ArchivingParams& params = GetArchivingParams();
    ArchiveStore store{fs::path(args[0])};

    std::optional<uint256> expectedTip;
    if (gArgs.IsArgSet("-tiphash")) {
        const std::string strTip = gArgs.GetArg("-tiphash", "");
        if (strTip.size() != 64 || !IsHex(strTip)) {
            return error("verify: -tiphash must be 64 hex digits, got '%s'", strTip);
        }
        expectedTip = uint256S(strTip);
    }

    SegmentHeaderChain chain(params.commitmentHash);
    if (!store.LoadChain(params, chain, expectedTip)) {
        return false;
    }

    bool fOk = true;
    for (const SegmentHeader& header : chain.GetHeaders()) {
        size_t nRejected = 0;
        std::vector<Piece> pieces = LoadVerifiedPieces(store, header, nRejected);
        const bool fRecoverable = pieces.size() >= params.nSourceShards;
        fprintf(stdout, "segment %llu: %u valid, %u invalid pieces%s\n",
                (unsigned long long)header.segmentIndex, (unsigned int)pieces.size(),
                (unsigned int)nRejected, fRecoverable ? "" : " (not recoverable)");
        if (nRejected > 0 || !fRecoverable) {
            fOk = false;
        }
    }
    if (!fOk) {
        return error("verify: archive in %s has invalid or missing pieces", store.GetDir().string());
    }
    fprintf(stdout, "%llu segments verified\n", (unsigned long long)chain.Size());
    return true;
}

static bool CommandReconstruct(const std::vector<std::string>& args)
{
    if (args.size() != 2) {
        return error("reconstruct: usage: reconstruct <dir> <outdir>");
    }
    const ArchivingParams& params = GetArchivingParams();
    ArchiveStore store{fs::path(args[0])};
    const fs::path outdir(args[1]);

    SegmentHeaderChain chain(params.commitmentHash);
    if (!store.LoadChain(params, chain)) {
        return false;
    }

    boost::system::error_code ec;
    fs::create_directories(outdir, ec);
    if (ec) {
        return error("reconstruct: cannot create %s: %s", outdir.string(), ec.message());
    }

    Reconstructor reconstructor(params, GetArchiveThreads());
    size_t nRecords = 0;
    for (const SegmentHeader& header : chain.GetHeaders()) {
        size_t nRejected = 0;
        std::vector<Piece> pieces = LoadVerifiedPieces(store, header, nRejected);
        ReconstructionResult result = reconstructor.AddSegment(header, pieces);
        if (!result.success) {
            return error("reconstruct: segment %u: %s", header.segmentIndex, result.errorMessage);
        }
        for (const NumberedRecord& record : result.records) {
            if (!ArchiveStore::WriteRecord(outdir, record)) {
                return false;
            }
            ++nRecords;
        }
    }

    fprintf(stdout, "%u records recovered from %llu segments\n", (unsigned int)nRecords,
            (unsigned long long)chain.Size());
    return true;
}

static int CommandLineUtil(int argc, char* argv[])
{
    // Skip switches
    while (argc > 1 && argv[1][0] == '-') {
        argc--;
        argv++;
    }
    if (argc < 2) {
        fprintf(stderr, "Error: no command given\n");
        return EXIT_FAILURE;
    }

    const std::string strCommand(argv[1]);
    std::vector<std::string> args(argv + 2, argv + argc);

    bool fSuccess;
    if (strCommand == "archive") {
        fSuccess = CommandArchive(args);
    } else if (strCommand == "verify") {
        fSuccess = CommandVerify(args);
    } else if (strCommand == "reconstruct") {
        fSuccess = CommandReconstruct(args);
    } else {
        fprintf(stderr, "Error: unknown command '%s'\n", strCommand.c_str());
        return EXIT_FAILURE;
    }

    if (!fSuccess) {
        fprintf(stderr, "Error: %s failed, see the log for details\n", strCommand.c_str());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitUtil(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: initialization failed: %s\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        return CommandLineUtil(argc, argv);
    } catch (const std::exception& e) {
        LogPrintf("EXCEPTION: %s\n", e.what());
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
