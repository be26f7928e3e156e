// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file reconstructor_tests.cpp
 * @brief Tests for recovering segments and records from surviving pieces
 *
 * Segments are produced by the archiver, then pieces are dropped or
 * tampered with before reconstruction.
 */

#include <archiving/archiver.h>
#include <archiving/reconstructor.h>

#include <test/test_segarc.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace {

static FastRandomContext g_test_rand_ctx(true);

/** An archive built from records of the given framed sizes */
struct TestArchive {
    archiving::SegmentHeaderChain chain;
    std::vector<archiving::BlockRecord> records;
    std::vector<archiving::ArchivedSegment> segments;
    std::vector<unsigned char> stream;

    explicit TestArchive(const std::vector<size_t>& framedSizes)
        : chain(archiving::GetArchivingParams().commitmentHash)
    {
        archiving::Archiver archiver(archiving::GetArchivingParams(), chain);
        for (size_t framedSize : framedSizes) {
            archiving::BlockRecord record(InsecureRandBytes(g_test_rand_ctx, framedSize - archiving::RECORD_LENGTH_PREFIX_SIZE));
            std::vector<unsigned char> framed = record.GetFramedBytes();
            stream.insert(stream.end(), framed.begin(), framed.end());
            records.push_back(record);

            archiving::ArchiveState state;
            BOOST_REQUIRE(archiver.AddRecord(record, segments, state));
        }
    }

    /** Source bytes covered by one segment */
    std::vector<unsigned char> SegmentBytes(size_t index) const
    {
        const archiving::SegmentHeader& header = segments[index].header;
        return std::vector<unsigned char>(stream.begin() + header.historyStart, stream.begin() + header.historyEnd);
    }
};

/** A random selection of count pieces, in random order */
static std::vector<archiving::Piece> PickPieces(const std::vector<archiving::Piece>& pieces, size_t count)
{
    std::vector<archiving::Piece> shuffled = pieces;
    for (size_t i = shuffled.size(); i > 1; --i) {
        std::swap(shuffled[i - 1], shuffled[g_test_rand_ctx.randrange(i)]);
    }
    shuffled.resize(count);
    return shuffled;
}

static std::vector<uint64_t> Numbers(const archiving::ReconstructionResult& result)
{
    std::vector<uint64_t> numbers;
    for (const archiving::NumberedRecord& record : result.records) {
        numbers.push_back(record.number);
    }
    return numbers;
}

// 3000 + 2000 + 4000 + 3000 + 1000 + 3288: records 1, 2 and 4 cross boundaries
static const std::vector<size_t> THREE_SEGMENT_SIZES = {3000, 2000, 4000, 3000, 1000, 3288};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(reconstructor_tests, BasicTestingSetup)

// ============================================================================
// Segment recovery
// ============================================================================

BOOST_AUTO_TEST_CASE(survives_loss_of_m_pieces)
{
    TestArchive archive({3000, 2000, 3192});
    BOOST_REQUIRE_EQUAL(archive.segments.size(), 2u);
    BOOST_REQUIRE_EQUAL(archive.segments[0].pieces.size() + archive.segments[1].pieces.size(), 16u);

    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());
    const archiving::ArchivedSegment& segment = archive.segments[0];

    // Any 4 of the 8 pieces remain after deleting 4
    for (int round = 0; round < 20; ++round) {
        std::vector<unsigned char> bytes;
        archiving::ArchiveState state;
        BOOST_REQUIRE_MESSAGE(reconstructor.ReconstructSegmentBytes(segment.header, PickPieces(segment.pieces, 4),
                                                                    bytes, state), state.ToString());
        BOOST_CHECK(bytes == archive.SegmentBytes(0));
    }

    // Deleting a fifth piece leaves too few
    std::vector<unsigned char> bytes;
    archiving::ArchiveState state;
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(segment.header, PickPieces(segment.pieces, 3), bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);

    archiving::ReconstructionResult result = reconstructor.ReconstructSegment(segment.header, PickPieces(segment.pieces, 3));
    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.error == archiving::ArchiveError::INSUFFICIENT_SHARDS);
    BOOST_CHECK(result.records.empty());
}

BOOST_AUTO_TEST_CASE(duplicate_pieces_do_not_count)
{
    TestArchive archive({4096});
    const archiving::ArchivedSegment& segment = archive.segments[0];

    std::vector<archiving::Piece> pieces = {segment.pieces[1], segment.pieces[1], segment.pieces[5], segment.pieces[6]};
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());
    std::vector<unsigned char> bytes;
    archiving::ArchiveState state;
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(segment.header, pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);

    state.Reset();
    pieces.push_back(segment.pieces[7]);
    BOOST_CHECK(reconstructor.ReconstructSegmentBytes(segment.header, pieces, bytes, state));
    BOOST_CHECK(bytes == archive.SegmentBytes(0));
}

BOOST_AUTO_TEST_CASE(tampered_piece_is_rejected)
{
    TestArchive archive({4096});
    const archiving::ArchivedSegment& segment = archive.segments[0];
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    std::vector<archiving::Piece> pieces = segment.pieces;
    pieces[2].data[100] ^= 0x01;

    std::vector<unsigned char> bytes;
    archiving::ArchiveState state;
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(segment.header, pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::COMMITMENT_MISMATCH);
    BOOST_CHECK(bytes.empty());

    // Wrong length is reported as a corrupt shard
    pieces = segment.pieces;
    pieces[6].data.resize(1000);
    state.Reset();
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(segment.header, pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::CORRUPT_SHARD);

    // A piece of another segment
    pieces = segment.pieces;
    pieces[0].segmentIndex = 1;
    state.Reset();
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(segment.header, pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::CORRUPT_SHARD);
}

BOOST_AUTO_TEST_CASE(forged_header_is_rejected)
{
    TestArchive archive({4096});
    const archiving::ArchivedSegment& segment = archive.segments[0];
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    archiving::SegmentHeader header = segment.header;
    header.segmentCommitment = g_test_rand_ctx.rand256();
    std::vector<unsigned char> bytes;
    archiving::ArchiveState state;
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(header, segment.pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::COMMITMENT_MISMATCH);

    header = segment.header;
    header.historyEnd += 1;
    state.Reset();
    BOOST_CHECK(!reconstructor.ReconstructSegmentBytes(header, segment.pieces, bytes, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INVALID_PARAMS);
}

BOOST_AUTO_TEST_CASE(regenerate_all_pieces)
{
    TestArchive archive(THREE_SEGMENT_SIZES);
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams(), 2);

    for (const archiving::ArchivedSegment& segment : archive.segments) {
        std::vector<archiving::Piece> regenerated;
        archiving::ArchiveState state;
        BOOST_REQUIRE(reconstructor.ReconstructPieces(segment.header, PickPieces(segment.pieces, 4), regenerated, state));
        BOOST_CHECK(regenerated == segment.pieces);
    }

    archiving::ArchiveState state;
    std::vector<archiving::Piece> regenerated;
    BOOST_CHECK(!reconstructor.ReconstructPieces(archive.segments[0].header,
                                                 PickPieces(archive.segments[0].pieces, 2), regenerated, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);
}

// ============================================================================
// Record recovery
// ============================================================================

BOOST_AUTO_TEST_CASE(stateless_segment_returns_inner_records)
{
    TestArchive archive(THREE_SEGMENT_SIZES);
    BOOST_REQUIRE_EQUAL(archive.segments.size(), 3u);
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    archiving::ReconstructionResult result = reconstructor.ReconstructSegment(archive.segments[0].header,
                                                                              archive.segments[0].pieces);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(Numbers(result) == std::vector<uint64_t>{0});
    BOOST_CHECK(result.records[0].record == archive.records[0]);

    // Segment 1 holds only the tail of record 1 and the head of record 2
    result = reconstructor.ReconstructSegment(archive.segments[1].header, archive.segments[1].pieces);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(result.records.empty());

    result = reconstructor.ReconstructSegment(archive.segments[2].header, PickPieces(archive.segments[2].pieces, 4));
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(Numbers(result) == std::vector<uint64_t>{3});
    BOOST_CHECK(result.records[0].record == archive.records[3]);

    BOOST_CHECK(!reconstructor.HasPartialRecord());
}

BOOST_AUTO_TEST_CASE(streaming_stitches_records)
{
    TestArchive archive(THREE_SEGMENT_SIZES);
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    std::vector<archiving::NumberedRecord> recovered;
    for (const archiving::ArchivedSegment& segment : archive.segments) {
        archiving::ReconstructionResult result = reconstructor.AddSegment(segment.header, PickPieces(segment.pieces, 4));
        BOOST_REQUIRE_MESSAGE(result.success, result.errorMessage);
        recovered.insert(recovered.end(), result.records.begin(), result.records.end());
    }

    // Record 4 continues past the last full segment
    BOOST_CHECK(reconstructor.HasPartialRecord());
    BOOST_REQUIRE_EQUAL(recovered.size(), 4u);
    for (size_t i = 0; i < recovered.size(); ++i) {
        BOOST_CHECK_EQUAL(recovered[i].number, i);
        BOOST_CHECK(recovered[i].record == archive.records[i]);
    }

    reconstructor.Reset();
    BOOST_CHECK(!reconstructor.HasPartialRecord());
}

BOOST_AUTO_TEST_CASE(streaming_record_spanning_segments)
{
    // Record 0 ends exactly at the end of segment 2, record 2 at the end of segment 3
    TestArchive archive({12288, 100, 3996});
    BOOST_REQUIRE_EQUAL(archive.segments.size(), 4u);
    BOOST_CHECK_EQUAL(archive.segments[1].header.firstRecordOffset, 4096u);
    BOOST_CHECK(archive.segments[2].header.lastArchivedRecord.IsComplete());

    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());
    std::vector<uint64_t> expectedCounts = {0, 0, 1, 2};
    for (size_t i = 0; i < archive.segments.size(); ++i) {
        archiving::ReconstructionResult result = reconstructor.AddSegment(archive.segments[i].header,
                                                                          archive.segments[i].pieces);
        BOOST_REQUIRE_MESSAGE(result.success, result.errorMessage);
        BOOST_CHECK_EQUAL(result.records.size(), expectedCounts[i]);
        if (i == 2) {
            BOOST_CHECK(result.records[0].record == archive.records[0]);
        }
        if (i == 3) {
            BOOST_CHECK(result.records[0].record == archive.records[1]);
            BOOST_CHECK(result.records[1].record == archive.records[2]);
        }
    }
    BOOST_CHECK(!reconstructor.HasPartialRecord());
}

BOOST_AUTO_TEST_CASE(skipped_segment_drops_partial_record)
{
    TestArchive archive(THREE_SEGMENT_SIZES);
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    archiving::ReconstructionResult result = reconstructor.AddSegment(archive.segments[0].header, archive.segments[0].pieces);
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(Numbers(result) == std::vector<uint64_t>{0});
    BOOST_CHECK(reconstructor.HasPartialRecord());

    // Segment 1 lost: record 1 cannot be finished, record 2's head is gone
    result = reconstructor.AddSegment(archive.segments[2].header, archive.segments[2].pieces);
    BOOST_REQUIRE_MESSAGE(result.success, result.errorMessage);
    BOOST_CHECK(Numbers(result) == std::vector<uint64_t>{3});
    BOOST_CHECK(reconstructor.HasPartialRecord());
}

BOOST_AUTO_TEST_CASE(failed_segment_leaves_state_unchanged)
{
    TestArchive archive(THREE_SEGMENT_SIZES);
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    BOOST_REQUIRE(reconstructor.AddSegment(archive.segments[0].header, archive.segments[0].pieces).success);

    archiving::ReconstructionResult result = reconstructor.AddSegment(archive.segments[1].header,
                                                                      PickPieces(archive.segments[1].pieces, 3));
    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.error == archiving::ArchiveError::INSUFFICIENT_SHARDS);
    BOOST_CHECK(reconstructor.HasPartialRecord());

    // Retry with enough pieces finishes record 1 from the kept head
    result = reconstructor.AddSegment(archive.segments[1].header, PickPieces(archive.segments[1].pieces, 5));
    BOOST_REQUIRE(result.success);
    BOOST_CHECK(Numbers(result) == std::vector<uint64_t>{1});
    BOOST_CHECK(result.records[0].record == archive.records[1]);
}

BOOST_AUTO_TEST_CASE(inconsistent_record_layout_is_rejected)
{
    TestArchive archive({3000, 2000});
    archiving::Reconstructor reconstructor(archiving::GetArchivingParams());

    // Re-commit segment 0 under a header that lies about the last record
    const archiving::ArchivingParams& params = archiving::GetArchivingParams();
    archiving::SegmentAssembler assembler(params);
    archiving::AssembledSegment assembled;
    archiving::ArchiveState state;
    BOOST_REQUIRE(assembler.Assemble(0, archive.SegmentBytes(0), assembled, state));

    archiving::SegmentHeader header = archive.segments[0].header;
    BOOST_CHECK(header.segmentCommitment == assembled.commitment);
    header.lastArchivedRecord.archivedBytes = 0;

    archiving::ReconstructionResult result = reconstructor.ReconstructSegment(header, assembled.pieces);
    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.error == archiving::ArchiveError::INVALID_RECORD);
}

BOOST_AUTO_TEST_SUITE_END()
