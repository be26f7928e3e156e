// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file segment_header_tests.cpp
 * @brief Tests for segment headers and the hash-linked header chain
 */

#include <archiving/segment_header.h>
#include <streams.h>

#include <test/test_segarc.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

static FastRandomContext g_test_rand_ctx(true);

/** Append n well-formed regtest headers to chain */
static std::vector<archiving::SegmentHeader> GrowChain(archiving::SegmentHeaderChain& chain, size_t n)
{
    const uint64_t capacity = archiving::GetArchivingParams().nSegmentCapacity;
    std::vector<archiving::SegmentHeader> headers;
    for (size_t i = 0; i < n; ++i) {
        const uint64_t start = chain.Size() * capacity;
        archiving::SegmentHeader header;
        archiving::ArchiveState state;
        BOOST_REQUIRE(chain.Append(g_test_rand_ctx.rand256(), start, start + capacity,
                                   chain.IsEmpty() ? 0 : 100, archiving::LastArchivedRecord(i, 50),
                                   header, state));
        headers.push_back(header);
    }
    return headers;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(segment_header_tests, BasicTestingSetup)

// ============================================================================
// SegmentHeader
// ============================================================================

BOOST_AUTO_TEST_CASE(header_serialization)
{
    archiving::SegmentHeader header;
    header.segmentIndex = 3;
    header.segmentCommitment = g_test_rand_ctx.rand256();
    header.prevSegmentHeaderHash = g_test_rand_ctx.rand256();
    header.historyStart = 3 * 4096;
    header.historyEnd = 4 * 4096;
    header.firstRecordOffset = 17;
    header.lastArchivedRecord = archiving::LastArchivedRecord(9, 1200);

    CDataStream ss(SER_DISK, 0);
    ss << header;
    // 4 + 8 + 32 + 32 + 8 + 8 + 4 + (8 + 4)
    BOOST_CHECK_EQUAL(ss.size(), 108u);

    archiving::SegmentHeader decoded;
    ss >> decoded;
    BOOST_CHECK(decoded == header);
    BOOST_CHECK(decoded.GetHash(HashAlgorithm::SHA256D) == header.GetHash(HashAlgorithm::SHA256D));
    CHashWriter hw(SER_GETHASH, 0);
    hw << header;
    BOOST_CHECK(hw.GetHash() == header.GetHash(HashAlgorithm::SHA256D));
}

BOOST_AUTO_TEST_CASE(header_hash_covers_every_field)
{
    archiving::SegmentHeader base;
    base.segmentIndex = 1;
    base.historyStart = 4096;
    base.historyEnd = 8192;
    const uint256 hash = base.GetHash(HashAlgorithm::SHA256D);

    archiving::SegmentHeader h = base;
    h.segmentCommitment = g_test_rand_ctx.rand256();
    BOOST_CHECK(h.GetHash(HashAlgorithm::SHA256D) != hash);
    h = base;
    h.firstRecordOffset = 1;
    BOOST_CHECK(h.GetHash(HashAlgorithm::SHA256D) != hash);
    h = base;
    h.lastArchivedRecord.archivedBytes = 1;
    BOOST_CHECK(h.GetHash(HashAlgorithm::SHA256D) != hash);
    h = base;
    h.version = 2;
    BOOST_CHECK(h.GetHash(HashAlgorithm::SHA256D) != hash);

    BOOST_CHECK(base.GetHash(HashAlgorithm::SHA3_256) != hash);
}

BOOST_AUTO_TEST_CASE(header_structure)
{
    const archiving::ArchivingParams& params = archiving::GetArchivingParams();

    archiving::SegmentHeader genesis;
    genesis.historyEnd = params.nSegmentCapacity;
    BOOST_CHECK(genesis.ValidateStructure(params));

    archiving::SegmentHeader h = genesis;
    h.prevSegmentHeaderHash = g_test_rand_ctx.rand256();
    BOOST_CHECK(!h.ValidateStructure(params));

    h = genesis;
    h.firstRecordOffset = 5;
    BOOST_CHECK(!h.ValidateStructure(params));

    h = genesis;
    h.historyEnd = params.nSegmentCapacity - 1;
    BOOST_CHECK(!h.ValidateStructure(params));

    h = genesis;
    h.version = 0;
    BOOST_CHECK(!h.ValidateStructure(params));

    archiving::SegmentHeader second;
    second.segmentIndex = 1;
    second.prevSegmentHeaderHash = genesis.GetHash(params.commitmentHash);
    second.historyStart = params.nSegmentCapacity;
    second.historyEnd = 2 * params.nSegmentCapacity;
    second.firstRecordOffset = params.nSegmentCapacity;
    BOOST_CHECK(second.ValidateStructure(params));

    second.firstRecordOffset = params.nSegmentCapacity + 1;
    BOOST_CHECK(!second.ValidateStructure(params));

    second.firstRecordOffset = 0;
    second.historyStart += 1;
    second.historyEnd += 1;
    BOOST_CHECK(!second.ValidateStructure(params));
}

// ============================================================================
// SegmentHeaderChain
// ============================================================================

BOOST_AUTO_TEST_CASE(chain_append_links_headers)
{
    archiving::SegmentHeaderChain chain;
    BOOST_CHECK(chain.IsEmpty());
    BOOST_CHECK(chain.GetTipHash().IsNull());
    BOOST_CHECK(!chain.GetTip());

    std::vector<archiving::SegmentHeader> headers = GrowChain(chain, 5);
    BOOST_CHECK_EQUAL(chain.Size(), 5u);
    BOOST_CHECK(headers[0].prevSegmentHeaderHash.IsNull());
    for (size_t i = 1; i < headers.size(); ++i) {
        BOOST_CHECK_EQUAL(headers[i].segmentIndex, i);
        BOOST_CHECK(headers[i].prevSegmentHeaderHash == headers[i - 1].GetHash(HashAlgorithm::SHA256D));
    }
    BOOST_CHECK(chain.GetTipHash() == headers.back().GetHash(HashAlgorithm::SHA256D));
    BOOST_CHECK(*chain.GetTip() == headers.back());
    BOOST_CHECK(*chain.GetHeader(2) == headers[2]);
    BOOST_CHECK(!chain.GetHeader(5));

    archiving::ArchiveState state;
    BOOST_CHECK(archiving::VerifyChain(chain.GetHeaders(), HashAlgorithm::SHA256D, state, chain.GetTipHash()));
}

BOOST_AUTO_TEST_CASE(chain_rejects_bad_predecessor)
{
    archiving::SegmentHeaderChain chain;
    std::vector<archiving::SegmentHeader> headers = GrowChain(chain, 2);
    const uint64_t capacity = archiving::GetArchivingParams().nSegmentCapacity;

    archiving::SegmentHeader next;
    next.segmentIndex = 2;
    next.prevSegmentHeaderHash = chain.GetTipHash();
    next.historyStart = 2 * capacity;
    next.historyEnd = 3 * capacity;

    archiving::ArchiveState state;

    archiving::SegmentHeader bad = next;
    bad.prevSegmentHeaderHash = headers[0].GetHash(HashAlgorithm::SHA256D);
    BOOST_CHECK(!chain.Append(bad, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::MISSING_PREDECESSOR);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "prev-hash-mismatch");

    state.Reset();
    bad = next;
    bad.segmentIndex = 3;
    BOOST_CHECK(!chain.Append(bad, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "non-consecutive-index");

    state.Reset();
    bad = next;
    bad.historyStart += 1;
    BOOST_CHECK(!chain.Append(bad, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "history-gap");

    BOOST_CHECK_EQUAL(chain.Size(), 2u);

    state.Reset();
    BOOST_CHECK(chain.Append(next, state));
    BOOST_CHECK_EQUAL(chain.Size(), 3u);
}

BOOST_AUTO_TEST_CASE(empty_chain_requires_genesis)
{
    archiving::SegmentHeaderChain chain;
    archiving::SegmentHeader header;
    header.historyEnd = 4096;
    header.prevSegmentHeaderHash = g_test_rand_ctx.rand256();

    archiving::ArchiveState state;
    BOOST_CHECK(!chain.Append(header, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::MISSING_PREDECESSOR);

    state.Reset();
    header.prevSegmentHeaderHash.SetNull();
    header.segmentIndex = 1;
    BOOST_CHECK(!chain.Append(header, state));
    BOOST_CHECK(chain.IsEmpty());
}

BOOST_AUTO_TEST_CASE(chain_extend_is_all_or_nothing)
{
    archiving::SegmentHeaderChain source;
    std::vector<archiving::SegmentHeader> headers = GrowChain(source, 6);

    archiving::SegmentHeaderChain chain;
    archiving::ArchiveState state;
    std::vector<archiving::SegmentHeader> firstHalf(headers.begin(), headers.begin() + 3);
    BOOST_REQUIRE(chain.Extend(firstHalf, state));
    BOOST_CHECK_EQUAL(chain.Size(), 3u);

    // Break the link inside the run
    std::vector<archiving::SegmentHeader> secondHalf(headers.begin() + 3, headers.end());
    secondHalf[2].prevSegmentHeaderHash = g_test_rand_ctx.rand256();
    BOOST_CHECK(!chain.Extend(secondHalf, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::MISSING_PREDECESSOR);
    BOOST_CHECK_EQUAL(chain.Size(), 3u);
    BOOST_CHECK(chain.GetTipHash() == headers[2].GetHash(HashAlgorithm::SHA256D));

    state.Reset();
    secondHalf[2] = headers[5];
    BOOST_CHECK(chain.Extend(secondHalf, state));
    BOOST_CHECK(chain.GetTipHash() == source.GetTipHash());

    std::vector<archiving::SegmentHeader> middle = chain.GetHeaders(2, 2);
    BOOST_REQUIRE_EQUAL(middle.size(), 2u);
    BOOST_CHECK(middle[0] == headers[2]);
    BOOST_CHECK_EQUAL(chain.GetHeaders(4, 100).size(), 2u);
    BOOST_CHECK(chain.GetHeaders(6).empty());
}

BOOST_AUTO_TEST_CASE(concurrent_producers_publish_one_header_per_index)
{
    static const int NUM_PRODUCERS = 6;
    static const uint64_t TARGET_SIZE = 120;
    const uint64_t capacity = archiving::GetArchivingParams().nSegmentCapacity;

    archiving::SegmentHeaderChain chain;
    GrowChain(chain, 1);
    const HashAlgorithm algo = chain.GetHashAlgorithm();

    std::mutex cs_results;
    std::map<uint64_t, uint256> winners;
    std::vector<std::string> failures;
    std::atomic<int> nRejected(0);

    // Producers race for the next index from a possibly stale view of the tip,
    // through each of the three ways of adding a header
    auto producer = [&](uint32_t id) {
        for (uint64_t attempt = 0; ; ++attempt) {
            const std::optional<archiving::SegmentHeader> tip = chain.GetTip();
            if (!tip || tip->segmentIndex + 1 >= TARGET_SIZE) {
                break;
            }

            CHashWriter hw(SER_GETHASH, 0);
            hw << id << attempt;

            archiving::SegmentHeader header;
            header.segmentIndex = tip->segmentIndex + 1;
            header.segmentCommitment = hw.GetHash();
            header.prevSegmentHeaderHash = tip->GetHash(algo);
            header.historyStart = tip->historyEnd;
            header.historyEnd = tip->historyEnd + capacity;
            header.firstRecordOffset = 100;
            header.lastArchivedRecord = archiving::LastArchivedRecord(header.segmentIndex, 50);

            archiving::ArchiveState state;
            bool fAppended;
            if (id % 3 == 0) {
                fAppended = chain.Append(header, state);
            } else if (id % 3 == 1) {
                fAppended = chain.Extend({header}, state);
            } else {
                archiving::SegmentHeader published;
                fAppended = chain.Append(header.segmentCommitment, header.historyStart, header.historyEnd,
                                         header.firstRecordOffset, header.lastArchivedRecord, published, state);
                if (fAppended) {
                    header = published;
                }
            }

            std::lock_guard<std::mutex> lock(cs_results);
            if (fAppended) {
                if (!winners.emplace(header.segmentIndex, header.segmentCommitment).second) {
                    failures.push_back(strprintf("segment %u published twice", header.segmentIndex));
                }
            } else {
                ++nRejected;
                const std::string& reason = state.GetRejectReason();
                if (state.GetError() != archiving::ArchiveError::MISSING_PREDECESSOR ||
                    (reason != "non-consecutive-index" && reason != "prev-hash-mismatch" && reason != "history-gap")) {
                    failures.push_back(state.ToString());
                }
            }
        }
    };

    std::vector<std::thread> threads;
    for (uint32_t id = 0; id < NUM_PRODUCERS; ++id) {
        threads.emplace_back(producer, id);
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    for (const std::string& failure : failures) {
        BOOST_ERROR(failure);
    }
    BOOST_TEST_MESSAGE(strprintf("%d appends lost the race", nRejected.load()));

    BOOST_REQUIRE_EQUAL(chain.Size(), TARGET_SIZE);
    BOOST_CHECK_EQUAL(winners.size(), TARGET_SIZE - 1);
    for (const auto& winner : winners) {
        const std::optional<archiving::SegmentHeader> header = chain.GetHeader(winner.first);
        BOOST_REQUIRE(header);
        BOOST_CHECK(header->segmentCommitment == winner.second);
    }

    archiving::ArchiveState state;
    BOOST_CHECK(archiving::VerifyChain(chain.GetHeaders(), algo, state, chain.GetTipHash()));
    BOOST_CHECK_EQUAL(chain.GetTip()->historyEnd, TARGET_SIZE * capacity);
}

BOOST_AUTO_TEST_CASE(chain_hash_algorithm)
{
    archiving::SegmentHeaderChain chain(HashAlgorithm::SHA3_256);
    std::vector<archiving::SegmentHeader> headers = GrowChain(chain, 3);
    BOOST_CHECK(headers[1].prevSegmentHeaderHash == headers[0].GetHash(HashAlgorithm::SHA3_256));

    archiving::ArchiveState state;
    BOOST_CHECK(archiving::VerifyChain(headers, HashAlgorithm::SHA3_256, state));
    BOOST_CHECK(!archiving::VerifyChain(headers, HashAlgorithm::SHA256D, state));
}

// ============================================================================
// VerifyChain
// ============================================================================

BOOST_AUTO_TEST_CASE(verify_chain_detects_mutation)
{
    archiving::SegmentHeaderChain chain;
    const std::vector<archiving::SegmentHeader> headers = GrowChain(chain, 4);
    const uint256 tip = chain.GetTipHash();
    archiving::ArchiveState state;

    BOOST_CHECK(archiving::VerifyChain(headers, HashAlgorithm::SHA256D, state, tip));

    // Altering any header but the last breaks the next link
    for (size_t i = 0; i + 1 < headers.size(); ++i) {
        std::vector<archiving::SegmentHeader> mutated = headers;
        mutated[i].segmentCommitment = g_test_rand_ctx.rand256();
        state.Reset();
        BOOST_CHECK(!archiving::VerifyChain(mutated, HashAlgorithm::SHA256D, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "prev-hash-mismatch");
    }

    // The last header is bound only by the expected tip
    std::vector<archiving::SegmentHeader> mutated = headers;
    mutated.back().segmentCommitment = g_test_rand_ctx.rand256();
    state.Reset();
    BOOST_CHECK(archiving::VerifyChain(mutated, HashAlgorithm::SHA256D, state));
    BOOST_CHECK(!archiving::VerifyChain(mutated, HashAlgorithm::SHA256D, state, tip));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "tip-hash-mismatch");

    // Dropping a header leaves a gap
    std::vector<archiving::SegmentHeader> gapped = headers;
    gapped.erase(gapped.begin() + 1);
    state.Reset();
    BOOST_CHECK(!archiving::VerifyChain(gapped, HashAlgorithm::SHA256D, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::MISSING_PREDECESSOR);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "non-consecutive-index");

    // Genesis must not reference a predecessor
    std::vector<archiving::SegmentHeader> badGenesis = headers;
    badGenesis[0].prevSegmentHeaderHash = g_test_rand_ctx.rand256();
    state.Reset();
    BOOST_CHECK(!archiving::VerifyChain(badGenesis, HashAlgorithm::SHA256D, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-genesis-prev-hash");
}

BOOST_AUTO_TEST_CASE(verify_empty_chain)
{
    archiving::ArchiveState state;
    BOOST_CHECK(archiving::VerifyChain({}, HashAlgorithm::SHA256D, state));
    BOOST_CHECK(archiving::VerifyChain({}, HashAlgorithm::SHA256D, state, uint256()));
    BOOST_CHECK(!archiving::VerifyChain({}, HashAlgorithm::SHA256D, state, g_test_rand_ctx.rand256()));
}

BOOST_AUTO_TEST_SUITE_END()
