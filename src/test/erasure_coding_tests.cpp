// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file erasure_coding_tests.cpp
 * @brief Tests for GF(2^8) arithmetic and the systematic Reed-Solomon coder
 *
 * The coder must be MDS: any k of the k + m shards recover the source.
 */

#include <archiving/erasure_coding.h>

#include <test/test_segarc.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <vector>

namespace {

static FastRandomContext g_test_rand_ctx(true);

static std::vector<std::vector<unsigned char>> RandomShards(uint32_t count, uint32_t size)
{
    std::vector<std::vector<unsigned char>> shards;
    for (uint32_t i = 0; i < count; ++i) {
        shards.push_back(InsecureRandBytes(g_test_rand_ctx, size));
    }
    return shards;
}

/** Source followed by parity, as IndexedShards */
static std::vector<archiving::IndexedShard> IndexAll(const std::vector<std::vector<unsigned char>>& source,
                                                     const std::vector<std::vector<unsigned char>>& parity)
{
    std::vector<archiving::IndexedShard> all;
    for (size_t i = 0; i < source.size(); ++i) {
        all.emplace_back(i, source[i]);
    }
    for (size_t i = 0; i < parity.size(); ++i) {
        all.emplace_back(source.size() + i, parity[i]);
    }
    return all;
}

static int PopCount(uint32_t x)
{
    int n = 0;
    while (x) {
        n += x & 1;
        x >>= 1;
    }
    return n;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(erasure_coding_tests, BasicTestingSetup)

// ============================================================================
// GF(2^8)
// ============================================================================

BOOST_AUTO_TEST_CASE(gf256_known_products)
{
    BOOST_CHECK_EQUAL(archiving::GF256::Mul(0, 0x53), 0);
    BOOST_CHECK_EQUAL(archiving::GF256::Mul(1, 0x53), 0x53);
    BOOST_CHECK_EQUAL(archiving::GF256::Mul(2, 0x40), 0x80);
    // x * x^7 = x^8 = x^4 + x^3 + x^2 + 1 under 0x11d
    BOOST_CHECK_EQUAL(archiving::GF256::Mul(2, 0x80), 0x1d);
    BOOST_CHECK_EQUAL(archiving::GF256::Add(0x53, 0xca), 0x99);
}

BOOST_AUTO_TEST_CASE(gf256_field_properties)
{
    for (int a = 1; a < 256; ++a) {
        const uint8_t inv = archiving::GF256::Inv(a);
        BOOST_CHECK_EQUAL(archiving::GF256::Mul(a, inv), 1);
        for (int b = 1; b < 256; b += 37) {
            const uint8_t prod = archiving::GF256::Mul(a, b);
            BOOST_CHECK_EQUAL(prod, archiving::GF256::Mul(b, a));
            BOOST_CHECK_EQUAL(archiving::GF256::Div(prod, b), a);
        }
    }
    BOOST_CHECK_THROW(archiving::GF256::Div(5, 0), std::domain_error);
    BOOST_CHECK_THROW(archiving::GF256::Inv(0), std::domain_error);
}

BOOST_AUTO_TEST_CASE(gf256_mul_add_region)
{
    std::vector<unsigned char> src = InsecureRandBytes(g_test_rand_ctx, 64);
    std::vector<unsigned char> dst = InsecureRandBytes(g_test_rand_ctx, 64);
    std::vector<unsigned char> expected = dst;
    for (size_t i = 0; i < src.size(); ++i) {
        expected[i] ^= archiving::GF256::Mul(0x8e, src[i]);
    }
    archiving::GF256::MulAddRegion(0x8e, src.data(), dst.data(), dst.size());
    BOOST_CHECK(dst == expected);

    // Coefficient 0 is a no-op
    archiving::GF256::MulAddRegion(0, src.data(), dst.data(), dst.size());
    BOOST_CHECK(dst == expected);
}

// ============================================================================
// Coder construction
// ============================================================================

BOOST_AUTO_TEST_CASE(coder_rejects_bad_geometry)
{
    BOOST_CHECK_THROW(archiving::ErasureCoder(0, 4, 1024), std::runtime_error);
    BOOST_CHECK_THROW(archiving::ErasureCoder(4, 0, 1024), std::runtime_error);
    BOOST_CHECK_THROW(archiving::ErasureCoder(4, 4, 0), std::runtime_error);
    BOOST_CHECK_THROW(archiving::ErasureCoder(200, 57, 16), std::runtime_error);
    BOOST_CHECK_NO_THROW(archiving::ErasureCoder(128, 128, 16));
}

BOOST_AUTO_TEST_CASE(cauchy_coefficients)
{
    archiving::ErasureCoder coder(4, 4, 16);
    for (uint32_t row = 0; row < 4; ++row) {
        for (uint32_t col = 0; col < 4; ++col) {
            const uint8_t coef = coder.GetParityCoefficient(row, col);
            BOOST_CHECK(coef != 0);
            BOOST_CHECK_EQUAL(archiving::GF256::Mul(coef, (4 + row) ^ col), 1);
        }
    }
}

// ============================================================================
// Encode / decode
// ============================================================================

BOOST_AUTO_TEST_CASE(encode_is_systematic_and_deterministic)
{
    archiving::ErasureCoder coder(4, 4, 128);
    std::vector<std::vector<unsigned char>> source = RandomShards(4, 128);

    std::vector<std::vector<unsigned char>> parity1, parity2;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, parity1, state));
    BOOST_REQUIRE(coder.Encode(source, parity2, state));
    BOOST_CHECK_EQUAL(parity1.size(), 4u);
    BOOST_CHECK(parity1 == parity2);
    for (const auto& shard : parity1) {
        BOOST_CHECK_EQUAL(shard.size(), 128u);
    }

    // With only the source shards no matrix inversion takes place
    std::vector<std::vector<unsigned char>> decoded;
    BOOST_REQUIRE(coder.Decode(IndexAll(source, {}), decoded, state));
    BOOST_CHECK(decoded == source);
}

BOOST_AUTO_TEST_CASE(any_k_of_n_shards_decode)
{
    const uint32_t k = 4, m = 4;
    archiving::ErasureCoder coder(k, m, 64);
    std::vector<std::vector<unsigned char>> source = RandomShards(k, 64);
    std::vector<std::vector<unsigned char>> parity;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, parity, state));
    std::vector<archiving::IndexedShard> all = IndexAll(source, parity);

    int subsets = 0;
    for (uint32_t mask = 0; mask < (1u << (k + m)); ++mask) {
        if (PopCount(mask) != (int)k) continue;
        std::vector<archiving::IndexedShard> subset;
        for (uint32_t i = 0; i < k + m; ++i) {
            if (mask & (1u << i)) subset.push_back(all[i]);
        }
        std::vector<std::vector<unsigned char>> decoded;
        BOOST_CHECK_MESSAGE(coder.Decode(subset, decoded, state), "subset mask " << mask);
        BOOST_CHECK(decoded == source);
        ++subsets;
    }
    BOOST_CHECK_EQUAL(subsets, 70);
}

BOOST_AUTO_TEST_CASE(parity_only_decode_wide_code)
{
    archiving::ErasureCoder coder(16, 16, 32);
    std::vector<std::vector<unsigned char>> source = RandomShards(16, 32);
    std::vector<std::vector<unsigned char>> parity;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, parity, state));

    std::vector<archiving::IndexedShard> parityOnly;
    for (uint32_t i = 0; i < 16; ++i) {
        parityOnly.emplace_back(16 + i, parity[i]);
    }
    std::vector<std::vector<unsigned char>> decoded;
    BOOST_REQUIRE(coder.Decode(parityOnly, decoded, state));
    BOOST_CHECK(decoded == source);
}

BOOST_AUTO_TEST_CASE(too_few_shards_fail)
{
    archiving::ErasureCoder coder(4, 4, 64);
    std::vector<std::vector<unsigned char>> source = RandomShards(4, 64);
    std::vector<std::vector<unsigned char>> parity;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, parity, state));
    std::vector<archiving::IndexedShard> all = IndexAll(source, parity);

    std::vector<archiving::IndexedShard> three(all.begin() + 2, all.begin() + 5);
    std::vector<std::vector<unsigned char>> decoded;
    BOOST_CHECK(!coder.Decode(three, decoded, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);

    // Duplicates do not count twice
    state.Reset();
    std::vector<archiving::IndexedShard> dup = three;
    dup.push_back(three[0]);
    BOOST_CHECK(!coder.Decode(dup, decoded, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);

    // Out-of-range indices are ignored
    state.Reset();
    std::vector<archiving::IndexedShard> bogus = three;
    bogus.emplace_back(8, parity[0]);
    BOOST_CHECK(!coder.Decode(bogus, decoded, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);
}

BOOST_AUTO_TEST_CASE(wrong_size_shard_is_corrupt)
{
    archiving::ErasureCoder coder(4, 4, 64);
    std::vector<std::vector<unsigned char>> source = RandomShards(4, 64);
    std::vector<std::vector<unsigned char>> parity;
    archiving::ArchiveState state;

    std::vector<std::vector<unsigned char>> shortSource = source;
    shortSource[2].pop_back();
    BOOST_CHECK(!coder.Encode(shortSource, parity, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::CORRUPT_SHARD);

    state.Reset();
    BOOST_REQUIRE(coder.Encode(source, parity, state));
    std::vector<archiving::IndexedShard> all = IndexAll(source, parity);
    all[5].data.push_back(0);
    std::vector<std::vector<unsigned char>> decoded;
    BOOST_CHECK(!coder.Decode(all, decoded, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::CORRUPT_SHARD);

    state.Reset();
    source.pop_back();
    BOOST_CHECK(!coder.Encode(source, parity, state));
    BOOST_CHECK(state.GetError() == archiving::ArchiveError::INSUFFICIENT_SHARDS);
}

BOOST_AUTO_TEST_CASE(threaded_encode_matches_single)
{
    archiving::ErasureCoder coder(8, 7, 256);
    std::vector<std::vector<unsigned char>> source = RandomShards(8, 256);

    std::vector<std::vector<unsigned char>> single, threaded, oversubscribed;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, single, state, 1));
    BOOST_REQUIRE(coder.Encode(source, threaded, state, 3));
    BOOST_REQUIRE(coder.Encode(source, oversubscribed, state, 32));
    BOOST_CHECK(single == threaded);
    BOOST_CHECK(single == oversubscribed);
}

BOOST_AUTO_TEST_CASE(recover_regenerates_all_shards)
{
    archiving::ErasureCoder coder(4, 4, 64);
    std::vector<std::vector<unsigned char>> source = RandomShards(4, 64);
    std::vector<std::vector<unsigned char>> parity;
    archiving::ArchiveState state;
    BOOST_REQUIRE(coder.Encode(source, parity, state));
    std::vector<archiving::IndexedShard> all = IndexAll(source, parity);

    std::vector<archiving::IndexedShard> subset = {all[1], all[4], all[6], all[7]};
    std::vector<std::vector<unsigned char>> regenerated;
    BOOST_REQUIRE(coder.Recover(subset, regenerated, state, 2));
    BOOST_REQUIRE_EQUAL(regenerated.size(), 8u);
    for (size_t i = 0; i < all.size(); ++i) {
        BOOST_CHECK(regenerated[i] == all[i].data);
    }
}

BOOST_AUTO_TEST_SUITE_END()
