// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ERASURE_CODING_H
#define SEGARC_ARCHIVING_ERASURE_CODING_H

/**
 * @file erasure_coding.h
 * @brief Systematic Reed-Solomon erasure coding over GF(2^8)
 *
 * k source shards are extended by m parity shards such that any k of the
 * k + m shards reconstruct the source shards exactly (MDS). Parity shard i
 * is the GF(2^8) dot product of the source shards with row i of the Cauchy
 * matrix C[i][j] = 1 / ((k + i) XOR j). Because every square submatrix of a
 * Cauchy matrix is non-singular, any k rows of [I; C] form an invertible
 * system, which is what Decode() solves.
 *
 * Field: GF(2^8) with primitive polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11d).
 */

#include <archiving/archiving_common.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace archiving {

/** Primitive polynomial generating GF(2^8) */
static constexpr uint16_t GF256_PRIMITIVE_POLY = 0x11d;

/**
 * @brief Arithmetic in GF(2^8) using log/antilog tables
 */
class GF256 {
public:
    static uint8_t Add(uint8_t a, uint8_t b) { return a ^ b; }
    static uint8_t Mul(uint8_t a, uint8_t b);
    /** a / b; b must be non-zero */
    static uint8_t Div(uint8_t a, uint8_t b);
    /** Multiplicative inverse; a must be non-zero */
    static uint8_t Inv(uint8_t a);

    /** dst[i] ^= coef * src[i] for i in [0, len) */
    static void MulAddRegion(uint8_t coef, const unsigned char* src, unsigned char* dst, size_t len);

private:
    struct Tables {
        std::array<uint8_t, 256> log;
        std::array<uint8_t, 512> exp;
        Tables();
    };
    static const Tables& GetTables();
};

/**
 * @brief A shard together with its position among the k + m shards
 */
struct IndexedShard {
    uint32_t index;
    std::vector<unsigned char> data;

    IndexedShard() : index(0) {}
    IndexedShard(uint32_t indexIn, std::vector<unsigned char> dataIn)
        : index(indexIn), data(std::move(dataIn)) {}
};

class ErasureCoder {
private:
    uint32_t nSourceShards;
    uint32_t nParityShards;
    uint32_t nShardSize;

    /** Cauchy parity matrix, m rows of k coefficients */
    std::vector<std::vector<uint8_t>> parityMatrix;

    void EncodeRows(const std::vector<std::vector<unsigned char>>& sourceShards,
                    std::vector<std::vector<unsigned char>>& parityShards,
                    uint32_t firstRow, uint32_t endRow) const;

public:
    /**
     * @throws std::runtime_error if k or m is zero, k + m exceeds 256 or
     *         the shard size is zero
     */
    ErasureCoder(uint32_t nSourceShardsIn, uint32_t nParityShardsIn, uint32_t nShardSizeIn);

    uint32_t GetSourceShards() const { return nSourceShards; }
    uint32_t GetParityShards() const { return nParityShards; }
    uint32_t GetTotalShards() const { return nSourceShards + nParityShards; }
    uint32_t GetShardSize() const { return nShardSize; }

    /** Coefficient of source shard col in parity shard row */
    uint8_t GetParityCoefficient(uint32_t row, uint32_t col) const { return parityMatrix[row][col]; }

    /**
     * Compute the m parity shards of k source shards.
     * Parity rows are split across nThreads worker threads.
     * Fails with CORRUPT_SHARD if a source shard has the wrong size and
     * INSUFFICIENT_SHARDS if the shard count is not k.
     */
    bool Encode(const std::vector<std::vector<unsigned char>>& sourceShards,
                std::vector<std::vector<unsigned char>>& parityShardsOut,
                ArchiveState& state, int nThreads = 1) const;

    /**
     * Recover the k source shards from any k distinct shards.
     * Shards with an out-of-range index and repeated indices are ignored.
     * Fails with CORRUPT_SHARD if a supplied shard has the wrong size and
     * INSUFFICIENT_SHARDS if fewer than k distinct valid shards remain.
     */
    bool Decode(const std::vector<IndexedShard>& shards,
                std::vector<std::vector<unsigned char>>& sourceShardsOut,
                ArchiveState& state) const;

    /** Decode, then re-encode to regenerate all k + m shards */
    bool Recover(const std::vector<IndexedShard>& shards,
                 std::vector<std::vector<unsigned char>>& allShardsOut,
                 ArchiveState& state, int nThreads = 1) const;
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_ERASURE_CODING_H
