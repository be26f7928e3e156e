// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/erasure_coding.h>

#include <util.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <stdexcept>
#include <thread>

namespace archiving {

// ============================================================================
// GF(2^8)
// ============================================================================

GF256::Tables::Tables()
{
    uint16_t x = 1;
    for (int i = 0; i < 255; ++i) {
        exp[i] = static_cast<uint8_t>(x);
        log[x] = static_cast<uint8_t>(i);
        x <<= 1;
        if (x & 0x100) {
            x ^= GF256_PRIMITIVE_POLY;
        }
    }
    // Doubled so Mul can index exp[log a + log b] without a modulo
    for (int i = 255; i < 512; ++i) {
        exp[i] = exp[i - 255];
    }
    log[0] = 0;
}

const GF256::Tables& GF256::GetTables()
{
    static const Tables tables;
    return tables;
}

uint8_t GF256::Mul(uint8_t a, uint8_t b)
{
    if (a == 0 || b == 0) {
        return 0;
    }
    const Tables& t = GetTables();
    return t.exp[t.log[a] + t.log[b]];
}

uint8_t GF256::Div(uint8_t a, uint8_t b)
{
    if (b == 0) {
        throw std::domain_error("GF256::Div: division by zero");
    }
    if (a == 0) {
        return 0;
    }
    const Tables& t = GetTables();
    return t.exp[t.log[a] + 255 - t.log[b]];
}

uint8_t GF256::Inv(uint8_t a)
{
    return Div(1, a);
}

void GF256::MulAddRegion(uint8_t coef, const unsigned char* src, unsigned char* dst, size_t len)
{
    if (coef == 0) {
        return;
    }
    if (coef == 1) {
        for (size_t i = 0; i < len; ++i) {
            dst[i] ^= src[i];
        }
        return;
    }
    const Tables& t = GetTables();
    const unsigned int logCoef = t.log[coef];
    for (size_t i = 0; i < len; ++i) {
        if (src[i] != 0) {
            dst[i] ^= t.exp[logCoef + t.log[src[i]]];
        }
    }
}

// ============================================================================
// Reed-Solomon coder
// ============================================================================

ErasureCoder::ErasureCoder(uint32_t nSourceShardsIn, uint32_t nParityShardsIn, uint32_t nShardSizeIn)
    : nSourceShards(nSourceShardsIn), nParityShards(nParityShardsIn), nShardSize(nShardSizeIn)
{
    if (nSourceShards == 0 || nParityShards == 0) {
        throw std::runtime_error("ErasureCoder: shard counts must be non-zero");
    }
    if (nSourceShards + nParityShards > MAX_TOTAL_SHARDS) {
        throw std::runtime_error(strprintf("ErasureCoder: %u + %u shards exceed %u",
                                           nSourceShards, nParityShards, MAX_TOTAL_SHARDS));
    }
    if (nShardSize == 0) {
        throw std::runtime_error("ErasureCoder: shard size must be non-zero");
    }

    parityMatrix.assign(nParityShards, std::vector<uint8_t>(nSourceShards));
    for (uint32_t i = 0; i < nParityShards; ++i) {
        const uint8_t x = static_cast<uint8_t>(nSourceShards + i);
        for (uint32_t j = 0; j < nSourceShards; ++j) {
            const uint8_t y = static_cast<uint8_t>(j);
            parityMatrix[i][j] = GF256::Inv(x ^ y);
        }
    }
}

void ErasureCoder::EncodeRows(const std::vector<std::vector<unsigned char>>& sourceShards,
                              std::vector<std::vector<unsigned char>>& parityShards,
                              uint32_t firstRow, uint32_t endRow) const
{
    for (uint32_t row = firstRow; row < endRow; ++row) {
        std::vector<unsigned char>& parity = parityShards[row];
        parity.assign(nShardSize, 0);
        for (uint32_t col = 0; col < nSourceShards; ++col) {
            GF256::MulAddRegion(parityMatrix[row][col], sourceShards[col].data(), parity.data(), nShardSize);
        }
    }
}

bool ErasureCoder::Encode(const std::vector<std::vector<unsigned char>>& sourceShards,
                          std::vector<std::vector<unsigned char>>& parityShardsOut,
                          ArchiveState& state, int nThreads) const
{
    if (sourceShards.size() != nSourceShards) {
        return state.Invalid(ArchiveError::INSUFFICIENT_SHARDS, "wrong-source-shard-count",
                             strprintf("have %u, need %u", sourceShards.size(), nSourceShards));
    }
    for (size_t i = 0; i < sourceShards.size(); ++i) {
        if (sourceShards[i].size() != nShardSize) {
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "bad-shard-size",
                                 strprintf("source shard %u has %u bytes, expected %u",
                                           i, sourceShards[i].size(), nShardSize));
        }
    }

    std::vector<std::vector<unsigned char>> parity(nParityShards);

    const uint32_t nWorkers = std::max<uint32_t>(1, std::min<uint32_t>(nThreads > 0 ? nThreads : 1, nParityShards));
    if (nWorkers == 1) {
        EncodeRows(sourceShards, parity, 0, nParityShards);
    } else {
        // Each worker owns a disjoint range of parity rows
        std::vector<std::thread> workers;
        workers.reserve(nWorkers);
        const uint32_t rowsPerWorker = (nParityShards + nWorkers - 1) / nWorkers;
        for (uint32_t w = 0; w < nWorkers; ++w) {
            const uint32_t first = w * rowsPerWorker;
            const uint32_t end = std::min(nParityShards, first + rowsPerWorker);
            if (first >= end) {
                break;
            }
            workers.emplace_back([this, &sourceShards, &parity, first, end]() {
                EncodeRows(sourceShards, parity, first, end);
            });
        }
        for (std::thread& worker : workers) {
            worker.join();
        }
    }

    LogPrint(BCLog::ERASURE, "ErasureCoder: encoded %u parity shards of %u bytes (%u threads)\n",
             nParityShards, nShardSize, nWorkers);

    parityShardsOut = std::move(parity);
    return true;
}

/** Invert a square matrix over GF(2^8) by Gauss-Jordan elimination */
static bool InvertMatrix(std::vector<std::vector<uint8_t>>& matrix)
{
    const size_t n = matrix.size();
    std::vector<std::vector<uint8_t>> inverse(n, std::vector<uint8_t>(n, 0));
    for (size_t i = 0; i < n; ++i) {
        inverse[i][i] = 1;
    }

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        while (pivot < n && matrix[pivot][col] == 0) {
            ++pivot;
        }
        if (pivot == n) {
            return false;
        }
        std::swap(matrix[pivot], matrix[col]);
        std::swap(inverse[pivot], inverse[col]);

        const uint8_t scale = GF256::Inv(matrix[col][col]);
        for (size_t j = 0; j < n; ++j) {
            matrix[col][j] = GF256::Mul(matrix[col][j], scale);
            inverse[col][j] = GF256::Mul(inverse[col][j], scale);
        }

        for (size_t row = 0; row < n; ++row) {
            if (row == col || matrix[row][col] == 0) {
                continue;
            }
            const uint8_t factor = matrix[row][col];
            for (size_t j = 0; j < n; ++j) {
                matrix[row][j] ^= GF256::Mul(factor, matrix[col][j]);
                inverse[row][j] ^= GF256::Mul(factor, inverse[col][j]);
            }
        }
    }

    matrix = std::move(inverse);
    return true;
}

bool ErasureCoder::Decode(const std::vector<IndexedShard>& shards,
                          std::vector<std::vector<unsigned char>>& sourceShardsOut,
                          ArchiveState& state) const
{
    // Index -> shard, first occurrence wins
    std::map<uint32_t, const IndexedShard*> available;
    for (const IndexedShard& shard : shards) {
        if (shard.data.size() != nShardSize) {
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "bad-shard-size",
                                 strprintf("shard %u has %u bytes, expected %u",
                                           shard.index, shard.data.size(), nShardSize));
        }
        if (shard.index >= GetTotalShards()) {
            LogPrint(BCLog::ERASURE, "ErasureCoder: ignoring shard with index %u (total %u)\n",
                     shard.index, GetTotalShards());
            continue;
        }
        available.emplace(shard.index, &shard);
    }

    if (available.size() < nSourceShards) {
        return state.Invalid(ArchiveError::INSUFFICIENT_SHARDS, "insufficient-shards",
                             strprintf("have %u distinct shards, need %u", available.size(), nSourceShards));
    }

    // Lowest indices first, so every available source shard is used directly
    std::vector<const IndexedShard*> chosen;
    chosen.reserve(nSourceShards);
    for (const auto& entry : available) {
        if (chosen.size() == nSourceShards) break;
        chosen.push_back(entry.second);
    }

    std::vector<std::vector<unsigned char>> source(nSourceShards);
    std::vector<uint32_t> missing;
    for (const IndexedShard* shard : chosen) {
        if (shard->index < nSourceShards) {
            source[shard->index] = shard->data;
        }
    }
    for (uint32_t i = 0; i < nSourceShards; ++i) {
        if (source[i].empty()) {
            missing.push_back(i);
        }
    }

    if (!missing.empty()) {
        // Rows of the generator matrix [I; C] for the chosen shards
        std::vector<std::vector<uint8_t>> matrix(nSourceShards, std::vector<uint8_t>(nSourceShards, 0));
        for (size_t r = 0; r < chosen.size(); ++r) {
            const uint32_t index = chosen[r]->index;
            if (index < nSourceShards) {
                matrix[r][index] = 1;
            } else {
                matrix[r] = parityMatrix[index - nSourceShards];
            }
        }
        if (!InvertMatrix(matrix)) {
            // Unreachable for a Cauchy generator; reported rather than trusted
            return state.Invalid(ArchiveError::CORRUPT_SHARD, "singular-decode-matrix");
        }
        for (uint32_t i : missing) {
            std::vector<unsigned char>& out = source[i];
            out.assign(nShardSize, 0);
            for (size_t r = 0; r < chosen.size(); ++r) {
                GF256::MulAddRegion(matrix[i][r], chosen[r]->data.data(), out.data(), nShardSize);
            }
        }
        LogPrint(BCLog::ERASURE, "ErasureCoder: recovered %u missing source shards\n", missing.size());
    }

    sourceShardsOut = std::move(source);
    return true;
}

bool ErasureCoder::Recover(const std::vector<IndexedShard>& shards,
                           std::vector<std::vector<unsigned char>>& allShardsOut,
                           ArchiveState& state, int nThreads) const
{
    std::vector<std::vector<unsigned char>> source;
    if (!Decode(shards, source, state)) {
        return false;
    }
    std::vector<std::vector<unsigned char>> parity;
    if (!Encode(source, parity, state, nThreads)) {
        return false;
    }
    allShardsOut = std::move(source);
    allShardsOut.insert(allShardsOut.end(),
                        std::make_move_iterator(parity.begin()),
                        std::make_move_iterator(parity.end()));
    return true;
}

} // namespace archiving
