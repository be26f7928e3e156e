// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_HASH_H
#define SEGARC_HASH_H

#include <serialize.h>
#include <uint256.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/** Digest functions a network may select for its commitments. */
enum class HashAlgorithm : uint8_t {
    SHA256D = 0,    // SHA-256 applied twice (default)
    SHA256 = 1,
    SHA3_256 = 2,
};

/** Canonical lower-case name, e.g. "sha256d". */
std::string GetHashAlgorithmName(HashAlgorithm algo);

/** Parse a name produced by GetHashAlgorithmName(). */
bool ParseHashAlgorithm(const std::string& name, HashAlgorithm& algoOut);

/** Incremental 256-bit digest over one of the supported algorithms. */
class CHash256
{
public:
    static const size_t OUTPUT_SIZE = 32;

    explicit CHash256(HashAlgorithm algo = HashAlgorithm::SHA256D);
    ~CHash256();

    CHash256(const CHash256&) = delete;
    CHash256& operator=(const CHash256&) = delete;

    CHash256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CHash256& Reset();

    HashAlgorithm GetAlgorithm() const { return algo; }

private:
    struct Impl;
    HashAlgorithm algo;
    std::unique_ptr<Impl> impl;
};

/** Compute the 256-bit hash of an object. */
template<typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend, HashAlgorithm algo = HashAlgorithm::SHA256D)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256(algo).Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
                  .Finalize((unsigned char*)&result);
    return result;
}

/** Compute the 256-bit hash of the concatenation of two objects. */
template<typename T1, typename T2>
inline uint256 Hash(const T1 p1begin, const T1 p1end,
                    const T2 p2begin, const T2 p2end,
                    HashAlgorithm algo = HashAlgorithm::SHA256D)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256(algo).Write(p1begin == p1end ? pblank : (const unsigned char*)&p1begin[0], (p1end - p1begin) * sizeof(p1begin[0]))
                  .Write(p2begin == p2end ? pblank : (const unsigned char*)&p2begin[0], (p2end - p2begin) * sizeof(p2begin[0]))
                  .Finalize((unsigned char*)&result);
    return result;
}

/** A writer stream (for serialization) that computes a 256-bit hash. */
class CHashWriter
{
private:
    CHash256 ctx;

    const int nType;
    const int nVersion;
public:

    CHashWriter(int nTypeIn, int nVersionIn, HashAlgorithm algo = HashAlgorithm::SHA256D)
        : ctx(algo), nType(nTypeIn), nVersion(nVersionIn) {}

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char *pch, size_t size) {
        ctx.Write((const unsigned char*)pch, size);
    }

    // invalidates the object
    uint256 GetHash() {
        uint256 result;
        ctx.Finalize((unsigned char*)&result);
        return result;
    }

    template<typename T>
    CHashWriter& operator<<(const T& obj) {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

#endif // SEGARC_HASH_H
