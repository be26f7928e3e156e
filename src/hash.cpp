// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace {

const EVP_MD* SelectDigest(HashAlgorithm algo)
{
    switch (algo) {
        case HashAlgorithm::SHA256D:
        case HashAlgorithm::SHA256:
            return EVP_sha256();
        case HashAlgorithm::SHA3_256:
            return EVP_sha3_256();
    }
    throw std::runtime_error("SelectDigest: unknown hash algorithm");
}

} // anonymous namespace

std::string GetHashAlgorithmName(HashAlgorithm algo)
{
    switch (algo) {
        case HashAlgorithm::SHA256D:  return "sha256d";
        case HashAlgorithm::SHA256:   return "sha256";
        case HashAlgorithm::SHA3_256: return "sha3-256";
    }
    return "unknown";
}

bool ParseHashAlgorithm(const std::string& name, HashAlgorithm& algoOut)
{
    if (name == "sha256d") {
        algoOut = HashAlgorithm::SHA256D;
    } else if (name == "sha256") {
        algoOut = HashAlgorithm::SHA256;
    } else if (name == "sha3-256") {
        algoOut = HashAlgorithm::SHA3_256;
    } else {
        return false;
    }
    return true;
}

struct CHash256::Impl {
    EVP_MD_CTX* ctx;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr) {
            throw std::runtime_error("CHash256: EVP_MD_CTX_new failed");
        }
    }
    ~Impl() { EVP_MD_CTX_free(ctx); }
};

CHash256::CHash256(HashAlgorithm algoIn)
    : algo(algoIn), impl(new Impl())
{
    Reset();
}

CHash256::~CHash256() = default;

CHash256& CHash256::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(impl->ctx, data, len) != 1) {
        throw std::runtime_error("CHash256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CHash256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl->ctx, buf, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("CHash256: EVP_DigestFinal_ex failed");
    }
    if (algo == HashAlgorithm::SHA256D) {
        if (EVP_DigestInit_ex(impl->ctx, EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(impl->ctx, buf, len) != 1 ||
            EVP_DigestFinal_ex(impl->ctx, buf, &len) != 1) {
            throw std::runtime_error("CHash256: second SHA-256 round failed");
        }
    }
    memcpy(hash, buf, OUTPUT_SIZE);
}

CHash256& CHash256::Reset()
{
    if (EVP_DigestInit_ex(impl->ctx, SelectDigest(algo), nullptr) != 1) {
        throw std::runtime_error("CHash256: EVP_DigestInit_ex failed");
    }
    return *this;
}
