// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <util.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include <openssl/rand.h>

[[noreturn]] static void RandFailure()
{
    LogPrintf("Failed to read randomness, aborting\n");
    std::abort();
}

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        RandFailure();
    }
}

static inline uint64_t rotl(const uint64_t x, int k)
{
    return (x << k) | (x >> (64 - k));
}

static uint64_t SplitMix64(uint64_t& x)
{
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

FastRandomContext::FastRandomContext(bool fDeterministic) : requires_seed(!fDeterministic), bitbuf_size(0)
{
    uint64_t seed = 0;
    for (int i = 0; i < 4; ++i) {
        state[i] = SplitMix64(seed);
    }
}

FastRandomContext::FastRandomContext(const uint256& seed) : requires_seed(false), bitbuf_size(0)
{
    uint64_t s = 0;
    memcpy(&s, seed.begin(), sizeof(s));
    for (int i = 0; i < 4; ++i) {
        state[i] = SplitMix64(s);
    }
}

void FastRandomContext::RandomSeed()
{
    uint64_t seed = 0;
    GetRandBytes((unsigned char*)&seed, sizeof(seed));
    for (int i = 0; i < 4; ++i) {
        state[i] = SplitMix64(seed);
    }
    requires_seed = false;
}

uint64_t FastRandomContext::rand64()
{
    if (requires_seed) RandomSeed();

    // xoshiro256**
    const uint64_t result = rotl(state[1] * 5, 7) * 9;
    const uint64_t t = state[1] << 17;
    state[2] ^= state[0];
    state[3] ^= state[1];
    state[1] ^= state[2];
    state[0] ^= state[3];
    state[2] ^= t;
    state[3] = rotl(state[3], 45);
    return result;
}

std::vector<unsigned char> FastRandomContext::randbytes(size_t len)
{
    std::vector<unsigned char> ret(len);
    for (size_t i = 0; i < len; i += 8) {
        uint64_t v = rand64();
        memcpy(ret.data() + i, &v, std::min<size_t>(8, len - i));
    }
    return ret;
}

uint256 FastRandomContext::rand256()
{
    uint256 ret;
    for (int i = 0; i < 4; ++i) {
        uint64_t v = rand64();
        memcpy(ret.begin() + i * 8, &v, 8);
    }
    return ret;
}
