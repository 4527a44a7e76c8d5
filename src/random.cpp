// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <hash.h>
#include <util.h>

#include <openssl/rand.h>

#include <cstring>
#include <limits>
#include <stdlib.h>

[[noreturn]] static void RandFailure()
{
    LogPrintf("Failed to read randomness, aborting\n");
    abort();
}

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        RandFailure();
    }
}

uint64_t GetRand(uint64_t nMax)
{
    if (nMax == 0)
        return 0;

    // The range of the random source must be a multiple of the modulus
    // to give every possible output value an equal possibility
    uint64_t nRange = (std::numeric_limits<uint64_t>::max() / nMax) * nMax;
    uint64_t nRand = 0;
    do {
        GetRandBytes((unsigned char*)&nRand, sizeof(nRand));
    } while (nRand >= nRange);
    return (nRand % nMax);
}

uint256 GetRandHash()
{
    uint256 hash;
    GetRandBytes((unsigned char*)&hash, sizeof(hash));
    return hash;
}

FastRandomContext::FastRandomContext(bool fDeterministic) : counter(0), bufferPos(32)
{
    if (!fDeterministic) {
        seed = GetRandHash();
    }
}

FastRandomContext::FastRandomContext(const uint256& seedIn) : seed(seedIn), counter(0), bufferPos(32)
{
}

void FastRandomContext::Refill()
{
    CHash256().Write(seed.begin(), seed.size())
              .Write((const unsigned char*)&counter, sizeof(counter))
              .Finalize(buffer);
    ++counter;
    bufferPos = 0;
}

uint64_t FastRandomContext::rand64()
{
    if (bufferPos + 8 > 32) Refill();
    uint64_t ret = 0;
    for (int i = 0; i < 8; ++i) {
        ret |= ((uint64_t)buffer[bufferPos + i]) << (8 * i);
    }
    bufferPos += 8;
    return ret;
}

uint256 FastRandomContext::rand256()
{
    uint256 ret;
    for (int i = 0; i < 4; ++i) {
        uint64_t word = rand64();
        memcpy(ret.begin() + i * 8, &word, 8);
    }
    return ret;
}
