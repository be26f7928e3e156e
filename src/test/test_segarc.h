// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_TEST_TEST_SEGARC_H
#define SEGARC_TEST_TEST_SEGARC_H

#include <archiving/archiving_params.h>
#include <random.h>
#include <util.h>

#include <string>
#include <vector>

/** Basic testing setup.
 * This just configures logging, arguments and the archiving parameters.
 */
struct BasicTestingSetup {
    explicit BasicTestingSetup(const std::string& network = archiving::NETWORK_REGTEST);
    ~BasicTestingSetup();
};

/** Testing setup with a scratch directory, removed on teardown. */
struct ScratchDirTestingSetup : public BasicTestingSetup {
    fs::path pathScratch;

    explicit ScratchDirTestingSetup(const std::string& network = archiving::NETWORK_REGTEST);
    ~ScratchDirTestingSetup();
};

/** Deterministic pseudo-random bytes for test data */
std::vector<unsigned char> InsecureRandBytes(FastRandomContext& ctx, size_t len);

#endif // SEGARC_TEST_TEST_SEGARC_H
