// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/test_segarc.h>

#include <archiving/archiving_config.h>

#include <boost/filesystem/operations.hpp>

BasicTestingSetup::BasicTestingSetup(const std::string& network)
{
    fPrintToDebugLog = false; // don't want to write to debug.log file
    fPrintToConsole = false;
    gArgs.ClearArgs();
    archiving::ResetRegtestArchivingParams();
    archiving::SelectArchivingParams(network);
    archiving::SetArchiveThreads(archiving::DEFAULT_ARCHIVE_THREADS);
}

BasicTestingSetup::~BasicTestingSetup()
{
    gArgs.ClearArgs();
    archiving::ResetRegtestArchivingParams();
    archiving::SelectArchivingParams(archiving::NETWORK_REGTEST);
}

ScratchDirTestingSetup::ScratchDirTestingSetup(const std::string& network)
    : BasicTestingSetup(network)
{
    pathScratch = fs::temp_directory_path() / fs::unique_path("test_segarc_%%%%_%%%%_%%%%");
    fs::create_directories(pathScratch);
}

ScratchDirTestingSetup::~ScratchDirTestingSetup()
{
    boost::system::error_code ec;
    fs::remove_all(pathScratch, ec);
}

std::vector<unsigned char> InsecureRandBytes(FastRandomContext& ctx, size_t len)
{
    return ctx.randbytes(len);
}
