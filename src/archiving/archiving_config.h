// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ARCHIVING_CONFIG_H
#define SEGARC_ARCHIVING_ARCHIVING_CONFIG_H

/**
 * @file archiving_config.h
 * @brief Archiving configuration and initialization
 *
 * Selects the network parameter set from the command line / config file,
 * applies regtest-only parameter overrides and the encoder thread count.
 */

#include <archiving/archiving_common.h>

#include <string>

namespace archiving {

// Default values for archiving configuration
static const char* const DEFAULT_ARCHIVE_CHAIN = "main";
static const int DEFAULT_ARCHIVE_THREADS = 1;
static const int MAX_ARCHIVE_THREADS = 64;

/**
 * Get archiving help message for command-line options
 * @return Help message string
 */
std::string GetArchivingHelpMessage();

/**
 * Initialize archiving configuration from gArgs
 * Must be called after gArgs has parsed the command line and config file
 * @return true if the resulting parameter set is valid
 */
bool InitArchivingConfig();

/** Number of worker threads used to compute parity shards */
int GetArchiveThreads();
void SetArchiveThreads(int threads);

} // namespace archiving

#endif // SEGARC_ARCHIVING_ARCHIVING_CONFIG_H
