// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_SYNC_H
#define SEGARC_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking, so a method holding the lock
 * may call other locking methods of the same object.
 */
class CCriticalSection : public std::recursive_mutex
{
};

typedef std::unique_lock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // SEGARC_SYNC_H
