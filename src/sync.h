// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_SYNC_H
#define WEFI_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking, so a component may call its own
 * locked accessors while already holding its lock.
 */
typedef std::recursive_mutex CCriticalSection;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::lock_guard<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // WEFI_SYNC_H
