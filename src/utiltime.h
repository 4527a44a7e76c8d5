// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_UTILTIME_H
#define WEFI_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, but also supports mocktime,
 * where the time can be specified by the user, eg for testing (eg with the
 * -mocktime command line option).
 */
int64_t GetTime();
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // WEFI_UTILTIME_H
