// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utiltime.h>

#include <atomic>
#include <ctime>

static std::atomic<int64_t> nMockTime(0); //!< For unit testing

int64_t GetTime()
{
    int64_t mocktime = nMockTime.load(std::memory_order_relaxed);
    if (mocktime) return mocktime;

    time_t now = time(nullptr);
    return now;
}

void SetMockTime(int64_t nMockTimeIn)
{
    nMockTime.store(nMockTimeIn, std::memory_order_relaxed);
}

int64_t GetMockTime()
{
    return nMockTime.load(std::memory_order_relaxed);
}

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    time_t t = nTime;
    struct tm ts;
    gmtime_r(&t, &ts);
    char buf[64];
    size_t len = strftime(buf, sizeof(buf), pszFormat, &ts);
    return std::string(buf, len);
}
