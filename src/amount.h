// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_AMOUNT_H
#define WEFI_AMOUNT_H

#include <stdint.h>

/** Amount in token base units (can be negative) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;
static const CAmount CENT = 1000000;

/** No single amount handled by the distributor can exceed this */
static const CAmount MAX_MONEY = 2000000000 * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif //  WEFI_AMOUNT_H
