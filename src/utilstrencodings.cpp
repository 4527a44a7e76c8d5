// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utilstrencodings.h>

#include <tinyformat.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

const signed char p_util_hexdigit[256] =
{ -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  0,1,2,3,4,5,6,7,8,9,-1,-1,-1,-1,-1,-1,
  -1,0xa,0xb,0xc,0xd,0xe,0xf,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,0xa,0xb,0xc,0xd,0xe,0xf,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
  -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1, };

signed char HexDigit(char c)
{
    return p_util_hexdigit[(unsigned char)c];
}

bool IsHex(const std::string& str)
{
    for(std::string::const_iterator it(str.begin()); it != str.end(); ++it)
    {
        if (HexDigit(*it) < 0)
            return false;
    }
    return (str.size() > 0) && (str.size()%2 == 0);
}

std::vector<unsigned char> ParseHex(const char* psz)
{
    // convert hex dump to vector
    std::vector<unsigned char> vch;
    while (true)
    {
        while (isspace(*psz))
            psz++;
        signed char c = HexDigit(*psz++);
        if (c == (signed char)-1)
            break;
        unsigned char n = (c << 4);
        c = HexDigit(*psz++);
        if (c == (signed char)-1)
            break;
        n |= c;
        vch.push_back(n);
    }
    return vch;
}

std::vector<unsigned char> ParseHex(const std::string& str)
{
    return ParseHex(str.c_str());
}

bool ParseInt64(const std::string& str, int64_t *out)
{
    if (str.empty() || isspace(str[0]) || isspace(str[str.size()-1])) // No padding allowed
        return false;
    if (str.size() != strlen(str.c_str())) // No embedded NUL characters allowed
        return false;
    char *endp = nullptr;
    errno = 0; // strtoll will not set errno if valid
    long long int n = strtoll(str.c_str(), &endp, 10);
    if(out) *out = (int64_t)n;
    // Note that strtoll returns a *long long int*, so even if strtol doesn't report an over/underflow
    // we still have to check that the returned value is within the range of an *int64_t*.
    return endp && *endp == 0 && !errno &&
        n >= std::numeric_limits<int64_t>::min() &&
        n <= std::numeric_limits<int64_t>::max();
}

bool ParseFixedPoint(const std::string& val, int decimals, int64_t *amount_out)
{
    if (val.empty() || decimals < 0 || decimals > 18) {
        return false;
    }

    std::string::size_type dot = val.find('.');
    std::string whole = val.substr(0, dot);
    std::string frac = dot == std::string::npos ? std::string() : val.substr(dot + 1);
    if (whole.empty() || frac.size() > (size_t)decimals) {
        return false;
    }
    for (char c : whole + frac) {
        if (c < '0' || c > '9') return false;
    }
    frac.append(decimals - frac.size(), '0');

    int64_t nWhole = 0;
    int64_t nFrac = 0;
    if (!ParseInt64(whole, &nWhole) || (!frac.empty() && !ParseInt64(frac, &nFrac))) {
        return false;
    }

    int64_t scale = 1;
    for (int i = 0; i < decimals; ++i) scale *= 10;
    if (nWhole > (std::numeric_limits<int64_t>::max() - nFrac) / scale) {
        return false;
    }
    if (amount_out) *amount_out = nWhole * scale + nFrac;
    return true;
}

std::string FormatMoney(int64_t n)
{
    // Note: not using straight sprintf here because we do NOT want
    // localized number formatting.
    static const int64_t COIN_UNITS = 100000000;
    int64_t n_abs = (n > 0 ? n : -n);
    int64_t quotient = n_abs / COIN_UNITS;
    int64_t remainder = n_abs % COIN_UNITS;
    std::string str = tfm::format("%d.%08d", quotient, remainder);

    if (n < 0)
        str.insert((unsigned int)0, 1, '-');
    return str;
}
