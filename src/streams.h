// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_STREAMS_H
#define WEFI_STREAMS_H

#include <serialize.h>

#include <cstring>
#include <ios>
#include <stdint.h>
#include <string>
#include <vector>

/** Double ended buffer combining vector and stream-like interfaces.
 *
 * >> and << read and write unformatted data using the above serialization templates.
 * Fills with data in linear time; some stringstream implementations take N^2 time.
 */
class CDataStream
{
protected:
    typedef std::vector<char> vector_type;
    vector_type vch;
    unsigned int nReadPos;

    int nType;
    int nVersion;
public:

    typedef vector_type::size_type       size_type;
    typedef vector_type::const_iterator  const_iterator;
    typedef vector_type::value_type      value_type;

    explicit CDataStream(int nTypeIn, int nVersionIn)
        : nReadPos(0), nType(nTypeIn), nVersion(nVersionIn) {}

    CDataStream(const std::vector<unsigned char>& vchIn, int nTypeIn, int nVersionIn)
        : vch(vchIn.begin(), vchIn.end()), nReadPos(0), nType(nTypeIn), nVersion(nVersionIn) {}

    CDataStream(const char* pbegin, const char* pend, int nTypeIn, int nVersionIn)
        : vch(pbegin, pend), nReadPos(0), nType(nTypeIn), nVersion(nVersionIn) {}

    std::string str() const
    {
        return (std::string(begin(), end()));
    }

    //
    // Vector subset
    //
    const_iterator begin() const                     { return vch.begin() + nReadPos; }
    const_iterator end() const                       { return vch.end(); }
    size_type size() const                           { return vch.size() - nReadPos; }
    bool empty() const                               { return vch.size() == nReadPos; }
    const value_type* data() const                   { return vch.data() + nReadPos; }
    void clear()                                     { vch.clear(); nReadPos = 0; }

    int GetType() const          { return nType; }
    int GetVersion() const       { return nVersion; }

    void read(char* pch, size_t nSize)
    {
        if (nSize == 0) return;

        // Read from the beginning of the buffer
        unsigned int nReadPosNext = nReadPos + nSize;
        if (nReadPosNext > vch.size()) {
            throw std::ios_base::failure("CDataStream::read(): end of data");
        }
        memcpy(pch, &vch[nReadPos], nSize);
        if (nReadPosNext == vch.size())
        {
            nReadPos = 0;
            vch.clear();
            return;
        }
        nReadPos = nReadPosNext;
    }

    void write(const char* pch, size_t nSize)
    {
        // Write to the end of the buffer
        vch.insert(vch.end(), pch, pch + nSize);
    }

    template<typename T>
    CDataStream& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }

    template<typename T>
    CDataStream& operator>>(T&& obj)
    {
        // Unserialize from this stream
        ::Unserialize(*this, obj);
        return (*this);
    }
};

#endif // WEFI_STREAMS_H
