// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_PUBKEY_H
#define WEFI_PUBKEY_H

#include <hash.h>
#include <uint256.h>

#include <cstring>
#include <vector>

/** A reference to a CKey: the Hash160 of its serialized public key */
class CKeyID : public uint160
{
public:
    CKeyID() : uint160() {}
    explicit CKeyID(const uint160& in) : uint160(in) {}
};

/**
 * A secp256k1 public key in its serialized form, 33 bytes compressed or
 * 65 bytes uncompressed. Voucher signers are identified by GetID().
 */
class CPubKey
{
public:
    static const unsigned int PUBLIC_KEY_SIZE             = 65;
    static const unsigned int COMPRESSED_PUBLIC_KEY_SIZE  = 33;
    static const unsigned int COMPACT_SIGNATURE_SIZE      = 65;

private:
    /** Serialized key; the first byte determines the length. 0xFF marks an invalid key. */
    unsigned char vch[PUBLIC_KEY_SIZE];

    static unsigned int GetLen(unsigned char chHeader)
    {
        if (chHeader == 2 || chHeader == 3)
            return COMPRESSED_PUBLIC_KEY_SIZE;
        if (chHeader == 4 || chHeader == 6 || chHeader == 7)
            return PUBLIC_KEY_SIZE;
        return 0;
    }

    void Invalidate() { vch[0] = 0xFF; }

public:
    CPubKey() { Invalidate(); }

    template <typename T>
    void Set(const T pbegin, const T pend)
    {
        int len = pend == pbegin ? 0 : GetLen(pbegin[0]);
        if (len && len == (pend - pbegin))
            memcpy(vch, (unsigned char*)&pbegin[0], len);
        else
            Invalidate();
    }

    explicit CPubKey(const std::vector<unsigned char>& vchIn)
    {
        Set(vchIn.begin(), vchIn.end());
    }

    unsigned int size() const { return GetLen(vch[0]); }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return a.vch[0] == b.vch[0] &&
               memcmp(a.vch, b.vch, a.size()) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }

    /** Account id of the key holder: Hash160 of the serialized key */
    CKeyID GetID() const
    {
        return CKeyID(Hash160(vch, vch + size()));
    }

    /** Length matches the header byte; says nothing about the curve point */
    bool IsValid() const { return size() > 0; }

    /** Parses as a point on the curve */
    bool IsFullyValid() const;

    bool IsCompressed() const { return size() == COMPRESSED_PUBLIC_KEY_SIZE; }

    /**
     * True if the compact signature has a well formed header and a
     * normalized (lower half) S value. Its high-S twin recovers the same
     * key, so only the low-S form is accepted.
     */
    static bool CheckLowSCompact(const std::vector<unsigned char>& vchSig);

    /** Replace this key with the one recovered from a compact signature over hash */
    bool RecoverCompact(const uint256& hash, const std::vector<unsigned char>& vchSig);
};

/** Users of this module must hold an ECCVerifyHandle. The constructor and
 *  destructor of these are not allowed to run in parallel, though. */
class ECCVerifyHandle
{
    static int refcount;

public:
    ECCVerifyHandle();
    ~ECCVerifyHandle();
};

#endif // WEFI_PUBKEY_H
