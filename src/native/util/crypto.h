/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <openssl/evp.h>

#include "buf.h"
#include "common.h"

namespace puzzlefs
{

class Crypto
{
public:
    /**
     * incremental digest, used when the data arrives in pieces.
     */
    class Digest
    {
    public:
        explicit Digest(const char* digest_name);
        ~Digest();

        void update(const void* data, size_t len);

        // can be called once
        Buf result();

    private:
        Digest(const Digest&) = delete;
        Digest& operator=(const Digest&) = delete;
        const EVP_MD* _md;
        EVP_MD_CTX* _ctx;
    };

    static Buf
    digest(const Buf& buf, const char* digest_name)
    {
        Digest d(digest_name);
        d.update(buf.data(), buf.length());
        return d.result();
    }

    static std::string
    digest_hex(const Buf& buf, const char* digest_name)
    {
        return digest(buf, digest_name).hex();
    }
};

} // namespace puzzlefs
