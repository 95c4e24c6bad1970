/* Copyright (C) 2016 PuzzleFS */
#include "crypto.h"

namespace puzzlefs
{

Crypto::Digest::Digest(const char* digest_name)
    : _md(EVP_get_digestbyname(digest_name))
    , _ctx(0)
{
    if (!_md) {
        throw Exception(XSTR() << "unknown digest " << digest_name);
    }
    _ctx = EVP_MD_CTX_new();
    MUST1(_ctx);
    MUST1(EVP_DigestInit_ex(_ctx, _md, NULL));
}

Crypto::Digest::~Digest()
{
    EVP_MD_CTX_free(_ctx);
}

void
Crypto::Digest::update(const void* data, size_t len)
{
    MUST1(EVP_DigestUpdate(_ctx, data, len));
}

Buf
Crypto::Digest::result()
{
    Buf digest(EVP_MD_size(_md));
    unsigned int digest_len = 0;
    MUST1(EVP_DigestFinal_ex(_ctx, digest.data(), &digest_len));
    digest.slice(0, digest_len);
    return digest;
}

} // namespace puzzlefs
