/* Copyright (C) 2016 PuzzleFS */
#include "blob_store.h"

#include "../util/crypto.h"

namespace puzzlefs
{

DBG_INIT_VAR(chunk_debug_level);

std::string
MemoryBlobStore::digest_of(const Buf& data)
{
    return Crypto::digest_hex(data, "sha256");
}

bool
MemoryBlobStore::put(const Buf& data, std::string* digest)
{
    std::string key = digest_of(data);
    bool stored = false;
    {
        Mutex::Lock lock(_mutex);
        auto it = _blobs.find(key);
        if (it == _blobs.end()) {
            _blobs.insert(std::make_pair(key, data));
            _stored_bytes += data.length();
            stored = true;
        } else {
            _dedup_bytes += data.length();
        }
    }
    DBG3("MemoryBlobStore::put: " << key << " " << DVAL(data.length()) << DVAL(stored));
    if (digest) *digest = key;
    return stored;
}

bool
MemoryBlobStore::has(const std::string& digest) const
{
    Mutex::Lock lock(_mutex);
    return _blobs.find(digest) != _blobs.end();
}

Buf
MemoryBlobStore::get(const std::string& digest) const
{
    Mutex::Lock lock(_mutex);
    auto it = _blobs.find(digest);
    if (it == _blobs.end()) return Buf();
    return it->second;
}

int64_t
MemoryBlobStore::stored_bytes() const
{
    Mutex::Lock lock(_mutex);
    return _stored_bytes;
}

int64_t
MemoryBlobStore::dedup_bytes() const
{
    Mutex::Lock lock(_mutex);
    return _dedup_bytes;
}

size_t
MemoryBlobStore::num_blobs() const
{
    Mutex::Lock lock(_mutex);
    return _blobs.size();
}

size_t
ingest_chunks(StreamChunker& chunker, BlobStore& store, std::vector<FileChunkRef>& refs)
{
    std::vector<ChunkWithData> chunks;
    chunker.drain(chunks);
    for (const ChunkWithData& chunk : chunks) {
        FileChunkRef ref;
        store.put(chunk.data, &ref.digest);
        ref.offset = chunk.offset;
        ref.length = chunk.length;
        refs.push_back(ref);
    }
    return chunks.size();
}

} // namespace puzzlefs
