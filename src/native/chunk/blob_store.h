/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <map>
#include <string>
#include <vector>

#include "../util/buf.h"
#include "../util/mutex.h"
#include "chunk_queue.h"
#include "stream_chunker.h"

namespace puzzlefs
{

/**
 * BlobStore keeps blobs keyed by the digest of their content,
 * so identical chunks of different files or images are stored once.
 */
class BlobStore
{
public:
    virtual ~BlobStore() {}

    /**
     * stores the blob and sets *digest to its key.
     * returns false when a blob with the same digest was already stored.
     */
    virtual bool put(const Buf& data, std::string* digest) = 0;

    virtual bool has(const std::string& digest) const = 0;

    // returns an empty buf when missing
    virtual Buf get(const std::string& digest) const = 0;
};

/**
 * In memory blob store keyed by the lowercase hex sha256 of the blob.
 * Safe to use from multiple threads.
 */
class MemoryBlobStore : public BlobStore
{
public:
    MemoryBlobStore()
        : _stored_bytes(0), _dedup_bytes(0) {}

    virtual bool put(const Buf& data, std::string* digest);
    virtual bool has(const std::string& digest) const;
    virtual Buf get(const std::string& digest) const;

    int64_t stored_bytes() const;
    int64_t dedup_bytes() const;
    size_t num_blobs() const;

    static std::string digest_of(const Buf& data);

private:
    mutable Mutex _mutex;
    std::map<std::string, Buf> _blobs;
    int64_t _stored_bytes;
    int64_t _dedup_bytes;
};

/**
 * A file's reference to one of its chunks in the blob store.
 */
struct FileChunkRef
{
    std::string digest;
    int64_t offset;
    int length;
};

/**
 * drains the chunker into the store and appends the file chunk references to refs.
 * returns the number of chunks drained.
 */
size_t ingest_chunks(StreamChunker& chunker, BlobStore& store, std::vector<FileChunkRef>& refs);

} // namespace puzzlefs
