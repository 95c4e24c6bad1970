/* Copyright (C) 2016 PuzzleFS */
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "../chunk/blob_store.h"
#include "../util/crypto.h"
#include "test_data.h"

using namespace puzzlefs;
using namespace puzzlefs::test;

namespace {

std::vector<FileChunkRef> ingestFile(
    const std::vector<uint8_t>& data, const ChunkConfig& config, BlobStore& store, size_t write_size) {
  StreamChunker chunker(config);
  std::vector<FileChunkRef> refs;
  for (size_t pos = 0; pos < data.size(); pos += write_size) {
    chunker.append(data.data() + pos, std::min(write_size, data.size() - pos));
    ingest_chunks(chunker, store, refs);
  }
  chunker.finish();
  ingest_chunks(chunker, store, refs);
  return refs;
}

}  // namespace

TEST(CryptoTest, Sha256KnownVectors) {
  EXPECT_EQ(
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
      Crypto::digest_hex(Buf(), "sha256"));
  EXPECT_EQ(
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
      Crypto::digest_hex(Buf::copy("abc", 3), "sha256"));
}

TEST(CryptoTest, IncrementalDigest) {
  Crypto::Digest d("sha256");
  d.update("a", 1);
  d.update("bc", 2);
  EXPECT_EQ(
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
      d.result().hex());
}

TEST(CryptoTest, UnknownDigest) {
  EXPECT_THROW(Crypto::Digest("no-such-digest"), Exception);
}

TEST(MemoryBlobStoreTest, PutGetHas) {
  MemoryBlobStore store;
  std::string digest;
  Buf blob = Buf::copy("abc", 3);
  EXPECT_TRUE(store.put(blob, &digest));
  EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", digest);
  EXPECT_TRUE(store.has(digest));
  EXPECT_TRUE(store.get(digest).same(blob));

  std::string again;
  EXPECT_FALSE(store.put(Buf::copy("abc", 3), &again));
  EXPECT_EQ(digest, again);
  EXPECT_EQ(1U, store.num_blobs());
  EXPECT_EQ(3, store.stored_bytes());
  EXPECT_EQ(3, store.dedup_bytes());

  EXPECT_FALSE(store.has("00"));
  EXPECT_EQ(0, store.get("00").length());
}

TEST(MemoryBlobStoreTest, IdenticalFilesAreStoredOnce) {
  const ChunkConfig config = ChunkConfig::conformance_profile();
  std::vector<uint8_t> data = random_bytes(500000, 1);
  MemoryBlobStore store;

  auto refs1 = ingestFile(data, config, store, 4096);
  const int64_t stored = store.stored_bytes();
  const size_t blobs = store.num_blobs();
  EXPECT_EQ(int64_t(data.size()), stored);

  // same content written with other sizes, same chunks
  auto refs2 = ingestFile(data, config, store, 100000);
  EXPECT_EQ(stored, store.stored_bytes());
  EXPECT_EQ(blobs, store.num_blobs());
  EXPECT_EQ(int64_t(data.size()), store.dedup_bytes());

  ASSERT_EQ(refs1.size(), refs2.size());
  for (size_t i = 0; i < refs1.size(); ++i) {
    EXPECT_EQ(refs1[i].digest, refs2[i].digest) << i;
    EXPECT_EQ(refs1[i].offset, refs2[i].offset) << i;
  }
}

TEST(MemoryBlobStoreTest, ShiftedContentDedups) {
  const ChunkConfig config = ChunkConfig::conformance_profile();
  std::vector<uint8_t> data = random_bytes(1000000, 2);
  std::vector<uint8_t> shifted = random_bytes(5000, 3);
  shifted.insert(shifted.end(), data.begin(), data.end());
  MemoryBlobStore store;

  ingestFile(data, config, store, 65536);
  ingestFile(shifted, config, store, 65536);

  // content defined boundaries resync after the inserted prefix
  EXPECT_GT(store.dedup_bytes(), int64_t(data.size() / 2));
}

TEST(MemoryBlobStoreTest, FileCanBeReassembled) {
  const ChunkConfig config = ChunkConfig::conformance_profile();
  std::vector<uint8_t> data = random_bytes(300001, 4);
  MemoryBlobStore store;
  auto refs = ingestFile(data, config, store, 7000);

  std::vector<uint8_t> out;
  for (const FileChunkRef& ref : refs) {
    EXPECT_EQ(int64_t(out.size()), ref.offset);
    Buf blob = store.get(ref.digest);
    ASSERT_EQ(ref.length, blob.length());
    out.insert(out.end(), blob.data(), blob.data() + blob.length());
  }
  EXPECT_EQ(data, out);
}

TEST(MemoryBlobStoreTest, ConcurrentFiles) {
  const ChunkConfig config = ChunkConfig::conformance_profile();
  std::vector<uint8_t> data = random_bytes(400000, 5);
  MemoryBlobStore store;

  // one chunker per file, one shared store
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i]() { ingestFile(data, config, store, 10000 + i); });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(int64_t(data.size()), store.stored_bytes());
  EXPECT_EQ(int64_t(3 * data.size()), store.dedup_bytes());
}
