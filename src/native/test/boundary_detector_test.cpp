/* Copyright (C) 2016 PuzzleFS */
#include <gtest/gtest.h>

#include <vector>

#include "../chunk/boundary_detector.h"
#include "test_data.h"

using namespace puzzlefs;
using namespace puzzlefs::test;

namespace {

const int MIN = 8192;
const int AVG = 16384;
const int MAX = 32768;

BoundaryDetector::Cuts detect(
    ChunkConfig::Algorithm algo, const std::vector<uint8_t>& data, size_t len, bool is_final) {
  BoundaryDetector::Cuts cuts;
  make_boundary_detector(algo)->detect(data.data(), int(len), MIN, AVG, MAX, is_final, cuts);
  return cuts;
}

int totalLength(const BoundaryDetector::Cuts& cuts) {
  int total = 0;
  for (const auto& c : cuts) {
    EXPECT_EQ(total, c.offset);
    total += c.length;
  }
  return total;
}

class BoundaryDetectorTest : public ::testing::TestWithParam<ChunkConfig::Algorithm> {
protected:
  std::vector<uint8_t> data_ = random_bytes(10 * MAX + 123, 42);
};

}  // namespace

TEST_P(BoundaryDetectorTest, EmptyWindow) {
  EXPECT_TRUE(detect(GetParam(), data_, 0, true).empty());
  EXPECT_TRUE(detect(GetParam(), data_, 0, false).empty());
}

TEST_P(BoundaryDetectorTest, FinalEmitsEverything) {
  auto cuts = detect(GetParam(), data_, data_.size(), true);
  ASSERT_FALSE(cuts.empty());
  EXPECT_EQ(int(data_.size()), totalLength(cuts));
}

TEST_P(BoundaryDetectorTest, FinalShortTail) {
  auto cuts = detect(GetParam(), data_, 100, true);
  ASSERT_EQ(1U, cuts.size());
  EXPECT_EQ(0, cuts[0].offset);
  EXPECT_EQ(100, cuts[0].length);
}

TEST_P(BoundaryDetectorTest, NonFinalBelowMinWithholds) {
  EXPECT_TRUE(detect(GetParam(), data_, MIN, false).empty());
  EXPECT_TRUE(detect(GetParam(), data_, 100, false).empty());
}

TEST_P(BoundaryDetectorTest, NonFinalWithholdsLastCandidate) {
  auto final_cuts = detect(GetParam(), data_, data_.size(), true);
  auto cuts = detect(GetParam(), data_, data_.size(), false);
  ASSERT_FALSE(cuts.empty());
  EXPECT_LT(totalLength(cuts), int(data_.size()));
  // the resolved cuts are a prefix of the final ones
  ASSERT_LT(cuts.size(), final_cuts.size());
  for (size_t i = 0; i < cuts.size(); ++i) {
    EXPECT_EQ(final_cuts[i].offset, cuts[i].offset) << i;
    EXPECT_EQ(final_cuts[i].length, cuts[i].length) << i;
  }
}

TEST_P(BoundaryDetectorTest, FullWindowResolvesOneCut) {
  auto cuts = detect(GetParam(), data_, MAX, false);
  ASSERT_FALSE(cuts.empty());
  EXPECT_LE(cuts[0].length, MAX);
  EXPECT_GE(cuts[0].length, MIN);
}

TEST_P(BoundaryDetectorTest, SizeBounds) {
  auto cuts = detect(GetParam(), data_, data_.size(), true);
  for (size_t i = 0; i < cuts.size(); ++i) {
    EXPECT_LE(cuts[i].length, MAX) << i;
    if (i + 1 < cuts.size()) {
      EXPECT_GE(cuts[i].length, MIN) << i;
    }
  }
}

TEST_P(BoundaryDetectorTest, ConstantContentRepeatsChunks) {
  std::vector<uint8_t> zeros(10 * MAX, 0);
  auto cuts = detect(GetParam(), zeros, zeros.size(), true);
  ASSERT_GT(cuts.size(), 2U);
  for (size_t i = 1; i + 1 < cuts.size(); ++i) {
    EXPECT_EQ(cuts[0].length, cuts[i].length) << i;
  }
}

TEST_P(BoundaryDetectorTest, DecisionDependsOnlyOnBytesSinceCut) {
  auto cuts = detect(GetParam(), data_, data_.size(), true);
  ASSERT_GT(cuts.size(), 3U);
  // detect again starting at the second cut - the rest must repeat
  const int start = cuts[1].offset;
  std::vector<uint8_t> tail(data_.begin() + start, data_.end());
  auto tail_cuts = detect(GetParam(), tail, tail.size(), true);
  ASSERT_EQ(cuts.size() - 1, tail_cuts.size());
  for (size_t i = 0; i < tail_cuts.size(); ++i) {
    EXPECT_EQ(cuts[i + 1].offset - start, tail_cuts[i].offset) << i;
    EXPECT_EQ(cuts[i + 1].length, tail_cuts[i].length) << i;
  }
}

INSTANTIATE_TEST_SUITE_P(
    Algorithms,
    BoundaryDetectorTest,
    ::testing::Values(ChunkConfig::FASTCDC, ChunkConfig::RABIN));

// boundaries are part of the stored format: blobs chunked by one build must
// dedup against blobs chunked by another, so these must never change.
TEST(KnownBoundariesTest, FastCdc) {
  const std::vector<OffsetLength> expected = {
      {0, 8632}, {8632, 8699}, {17331, 17123}, {34454, 14166}, {48620, 18863},
      {67483, 10400}, {77883, 16015}, {93898, 14363}, {108261, 25611}, {133872, 8949},
      {142821, 15929}, {158750, 9897}, {168647, 20784}, {189431, 10569},
  };
  std::vector<uint8_t> data = random_bytes(200000, 2024);
  ASSERT_EQ(250, data[0]);
  ASSERT_EQ(18, data[1]);
  const ChunkConfig config = ChunkConfig::conformance_profile();
  EXPECT_EQ(expected, reference_chunks(data, config));
  EXPECT_EQ(expected, offsets_of(stream_chunks(data, config, 4096)));
}

TEST(KnownBoundariesTest, Rabin) {
  const std::vector<OffsetLength> expected = {
      {0, 11668}, {11668, 15143}, {26811, 11212}, {38023, 16111}, {54134, 32768},
      {86902, 32768}, {119670, 9944}, {129614, 19898}, {149512, 16636}, {166148, 8386},
      {174534, 9156}, {183690, 16310},
  };
  std::vector<uint8_t> data = random_bytes(200000, 2024);
  const ChunkConfig config(MIN, AVG, MAX, ChunkConfig::RABIN);
  EXPECT_EQ(expected, reference_chunks(data, config));
  EXPECT_EQ(expected, offsets_of(stream_chunks(data, config, 4096)));
}

TEST(GearTest, KnownMasks) {
  // conformance profile, avg 2^14
  EXPECT_EQ(0xaaaa5554U, Gear::mask(15));
  EXPECT_EQ(0xa94a5294U, Gear::mask(13));
}

TEST(RabinDetectorTest, ZerosAreCutAtMax) {
  std::vector<uint8_t> zeros(3 * MAX + 5, 0);
  auto cuts = detect(ChunkConfig::RABIN, zeros, zeros.size(), true);
  ASSERT_EQ(4U, cuts.size());
  EXPECT_EQ(MAX, cuts[0].length);
  EXPECT_EQ(MAX, cuts[1].length);
  EXPECT_EQ(MAX, cuts[2].length);
  EXPECT_EQ(5, cuts[3].length);
}

TEST(FastCdcDetectorTest, SharedInstance) {
  auto a = make_boundary_detector(ChunkConfig::FASTCDC);
  auto b = make_boundary_detector(ChunkConfig::FASTCDC);
  EXPECT_EQ(a.get(), b.get());
  EXPECT_STREQ("fastcdc", a->name());
  EXPECT_STREQ("rabin", make_boundary_detector(ChunkConfig::RABIN)->name());
}

TEST(GearTest, Masks) {
  EXPECT_EQ(0U, Gear::mask(0));
  EXPECT_EQ(0x80000000U, Gear::mask(1));
  EXPECT_EQ(0xffffffffU, Gear::mask(32));
  EXPECT_EQ(13, __builtin_popcount(Gear::mask(13)));
  EXPECT_EQ(15, __builtin_popcount(Gear::mask(15)));
  EXPECT_EQ(14, Gear::log2_round(16384));
  EXPECT_EQ(14, Gear::log2_round(16000));
  EXPECT_EQ(25, Gear::log2_round(40 * 1024 * 1024));
}

TEST(ChunkConfigTest, Profiles) {
  ChunkConfig image = ChunkConfig::image_profile();
  EXPECT_EQ(10 * 1024 * 1024, image.min_chunk);
  EXPECT_EQ(40 * 1024 * 1024, image.avg_chunk);
  EXPECT_EQ(256 * 1024 * 1024, image.max_chunk);
  EXPECT_NO_THROW(image.validate());

  ChunkConfig conf = ChunkConfig::conformance_profile();
  EXPECT_EQ(8192, conf.min_chunk);
  EXPECT_EQ(16384, conf.avg_chunk);
  EXPECT_EQ(32768, conf.max_chunk);
  EXPECT_EQ(ChunkConfig::FASTCDC, conf.algorithm);
  EXPECT_NO_THROW(conf.validate());
}

TEST(ChunkConfigTest, ParseAlgorithm) {
  EXPECT_EQ(ChunkConfig::FASTCDC, ChunkConfig::parse_algorithm("fastcdc"));
  EXPECT_EQ(ChunkConfig::RABIN, ChunkConfig::parse_algorithm("rabin"));
  EXPECT_THROW(ChunkConfig::parse_algorithm("buzhash"), ChunkConfigError);
  EXPECT_STREQ("rabin", ChunkConfig::algorithm_name(ChunkConfig::RABIN));
}
