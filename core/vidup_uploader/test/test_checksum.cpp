// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for chunk checksum computation
 */

#include <gtest/gtest.h>

#include <string>

#include "checksum.hpp"

using namespace vidup::uploader;

TEST(ChecksumTest, KnownDigests) {
  EXPECT_EQ(computeChecksum(""), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(computeChecksum("abc"), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(
    computeChecksum("The quick brown fox jumps over the lazy dog"),
    "9e107d9d372bb6826bd81d3542a419d6"
  );
}

TEST(ChecksumTest, LowercaseHexOf32Chars) {
  auto digest = computeChecksum(std::string(1024, '\xff'));
  ASSERT_EQ(digest.size(), 32u);
  for (char c : digest) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << "unexpected char " << c;
  }
}

TEST(ChecksumTest, BinaryDataWithEmbeddedNulls) {
  std::string with_nulls("a\0b\0c", 5);
  std::string truncated("a");
  EXPECT_NE(computeChecksum(with_nulls), computeChecksum(truncated));
  EXPECT_EQ(computeChecksum(with_nulls), computeChecksum(with_nulls.data(), with_nulls.size()));
}

TEST(ChecksumTest, Deterministic) {
  std::string data(5 * 1024 * 1024, 'x');
  EXPECT_EQ(computeChecksum(data), computeChecksum(data));
}
