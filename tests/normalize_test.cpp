// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <gtest/gtest.h>

#include "albumtag/matching.h"

namespace albumtag {
namespace {

TEST(NormalizeTest, LowercasesAndDropsSkippableCharacters) {
  const NormalizedString n = normalize("02 - Lost_at-Sea");
  EXPECT_EQ(n.text, U"02lostatsea");
  ASSERT_EQ(n.index_map.size(), n.text.size());
  EXPECT_EQ(n.index_map[0], 0u);
  EXPECT_EQ(n.index_map[2], 5u);   // 'L'
  EXPECT_EQ(n.index_map[6], 10u);  // 'a' after '_'
  EXPECT_EQ(n.index_map[8], 13u);  // 'S' after '-'
}

TEST(NormalizeTest, AllBracketKindsAreSkipped) {
  EXPECT_EQ(normalize("(a)[b]{c}\t d").text, U"abcd");
}

TEST(NormalizeTest, KeepsOtherPunctuation) {
  EXPECT_EQ(normalize("Hello, World!").text, U"hello,world!");
}

TEST(NormalizeTest, EmptyAndSkippableOnlyInput) {
  EXPECT_TRUE(normalize("").text.empty());
  const NormalizedString n = normalize(" - _ () ");
  EXPECT_TRUE(n.text.empty());
  EXPECT_TRUE(n.index_map.empty());
}

TEST(NormalizeTest, MultibyteCharactersMapToByteOffsets) {
  // "Été": two-byte, one-byte, two-byte characters.
  const NormalizedString n = normalize("\xC3\x89t\xC3\xA9");
  EXPECT_EQ(n.text, U"été");
  ASSERT_EQ(n.index_map.size(), 3u);
  EXPECT_EQ(n.index_map[0], 0u);
  EXPECT_EQ(n.index_map[1], 2u);
  EXPECT_EQ(n.index_map[2], 3u);
}

TEST(NormalizeTest, InvalidBytesAreSingleCharacters) {
  const NormalizedString n = normalize("a\xFF" "b");
  ASSERT_EQ(n.text.size(), 3u);
  EXPECT_EQ(n.text[0], U'a');
  EXPECT_EQ(n.text[2], U'b');
  EXPECT_EQ(n.index_map[2], 2u);
}

TEST(NormalizeTest, IndexMapIsStrictlyIncreasing) {
  const NormalizedString n = normalize("  A (b) c-d_e  ");
  for (size_t i = 1; i < n.index_map.size(); ++i) {
    EXPECT_LT(n.index_map[i - 1], n.index_map[i]);
  }
}

TEST(NormalizeTest, SkippableCharacterSet) {
  for (char32_t ch : std::u32string(U" \t()[]{}-_")) {
    EXPECT_TRUE(is_skippable_char(ch));
  }
  EXPECT_FALSE(is_skippable_char(U'a'));
  EXPECT_FALSE(is_skippable_char(U'.'));
  EXPECT_FALSE(is_skippable_char(U'0'));
}

}  // namespace
}  // namespace albumtag
