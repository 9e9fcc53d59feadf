// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <gtest/gtest.h>

#include "albumtag/tagging.h"

namespace albumtag {
namespace {

const TagMap kTags = {
    {"TITLE", "Lost at Sea"},
    {"ARTIST", "The Band"},
    {"ALBUM", "Deep Water"},
    {"TRACKNUMBER", "2"},
};

TEST(TagFormatTest, DefaultFormat) {
  EXPECT_EQ(render_tag_format("{title}\\n{artist}\\n{album}", kTags),
            "Lost at Sea\nThe Band\nDeep Water");
}

TEST(TagFormatTest, ZeroPaddedTrackNumber) {
  EXPECT_EQ(render_tag_format("{tracknumber:02d} - {title}", kTags), "02 - Lost at Sea");
  EXPECT_EQ(render_tag_format("{tracknumber}", kTags), "2");
}

TEST(TagFormatTest, OversizedPadWidthPrintsStoredText) {
  EXPECT_EQ(render_tag_format("{tracknumber:32d}", kTags), std::string(31, '0') + "2");
  EXPECT_EQ(render_tag_format("{tracknumber:33d}", kTags), "2");
  EXPECT_EQ(render_tag_format("{tracknumber:2000000000d}", kTags), "2");
  EXPECT_EQ(render_tag_format("{tracknumber:99999999999d}", kTags), "2");
}

TEST(TagFormatTest, JoinersDropEmptyFields) {
  EXPECT_EQ(render_tag_format("{artist+album}", kTags), "The Band Deep Water");
  EXPECT_EQ(render_tag_format("{artist/album}", kTags), "The Band/Deep Water");
  EXPECT_EQ(render_tag_format("{albumartist+album}", kTags), "Deep Water");
}

TEST(TagFormatTest, MissingTagRendersEmpty) {
  EXPECT_EQ(render_tag_format("[{genre}]", kTags), "[]");
}

TEST(TagFormatTest, FileNameSafeAndUpperCase) {
  const TagMap tags = {{"TITLE", "A/B: C.\nsecond line"}};
  EXPECT_EQ(render_tag_format("{title:n}", tags), "A_B_ C");
  const TagMap lower = {{"TITLE", "abc"}};
  EXPECT_EQ(render_tag_format("{artist:u}{title:u}", lower), "ABC");
}

TEST(TagFormatTest, EscapesAndUnterminatedBrace) {
  EXPECT_EQ(render_tag_format("a\\tb\\\\c", kTags), "a\tb\\c");
  EXPECT_EQ(render_tag_format("{title", kTags), "{title");
}

}  // namespace
}  // namespace albumtag
