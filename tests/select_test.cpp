// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "albumtag/matching.h"

namespace albumtag {
namespace {

const std::vector<std::string> kTracklist = {"Intro", "Lost at Sea", "Home"};

TEST(SelectBestTitleTest, PicksExactMatchThroughPunctuation) {
  const TitleGuess guess = select_best_title("02 - lost_at-sea", kTracklist);
  ASSERT_TRUE(guess.title.has_value());
  EXPECT_EQ(*guess.title, "Lost at Sea");
  const auto* m = std::get_if<AutomaticMatch>(&guess.match);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->start, 2u);
  EXPECT_EQ(m->length, 9u);
  EXPECT_TRUE(m->mismatches.empty());
}

TEST(SelectBestTitleTest, ToleratesOneTypo) {
  const TitleGuess guess = select_best_title("03 - lost at se4", kTracklist);
  ASSERT_TRUE(guess.title.has_value());
  EXPECT_EQ(*guess.title, "Lost at Sea");
  const auto* m = std::get_if<AutomaticMatch>(&guess.match);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->mismatches.size(), 1u);
}

TEST(SelectBestTitleTest, NothingMatches) {
  const TitleGuess guess = select_best_title("99 - zzz", kTracklist);
  EXPECT_FALSE(guess.title.has_value());
  EXPECT_TRUE(std::holds_alternative<NoMatch>(guess.match));
}

TEST(SelectBestTitleTest, EmptyTracklist) {
  const TitleGuess guess = select_best_title("01 - intro", {});
  EXPECT_FALSE(guess.title.has_value());
  EXPECT_TRUE(std::holds_alternative<NoMatch>(guess.match));
}

TEST(SelectBestTitleTest, LongerMatchReplacesShorterOne) {
  // "Sea" matches "lostatsea" with one mismatch before "Lost at Sea" is seen.
  const TitleGuess guess = select_best_title("lost at sea", {"Sea", "Lost at Sea"});
  ASSERT_TRUE(guess.title.has_value());
  EXPECT_EQ(*guess.title, "Lost at Sea");
}

TEST(SelectBestTitleTest, FewerMismatchesWinsEvenWhenShorter) {
  const TitleGuess guess = select_best_title("lost at sea", {"Lxst at Sxa", "Lost"});
  ASSERT_TRUE(guess.title.has_value());
  EXPECT_EQ(*guess.title, "Lost");
}

TEST(SelectBestTitleTest, LongerButWorseDoesNotReplace) {
  const TitleGuess guess = select_best_title("lost at sea", {"Lost", "Lxst at Sxa"});
  ASSERT_TRUE(guess.title.has_value());
  EXPECT_EQ(*guess.title, "Lost");
}

TEST(SelectBestTitleTest, TieKeepsEarlierTitle) {
  EXPECT_EQ(select_best_title("alpha", {"Alphx", "Alphy"}).title, std::string("Alphx"));
  EXPECT_EQ(select_best_title("alpha", {"Alphy", "Alphx"}).title, std::string("Alphy"));
}

TEST(SelectBestTitleTest, TitlesWithoutComparableTextAreSkipped) {
  const TitleGuess guess = select_best_title("01 - intro", {"- -", "Intro"});
  EXPECT_EQ(guess.title, std::string("Intro"));
}

TEST(SelectBestTitleTest, StemWithoutComparableTextIsNoMatch) {
  const TitleGuess guess = select_best_title(" - ", kTracklist);
  EXPECT_FALSE(guess.title.has_value());
}

TEST(IdentifyTracksTest, MatchesOnFileStem) {
  const std::vector<std::filesystem::path> files = {
      "album/01 - intro.flac",
      "album/02 - lost_at-sea.flac",
      "album/99 - zzz.flac",
  };
  const auto candidates = identify_tracks(files, kTracklist);
  ASSERT_EQ(candidates.size(), 3u);
  EXPECT_EQ(candidates[0].path, files[0]);
  EXPECT_EQ(candidates[0].title, std::string("Intro"));
  EXPECT_EQ(candidates[1].title, std::string("Lost at Sea"));
  EXPECT_FALSE(candidates[2].title.has_value());
  EXPECT_TRUE(std::holds_alternative<NoMatch>(candidates[2].match));
}

}  // namespace
}  // namespace albumtag
