// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "albumtag/cli.h"
#include "test_files.h"

namespace albumtag {
namespace {

constexpr char kAlbumText[] =
    "[artist]\nThe Band\n[album]\nDeep Water\n[tracklist]\nIntro\nLost at Sea\nHome\n";

TEST(ParseCliArgsTest, ReadsOptionsAndInput) {
  CliOptions opts;
  std::string err;
  ASSERT_EQ(parse_cli_args({"-d", "music", "-g", "*.fla?", "-r", "-y", "--no-color",
                            "--artist", "Guest", "--album-from-parent", "--remove-albumartist",
                            "album.txt"},
                           opts, err),
            ParseResult::Ok)
      << err;
  EXPECT_EQ(opts.input, "album.txt");
  EXPECT_EQ(opts.directory, "music");
  EXPECT_EQ(opts.pattern, std::string("*.fla?"));
  EXPECT_EQ(opts.recursive, true);
  EXPECT_TRUE(opts.yes);
  EXPECT_TRUE(opts.no_color);
  ASSERT_EQ(opts.tag_options.size(), 3u);
  EXPECT_EQ(std::get<LiteralOption>(opts.tag_options.at(kTagArtist)).value, "Guest");
  EXPECT_TRUE(std::holds_alternative<ParentDirOption>(opts.tag_options.at(kTagAlbum)));
  EXPECT_TRUE(std::holds_alternative<RemoveOption>(opts.tag_options.at(kTagAlbumArtist)));
}

TEST(ParseCliArgsTest, DefaultsLeaveConfigValuesUnset) {
  CliOptions opts;
  std::string err;
  ASSERT_EQ(parse_cli_args({"album.txt"}, opts, err), ParseResult::Ok);
  EXPECT_EQ(opts.directory, ".");
  EXPECT_FALSE(opts.pattern.has_value());
  EXPECT_FALSE(opts.recursive.has_value());
  EXPECT_FALSE(opts.format.has_value());
  EXPECT_TRUE(opts.tag_options.empty());
}

TEST(ParseCliArgsTest, TwoDirectivesForOneTagAreRejected) {
  CliOptions opts;
  std::string err;
  EXPECT_EQ(parse_cli_args({"--album", "X", "--remove-album", "a.txt"}, opts, err),
            ParseResult::UsageError);
  EXPECT_NE(err.find("mutually exclusive"), std::string::npos);
  EXPECT_EQ(parse_cli_args({"--artist-from-parent", "--artist-from-parent", "a.txt"}, opts, err),
            ParseResult::UsageError);
}

TEST(ParseCliArgsTest, DirectivesForDifferentTagsAreAccepted) {
  CliOptions opts;
  std::string err;
  EXPECT_EQ(parse_cli_args({"--remove-album", "--remove-albumartist", "a.txt"}, opts, err),
            ParseResult::Ok);
  EXPECT_EQ(opts.tag_options.size(), 2u);
}

TEST(ParseCliArgsTest, UsageErrors) {
  CliOptions opts;
  std::string err;
  EXPECT_EQ(parse_cli_args({"a.txt", "--artist"}, opts, err), ParseResult::UsageError);
  EXPECT_EQ(err, "--artist requires a value");
  EXPECT_EQ(parse_cli_args({"--bogus", "a.txt"}, opts, err), ParseResult::UsageError);
  EXPECT_EQ(parse_cli_args({"a.txt", "-d"}, opts, err), ParseResult::UsageError);
  EXPECT_EQ(parse_cli_args({"a.txt", "b.txt"}, opts, err), ParseResult::UsageError);
  EXPECT_EQ(parse_cli_args({}, opts, err), ParseResult::UsageError);
  EXPECT_EQ(err, "Input path is required");
}

TEST(ParseCliArgsTest, Help) {
  CliOptions opts;
  std::string err;
  EXPECT_EQ(parse_cli_args({"-h"}, opts, err), ParseResult::Help);
  std::ostringstream out;
  print_usage(out);
  EXPECT_NE(out.str().find("--remove-albumartist"), std::string::npos);
}

class RunCliTest : public test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    audio_ = dir_ / "audio";
    std::filesystem::create_directories(audio_);
    config_ = write_file("albumtag.conf", "[albumtag]\n");
  }

  CliOptions options(const std::string& input) const {
    CliOptions opts;
    opts.input = input;
    opts.directory = audio_.string();
    opts.config_file = config_.string();
    return opts;
  }

  int run(const CliOptions& opts, const std::string& script = "") {
    in_.clear();
    in_.str(script);
    out_.str("");
    err_.str("");
    return run_cli(opts, in_, out_, err_, false);
  }

  TagMap read_tags(const std::filesystem::path& path) const {
    FlacTagStore store;
    TagMap tags;
    std::string err;
    EXPECT_TRUE(store.read(path.string(), tags, err)) << err;
    return tags;
  }

  std::filesystem::path audio_;
  std::filesystem::path config_;
  std::istringstream in_;
  std::ostringstream out_;
  std::ostringstream err_;
};

TEST_F(RunCliTest, BadAlbumFileFailsEvenWithoutAudioFiles) {
  const auto album = write_file("album.txt", "[album]\nDeep Water\n[tracklist]\nIntro\n");
  EXPECT_EQ(run(options(album.string())), kExitFailure);
  EXPECT_NE(err_.str().find("Error: No artist"), std::string::npos);
  EXPECT_EQ(out_.str().find("No files matching"), std::string::npos);
}

TEST_F(RunCliTest, MissingAlbumFileFails) {
  EXPECT_EQ(run(options((dir_ / "missing.txt").string())), kExitFailure);
  EXPECT_NE(err_.str().find("Input not found"), std::string::npos);
}

TEST_F(RunCliTest, ValidAlbumWithoutAudioFilesSucceeds) {
  const auto album = write_file("album.txt", kAlbumText);
  EXPECT_EQ(run(options(album.string())), kExitSuccess);
  EXPECT_NE(out_.str().find("Read album metadata from"), std::string::npos);
  EXPECT_NE(out_.str().find("No files matching"), std::string::npos);
}

TEST_F(RunCliTest, MissingAudioDirectoryFails) {
  const auto album = write_file("album.txt", kAlbumText);
  CliOptions opts = options(album.string());
  opts.directory = (dir_ / "nowhere").string();
  EXPECT_EQ(run(opts), kExitFailure);
}

TEST_F(RunCliTest, BadConfigFails) {
  const auto album = write_file("album.txt", kAlbumText);
  CliOptions opts = options(album.string());
  opts.config_file = write_file("bad.conf", "[albumtag]\nrecursive = maybe\n").string();
  EXPECT_EQ(run(opts), kExitFailure);
  EXPECT_NE(err_.str().find("Invalid recursive value"), std::string::npos);
}

TEST_F(RunCliTest, AlbumModeWritesMatchedTracks) {
  const auto album = write_file("album.txt", kAlbumText);
  const auto intro = write_flac_file("audio/01 - intro.flac");
  const auto sea = write_flac_file("audio/02 - lost_at-sea.flac");
  CliOptions opts = options(album.string());
  opts.yes = true;

  ASSERT_EQ(run(opts), kExitSuccess) << err_.str();
  EXPECT_NE(out_.str().find("Updated 2 file(s), 0 unchanged, 0 failed."), std::string::npos);
  const TagMap tags = read_tags(sea);
  EXPECT_EQ(tags.at(kTagTitle), "Lost at Sea");
  EXPECT_EQ(tags.at(kTagTrackNumber), "2");
  EXPECT_EQ(tags.at(kTagArtist), "The Band");
  EXPECT_EQ(tags.at(kTagAlbumArtist), "The Band");
  EXPECT_EQ(tags.at(kTagAlbum), "Deep Water");
  EXPECT_EQ(read_tags(intro).at(kTagTrackNumber), "1");

  ASSERT_EQ(run(opts), kExitSuccess);
  EXPECT_NE(out_.str().find("Updated 0 file(s), 2 unchanged, 0 failed."), std::string::npos);
}

TEST_F(RunCliTest, QuittingReviewWritesNothing) {
  const auto album = write_file("album.txt", kAlbumText);
  const auto intro = write_flac_file("audio/01 - intro.flac");

  EXPECT_EQ(run(options(album.string()), "q\n"), kExitSuccess);
  EXPECT_NE(out_.str().find("Quitting..."), std::string::npos);
  EXPECT_TRUE(read_tags(intro).empty());
}

TEST_F(RunCliTest, FailedWriteIsCountedAndReported) {
  const auto album = write_file("album.txt", kAlbumText);
  write_file("audio/01 - intro.flac", "not a flac stream");
  const auto sea = write_flac_file("audio/02 - lost_at-sea.flac");

  EXPECT_EQ(run(options(album.string()), "\n"), kExitFailure);
  EXPECT_NE(err_.str().find("Failed: "), std::string::npos);
  EXPECT_NE(out_.str().find("Updated 1 file(s), 0 unchanged, 1 failed."), std::string::npos);
  EXPECT_EQ(read_tags(sea).at(kTagTitle), "Lost at Sea");
}

TEST_F(RunCliTest, DirectoryModeNeedsTagOption) {
  EXPECT_EQ(run(options(audio_.string())), kExitUsage);
  EXPECT_NE(err_.str().find("at least one tag option"), std::string::npos);
}

TEST_F(RunCliTest, DirectoryModeAppliesOnlyDirectives) {
  const auto track = write_flac_file(
      "audio/track.flac", std::vector<std::string>{"TITLE=Keep", "ALBUM=Old"});
  CliOptions opts = options(audio_.string());
  opts.tag_options[kTagArtist] = LiteralOption{"Guest"};
  opts.tag_options[kTagAlbumArtist] = ParentDirOption{};
  opts.tag_options[kTagAlbum] = RemoveOption{};

  ASSERT_EQ(run(opts), kExitSuccess) << err_.str();
  EXPECT_EQ(read_tags(track),
            (TagMap{{kTagTitle, "Keep"}, {kTagArtist, "Guest"}, {kTagAlbumArtist, "audio"}}));
}

TEST_F(RunCliTest, PrintModeRendersFormat) {
  const auto track = write_flac_file(
      "audio/track.flac", std::vector<std::string>{"TITLE=Home", "TRACKNUMBER=3"});
  CliOptions opts = options(track.string());
  opts.print = true;
  opts.format = "{tracknumber:02d} {title}";

  ASSERT_EQ(run(opts), kExitSuccess) << err_.str();
  EXPECT_NE(out_.str().find("03 Home"), std::string::npos);
}

}  // namespace
}  // namespace albumtag
