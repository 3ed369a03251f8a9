/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/subtitles.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace subfetch;
using subfetch::test::TempDir;

TEST(FilesystemLocator, FindsLanguageSpecificThenGeneric) {
    TempDir dir;
    auto video = dir.touch("Movie (2001).mkv");
    dir.touch("Movie (2001).fr.ass");
    dir.touch("Movie (2001).en.srt");
    dir.touch("Movie (2001).en.vtt");
    dir.touch("Movie (2001).srt");

    FilesystemLocator locator;
    auto found = locator.find(video, {"en", "fr", "de"});

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].filename(), "Movie (2001).en.srt");
    EXPECT_EQ(found[1].filename(), "Movie (2001).fr.ass");
    EXPECT_EQ(found[2].filename(), "Movie (2001).srt");
}

TEST(FilesystemLocator, NothingNextToVideo) {
    TempDir dir;
    auto video = dir.touch("clip.mp4");
    dir.touch("other.en.srt");

    FilesystemLocator locator;
    EXPECT_TRUE(locator.find(video, {"en"}).empty());
}

TEST(FfprobeProbe, MatchesTwoLetterRequestAgainstStreamTag) {
    auto name = FfprobeProbe::matchStreams("2,eng\n3,fre\n", {"en"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "English");
}

TEST(FfprobeProbe, FirstMatchingStreamWins) {
    auto name = FfprobeProbe::matchStreams("2,FRE\n3,eng\n", {"en", "fr"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "French");

    name = FfprobeProbe::matchStreams("2,spa\n3,ENG\n", {"fr", "en"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "English");
}

TEST(FfprobeProbe, UntaggedOrUnrequestedStreamsIgnored) {
    EXPECT_FALSE(FfprobeProbe::matchStreams("2,\n3\n4,spa\n", {"en"}).has_value());
    EXPECT_FALSE(FfprobeProbe::matchStreams("", {"en"}).has_value());
}

TEST(FfprobeProbe, MissingBinaryMeansNoEmbeddedSubtitles) {
    TempDir dir;
    auto video = dir.touch("movie.mkv");
    FfprobeProbe probe("subfetch-no-such-ffprobe");
    EXPECT_FALSE(probe.embeddedLanguage(video, {"en"}).has_value());
}

TEST(LanguageName, KnownAndUnknownCodes) {
    EXPECT_EQ(languageName("en"), "English");
    EXPECT_EQ(languageName("pt-br"), "Portuguese (Brazil)");
    EXPECT_EQ(languageName("xx"), "xx");
}

TEST(IsVideoFile, ExtensionIsCaseInsensitive) {
    EXPECT_TRUE(isVideoFile("/a/b/Movie.MKV"));
    EXPECT_TRUE(isVideoFile("episode.m2ts"));
    EXPECT_TRUE(isVideoFile("recording.dvr-ms"));
    EXPECT_FALSE(isVideoFile("Movie.srt"));
    EXPECT_FALSE(isVideoFile("README"));
    EXPECT_FALSE(isVideoFile("dir."));
}

TEST(MissingSubtitle, GenericCoversEveryLanguage) {
    TempDir dir;
    auto video = dir.touch("film.avi");
    EXPECT_TRUE(missingSubtitle(video, {"en"}));

    dir.touch("film.sub");
    EXPECT_FALSE(missingSubtitle(video, {"en", "fr"}));
}

TEST(MissingSubtitle, EachLanguageNeedsItsOwnFile) {
    TempDir dir;
    auto video = dir.touch("film.avi");
    dir.touch("film.en.srt");

    EXPECT_FALSE(missingSubtitle(video, {"en"}));
    EXPECT_TRUE(missingSubtitle(video, {"en", "fr"}));
}
