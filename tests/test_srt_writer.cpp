#include <catch2/catch.hpp>

#include "vidcap/srt_writer.hpp"

#include <filesystem>

#include "test_helpers.hpp"

using namespace vidcap;
using vidcap_test::TempDir;

TEST_CASE("SRT timestamps", "[srt]") {
  REQUIRE(format_srt_timestamp(0.0) == "00:00:00,000");
  REQUIRE(format_srt_timestamp(3661.5) == "01:01:01,500");
  REQUIRE(format_srt_timestamp(59.9996) == "00:01:00,000");
  REQUIRE(format_srt_timestamp(1.2344) == "00:00:01,234");
  REQUIRE(format_srt_timestamp(-4.0) == "00:00:00,000");
}

TEST_CASE("SRT file has numbered blank-line separated cues", "[srt]") {
  TempDir dir;
  auto path = (dir.path() / "captions.srt").string();

  std::vector<CaptionChunk> chunks = {{0.0, 1.5, "First line"},
                                      {1.5, 3.25, "Second\nwrapped"}};
  REQUIRE(write_srt(chunks, path));

  REQUIRE(vidcap_test::read_file(path) == "1\n"
                                          "00:00:00,000 --> 00:00:01,500\n"
                                          "First line\n"
                                          "\n"
                                          "2\n"
                                          "00:00:01,500 --> 00:00:03,250\n"
                                          "Second\nwrapped\n"
                                          "\n");
}

TEST_CASE("SRT write into a missing directory fails", "[srt]") {
  TempDir dir;
  auto path = (dir.path() / "no_such_dir" / "captions.srt").string();
  REQUIRE_FALSE(write_srt({{0.0, 1.0, "x"}}, path));
}

TEST_CASE("TempFileGuard removes its file on scope exit", "[srt]") {
  TempDir dir;
  auto path = dir.path() / TEMP_SUBTITLE_NAME;

  {
    TempFileGuard guard(path.string());
    vidcap_test::write_file(path, "1\n");
    REQUIRE(std::filesystem::exists(path));
  }
  REQUIRE_FALSE(std::filesystem::exists(path));

  SECTION("a file that was never created is not an error") {
    TempFileGuard guard((dir.path() / "never_written.srt").string());
  }
}
