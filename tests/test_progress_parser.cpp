#include <catch2/catch.hpp>

#include "vidcap/progress_parser.hpp"

using namespace vidcap;

TEST_CASE("Clock parsing", "[progress]") {
  REQUIRE(parse_clock("01:02:03.50").value() == Approx(3723.5));
  REQUIRE(parse_clock("02:03").value() == Approx(123.0));
  REQUIRE(parse_clock("00:00:07").value() == Approx(7.0));
  REQUIRE_FALSE(parse_clock("N/A"));
  REQUIRE_FALSE(parse_clock("12"));
}

TEST_CASE("Frame counter maps into the encoding band", "[progress]") {
  ProgressTracker tracker(10.0, 30);

  REQUIRE(tracker.parse_line("frame=    0 fps=0.0 q=0.0 size=0kB") == 20);
  REQUIRE(tracker.parse_line("frame=  150 fps= 60 q=28.0 size=  512kB") == 59);
  REQUIRE(tracker.parse_line("frame=200 fps=61") == 72);
  REQUIRE(tracker.parse_line("frame= 1000 fps=60") == 99);
}

TEST_CASE("Elapsed time is used when no frame counter is present",
          "[progress]") {
  ProgressTracker tracker(10.0, 30);
  REQUIRE(tracker.parse_line("size=  100kB time=00:00:05.00 bitrate=...") ==
          59);
  REQUIRE(tracker.parse_line("time=00:10.00") == 99);
}

TEST_CASE("Frame counter wins over elapsed time", "[progress]") {
  ProgressTracker tracker(10.0, 30);
  REQUIRE(tracker.parse_line("frame=  30 time=00:00:09.00") == 27);
}

TEST_CASE("Lines without markers are ignored", "[progress]") {
  ProgressTracker tracker(10.0, 30);
  REQUIRE_FALSE(tracker.parse_line("Stream #0:0: Video: png"));
  REQUIRE_FALSE(tracker.parse_line(""));

  ProgressTracker no_duration(0.0, 30);
  REQUIRE_FALSE(no_duration.parse_line("frame=10"));
}

TEST_CASE("Reported values only move forward", "[progress]") {
  ProgressTracker tracker(10.0, 30);

  REQUIRE(tracker.feed("frame=150") == 59);
  REQUIRE_FALSE(tracker.feed("frame=150"));
  REQUIRE_FALSE(tracker.feed("frame=100"));
  REQUIRE(tracker.feed("frame=200") == 72);
  REQUIRE(tracker.current() == 72);

  REQUIRE(tracker.update(PROGRESS_FINALIZING));
  REQUIRE_FALSE(tracker.update(PROGRESS_FINALIZING));
  REQUIRE(tracker.update(PROGRESS_DONE));
}
