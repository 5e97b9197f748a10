#include <catch2/catch.hpp>

#include "vidcap/batch_renderer.hpp"
#include "vidcap/logging.hpp"
#include "vidcap/project_scanner.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "test_helpers.hpp"

using namespace vidcap;
using vidcap_test::TempDir;
using vidcap_test::write_file;

namespace fs = std::filesystem;

namespace {

/// Succeeds on every device unless the audio lives in a folder marked "bad"
class ScriptedBackend : public TranscriptionBackend {
public:
  explicit ScriptedBackend(std::shared_ptr<std::atomic<int>> calls)
      : calls_(std::move(calls)) {}

  bool accelerator_available() const override { return false; }
  bool load(Device) override { return true; }
  void unload() override {}

  bool transcribe(const std::string &audio_path,
                  std::vector<CaptionSegment> &segments) override {
    ++*calls_;
    if (audio_path.find("bad") != std::string::npos)
      return false;
    segments = {{0.0, 3.0, "hello world this is a test"},
                {3.0, 6.0, "and here is another line"}};
    return true;
  }

private:
  std::shared_ptr<std::atomic<int>> calls_;
};

fs::path make_project(const TempDir &dir, const std::string &name) {
  auto folder = dir.subdir(name);
  write_file(folder / "voiceover.mp3", "audio");
  write_file(folder / "01.png", "image");
  return folder;
}

RenderServices fake_services(int exit_code) {
  RenderServices s;
  s.probe_duration = [](const std::string &, double &out) {
    out = 6.0;
    return true;
  };
  s.probe_image = [](const std::string &, ImageSize &out) {
    out = {1920, 1080};
    return true;
  };
  s.accelerator_available = [] { return false; };
  s.run_encoder = [exit_code](const EncodeCommand &, const LineHandler &on_line,
                              int) {
    on_line("frame=   90 fps=30 q=28.0");
    on_line("frame=  180 fps=30 q=28.0");
    EncodeOutcome outcome;
    outcome.exit_code = exit_code;
    if (exit_code != 0)
      outcome.tail = {"Error while encoding"};
    return outcome;
  };
  return s;
}

CaptionLimits small_limits() {
  CaptionLimits limits;
  limits.max_words = 3;
  limits.max_chars = 40;
  limits.wrap_chars = 20;
  return limits;
}

} // anonymous namespace

TEST_CASE("Worker count is clamped and one slot is built per worker",
          "[batch]") {
  int created = 0;
  BackendFactory factory = [&created](int) {
    ++created;
    return std::make_unique<ScriptedBackend>(
        std::make_shared<std::atomic<int>>(0));
  };

  BatchRenderer wide(9, factory, fake_services(0), false, small_limits());
  REQUIRE(wide.num_workers() == 4);
  REQUIRE(created == 4);

  BatchRenderer narrow(0, factory, fake_services(0), false, small_limits());
  REQUIRE(narrow.num_workers() == 1);
  REQUIRE(created == 5);
}

TEST_CASE("A failing project does not stop the batch", "[batch]") {
  TempDir dir;
  auto ok_a = make_project(dir, "alpha");
  auto ok_b = make_project(dir, "beta");
  auto bad = make_project(dir, "bad_gamma");

  auto calls = std::make_shared<std::atomic<int>>(0);
  BatchRenderer renderer(
      2,
      [calls](int) { return std::make_unique<ScriptedBackend>(calls); },
      fake_services(0), false, small_limits());

  std::map<std::string, std::vector<int>> progress;
  std::map<std::string, std::vector<std::string>> statuses;
  renderer.set_progress_callback([&](const std::string &folder, int pct,
                                     const std::string &status) {
    progress[folder].push_back(pct);
    statuses[folder].push_back(status);
  });

  int completed = 0;
  renderer.set_completion_callback(
      [&completed](const RenderResult &) { ++completed; });

  RenderSettings settings;
  auto results = renderer.render(
      {ok_a.string(), ok_b.string(), bad.string()}, settings);

  REQUIRE(results.size() == 3);
  REQUIRE(completed == 3);
  REQUIRE(BatchRenderer::count_failures(results) == 1);

  for (const auto &r : results) {
    CAPTURE(r.folder);
    REQUIRE_FALSE(fs::exists(fs::path(r.folder) / TEMP_SUBTITLE_NAME));
    if (r.folder == bad.string()) {
      REQUIRE_FALSE(r.success);
      REQUIRE(r.output_path.empty());
    } else {
      REQUIRE(r.success);
      REQUIRE(r.output_path == output_path_for(r.folder));
    }
  }

  /// Fallback-only backend: the bad project is tried exactly once
  REQUIRE(calls->load() == 3);

  for (const auto &folder : {ok_a.string(), ok_b.string()}) {
    const auto &seq = progress[folder];
    REQUIRE_FALSE(seq.empty());
    REQUIRE(seq.front() == 5);
    REQUIRE(seq.back() == 100);
    for (size_t i = 1; i < seq.size(); ++i) {
      REQUIRE(seq[i] >= seq[i - 1]);
    }
    REQUIRE(std::find(seq.begin(), seq.end(), 59) != seq.end());

    /// The last frame maps to 99 too; the status change still gets through
    const auto &st = statuses[folder];
    REQUIRE(st.size() == seq.size());
    REQUIRE(st[st.size() - 2] == "Finalizing");
    REQUIRE(seq[seq.size() - 2] == 99);
    REQUIRE(seq[seq.size() - 3] == 99);
    REQUIRE(st[st.size() - 3] == "Encoding");
    REQUIRE(st.back() == "Complete");
  }

  REQUIRE(progress[bad.string()].back() < 20);

#if ENABLE_TIMING
  std::map<std::string, int> stage_jobs;
  for (const auto &s : TimingCollector::stage_stats())
    stage_jobs[s.stage] = s.count;
  REQUIRE(stage_jobs["transcribe"] == 2);
  REQUIRE(stage_jobs["encode"] == 2);
  REQUIRE(stage_jobs["total"] == 3);
#endif
}

TEST_CASE("Encoder failure fails the job and still removes the captions",
          "[batch]") {
  TempDir dir;
  auto folder = make_project(dir, "delta");
  const auto srt = folder / TEMP_SUBTITLE_NAME;

  auto services = fake_services(1);
  bool srt_seen = false;
  std::string srt_text;
  auto failing = services.run_encoder;
  services.run_encoder = [&](const EncodeCommand &cmd,
                             const LineHandler &on_line, int job_id) {
    srt_seen = fs::exists(srt);
    srt_text = vidcap_test::read_file(srt);
    return failing(cmd, on_line, job_id);
  };

  auto calls = std::make_shared<std::atomic<int>>(0);
  BatchRenderer renderer(
      1, [calls](int) { return std::make_unique<ScriptedBackend>(calls); },
      services, false, small_limits());

  RenderSettings settings;
  settings.text_case = TextCase::Upper;
  auto results = renderer.render({folder.string()}, settings);

  REQUIRE(results.size() == 1);
  REQUIRE_FALSE(results[0].success);
  REQUIRE(results[0].output_path.empty());

  REQUIRE(srt_seen);
  REQUIRE(srt_text.rfind("1\n00:00:00,000 --> ", 0) == 0);
  REQUIRE(srt_text.find("HELLO WORLD THIS") != std::string::npos);
  REQUIRE_FALSE(fs::exists(srt));
}

TEST_CASE("Folders without inputs are reported as failures", "[batch]") {
  TempDir dir;
  auto empty = dir.subdir("empty");

  auto calls = std::make_shared<std::atomic<int>>(0);
  BatchRenderer renderer(
      1, [calls](int) { return std::make_unique<ScriptedBackend>(calls); },
      fake_services(0), false, small_limits());

  auto results = renderer.render({empty.string()}, RenderSettings{});
  REQUIRE(results.size() == 1);
  REQUIRE_FALSE(results[0].success);
  REQUIRE(calls->load() == 0);
}

TEST_CASE("An empty batch returns no results", "[batch]") {
  BatchRenderer renderer(
      2,
      [](int) {
        return std::make_unique<ScriptedBackend>(
            std::make_shared<std::atomic<int>>(0));
      },
      fake_services(0), false, small_limits());
  REQUIRE(renderer.render({}, RenderSettings{}).empty());
}

TEST_CASE("A listener throwing a non-standard exception fails only its job",
          "[batch]") {
  TempDir dir;
  auto boom = make_project(dir, "epsilon");
  auto fine = make_project(dir, "zeta");

  auto calls = std::make_shared<std::atomic<int>>(0);
  BatchRenderer renderer(
      1, [calls](int) { return std::make_unique<ScriptedBackend>(calls); },
      fake_services(0), false, small_limits());

  renderer.set_progress_callback(
      [&boom](const std::string &folder, int pct, const std::string &) {
        if (folder == boom.string() && pct >= 20)
          throw 42;
      });

  std::vector<std::string> completed;
  renderer.set_completion_callback([&](const RenderResult &r) {
    completed.push_back(r.folder);
    if (r.folder == fine.string())
      throw "listener error";
  });

  RenderSettings settings;
  auto results = renderer.render({boom.string(), fine.string()}, settings);

  REQUIRE(results.size() == 2);
  REQUIRE(completed.size() == 2);
  for (const auto &r : results) {
    CAPTURE(r.folder);
    REQUIRE_FALSE(fs::exists(fs::path(r.folder) / TEMP_SUBTITLE_NAME));
    if (r.folder == boom.string()) {
      REQUIRE_FALSE(r.success);
      REQUIRE(r.output_path.empty());
    } else {
      REQUIRE(r.success);
    }
  }
}
