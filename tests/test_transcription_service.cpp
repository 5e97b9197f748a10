#include <catch2/catch.hpp>

#include "vidcap/transcription_service.hpp"

#include <memory>

using namespace vidcap;

namespace {

/// Scripted backend; counters live outside so the test can inspect them
/// after the service takes ownership.
struct FakeState {
  bool has_accelerator = true;
  bool accel_load_ok = true;
  bool accel_infer_ok = true;
  bool fallback_load_ok = true;
  bool fallback_infer_ok = true;

  int accel_loads = 0;
  int fallback_loads = 0;
  int accel_transcribes = 0;
  int fallback_transcribes = 0;
  int unloads = 0;
};

class FakeBackend : public TranscriptionBackend {
public:
  explicit FakeBackend(std::shared_ptr<FakeState> state)
      : state_(std::move(state)) {}

  bool accelerator_available() const override {
    return state_->has_accelerator;
  }

  bool load(Device device) override {
    if (device == Device::Accelerated) {
      ++state_->accel_loads;
      current_ = device;
      return state_->accel_load_ok;
    }
    ++state_->fallback_loads;
    current_ = device;
    return state_->fallback_load_ok;
  }

  void unload() override { ++state_->unloads; }

  bool transcribe(const std::string &,
                  std::vector<CaptionSegment> &segments) override {
    bool ok;
    if (current_ == Device::Accelerated) {
      ++state_->accel_transcribes;
      ok = state_->accel_infer_ok;
    } else {
      ++state_->fallback_transcribes;
      ok = state_->fallback_infer_ok;
    }
    if (ok)
      segments = {{0.0, 1.5, "hello there"}};
    return ok;
  }

private:
  std::shared_ptr<FakeState> state_;
  Device current_ = Device::Fallback;
};

TranscriptionService make_service(const std::shared_ptr<FakeState> &state,
                                  bool allow_accelerator = true) {
  return TranscriptionService(std::make_unique<FakeBackend>(state),
                              allow_accelerator, 0);
}

} // anonymous namespace

TEST_CASE("Accelerated device is used when it works", "[transcription]") {
  auto state = std::make_shared<FakeState>();
  auto service = make_service(state);

  REQUIRE(service.accelerator_state() ==
          TranscriptionService::AcceleratorState::NotYetTried);

  auto segments = service.transcribe("/p/voice.mp3");
  REQUIRE(segments.size() == 1);
  REQUIRE(segments[0].text == "hello there");
  REQUIRE(service.device() == Device::Accelerated);
  REQUIRE(service.accelerator_state() ==
          TranscriptionService::AcceleratorState::Active);

  service.transcribe("/p/voice.mp3");
  REQUIRE(state->accel_loads == 1);
  REQUIRE(state->accel_transcribes == 2);
  REQUIRE(state->fallback_loads == 0);
}

TEST_CASE("Accelerated load failure switches to fallback for good",
          "[transcription]") {
  auto state = std::make_shared<FakeState>();
  state->accel_load_ok = false;
  auto service = make_service(state);

  auto segments = service.transcribe("/p/voice.mp3");
  REQUIRE_FALSE(segments.empty());
  REQUIRE(service.device() == Device::Fallback);
  REQUIRE(service.accelerator_state() ==
          TranscriptionService::AcceleratorState::Failed);

  service.transcribe("/p/voice.mp3");
  REQUIRE(state->accel_loads == 1);
  REQUIRE(state->fallback_loads == 1);
  REQUIRE(state->fallback_transcribes == 2);
}

TEST_CASE("Accelerated inference failure retries once on fallback",
          "[transcription]") {
  auto state = std::make_shared<FakeState>();
  state->accel_infer_ok = false;
  auto service = make_service(state);

  auto segments = service.transcribe("/p/voice.mp3");
  REQUIRE(segments.size() == 1);
  REQUIRE(state->accel_transcribes == 1);
  REQUIRE(state->fallback_transcribes == 1);
  REQUIRE(state->unloads == 1);
  REQUIRE(service.device() == Device::Fallback);
  REQUIRE(service.accelerator_state() ==
          TranscriptionService::AcceleratorState::Failed);
}

TEST_CASE("Failure on both devices raises and never retries accelerated",
          "[transcription]") {
  auto state = std::make_shared<FakeState>();
  state->accel_infer_ok = false;
  state->fallback_infer_ok = false;
  auto service = make_service(state);

  REQUIRE_THROWS_AS(service.transcribe("/p/voice.mp3"), TranscriptionError);
  REQUIRE(state->accel_transcribes + state->fallback_transcribes == 2);

  REQUIRE_THROWS_AS(service.transcribe("/p/voice.mp3"), TranscriptionError);
  REQUIRE(state->accel_transcribes == 1);
  REQUIRE(state->accel_loads == 1);
  REQUIRE(state->fallback_transcribes == 2);
}

TEST_CASE("Fallback load failure raises", "[transcription]") {
  auto state = std::make_shared<FakeState>();
  state->has_accelerator = false;
  state->fallback_load_ok = false;
  auto service = make_service(state);

  REQUIRE_THROWS_AS(service.transcribe("/p/voice.mp3"), TranscriptionError);
  REQUIRE_FALSE(service.loaded());
}

TEST_CASE("Without an accelerator only the fallback device is touched",
          "[transcription]") {
  SECTION("no device present") {
    auto state = std::make_shared<FakeState>();
    state->has_accelerator = false;
    auto service = make_service(state);
    REQUIRE(service.accelerator_state() ==
            TranscriptionService::AcceleratorState::Failed);
    service.transcribe("/p/voice.mp3");
    REQUIRE(state->accel_loads == 0);
    REQUIRE(state->fallback_loads == 1);
  }

  SECTION("accelerator disallowed") {
    auto state = std::make_shared<FakeState>();
    auto service = make_service(state, false);
    service.transcribe("/p/voice.mp3");
    REQUIRE(state->accel_loads == 0);
    REQUIRE(service.device() == Device::Fallback);
  }
}
