/**
 * @file transcription_service.cpp
 * @brief Device fallback state machine
 */

#include "vidcap/transcription_service.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "vidcap/logging.hpp"

namespace vidcap {

const char *to_string(Device device) {
  return device == Device::Accelerated ? "accelerated" : "fallback";
}

TranscriptionService::TranscriptionService(
    std::unique_ptr<TranscriptionBackend> backend, bool allow_accelerator,
    int slot_id)
    : backend_(std::move(backend)), slot_id_(slot_id) {
  bool usable = allow_accelerator && backend_->accelerator_available();
  accel_state_ = usable ? AcceleratorState::NotYetTried : AcceleratorState::Failed;
}

bool TranscriptionService::switch_to_fallback() {
  accel_state_ = AcceleratorState::Failed;
  if (loaded_) {
    backend_->unload();
    loaded_ = false;
  }

  device_ = Device::Fallback;
  if (!backend_->load(Device::Fallback)) {
    LOG_ERROR("[Worker {}] Model load failed on fallback device", slot_id_);
    return false;
  }
  loaded_ = true;
  return true;
}

bool TranscriptionService::ensure_loaded() {
  if (loaded_)
    return true;

  if (accel_state_ == AcceleratorState::NotYetTried) {
    if (backend_->load(Device::Accelerated)) {
      accel_state_ = AcceleratorState::Active;
      device_ = Device::Accelerated;
      loaded_ = true;
      LOG_INFO("[Worker {}] Speech model loaded on accelerated device",
               slot_id_);
      return true;
    }
    LOG_WARN("[Worker {}] Accelerated model load failed, using fallback device",
             slot_id_);
    return switch_to_fallback();
  }

  device_ = Device::Fallback;
  if (!backend_->load(Device::Fallback)) {
    LOG_ERROR("[Worker {}] Model load failed on fallback device", slot_id_);
    return false;
  }
  loaded_ = true;
  LOG_INFO("[Worker {}] Speech model loaded on fallback device", slot_id_);
  return true;
}

std::vector<CaptionSegment>
TranscriptionService::transcribe(const std::string &audio_path) {
  std::string name = std::filesystem::path(audio_path).filename().string();

  if (!ensure_loaded()) {
    throw TranscriptionError(
        fmt::format("could not load speech model to transcribe {}", name));
  }

  std::vector<CaptionSegment> segments;
  if (backend_->transcribe(audio_path, segments)) {
    LOG_INFO("[Worker {}] Transcribed {} on {} device ({} segments)", slot_id_,
             name, to_string(device_), segments.size());
    return segments;
  }

  if (device_ == Device::Accelerated) {
    LOG_WARN("[Worker {}] Transcription failed on accelerated device, "
             "retrying {} on fallback",
             slot_id_, name);
    if (!switch_to_fallback()) {
      throw TranscriptionError(fmt::format(
          "fallback model load failed while transcribing {}", name));
    }
    segments.clear();
    if (backend_->transcribe(audio_path, segments)) {
      LOG_INFO("[Worker {}] Transcribed {} on {} device ({} segments)",
               slot_id_, name, to_string(device_), segments.size());
      return segments;
    }
  }

  throw TranscriptionError(
      fmt::format("transcription of {} failed on fallback device", name));
}

} // namespace vidcap
