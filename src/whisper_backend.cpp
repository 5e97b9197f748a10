/**
 * @file whisper_backend.cpp
 * @brief whisper.cpp model load and inference
 */

#include "vidcap/whisper_backend.hpp"

#include <whisper.h>

#include "vidcap/audio_decoder.hpp"
#include "vidcap/logging.hpp"
#include "vidcap/system.hpp"

namespace vidcap {

WhisperBackend::WhisperBackend(std::string model_path, int threads,
                               std::string language)
    : model_path_(std::move(model_path)), threads_(threads > 0 ? threads : 1),
      language_(std::move(language)) {}

WhisperBackend::~WhisperBackend() { unload(); }

bool WhisperBackend::accelerator_available() const { return gpu_available(); }

bool WhisperBackend::load(Device device) {
  unload();

  whisper_context_params cparams = whisper_context_default_params();
  cparams.use_gpu = (device == Device::Accelerated);

  ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
  if (!ctx_) {
    LOG_ERROR("Failed to load whisper model {} ({} device)", model_path_,
              to_string(device));
    return false;
  }
  return true;
}

void WhisperBackend::unload() {
  if (ctx_) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

bool WhisperBackend::transcribe(const std::string &audio_path,
                                std::vector<CaptionSegment> &segments) {
  if (!ctx_) {
    LOG_ERROR("Whisper model not loaded");
    return false;
  }

  std::vector<float> pcm;
  if (!decode_audio_mono16k(audio_path, pcm))
    return false;

  whisper_full_params params =
      whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  params.n_threads = threads_;
  params.language = language_.c_str();
  params.token_timestamps = true;
  params.print_progress = false;
  params.print_realtime = false;
  params.print_special = false;
  params.print_timestamps = false;

  if (whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size())) !=
      0) {
    LOG_ERROR("whisper_full failed for {}", audio_path);
    return false;
  }

  const int n = whisper_full_n_segments(ctx_);
  segments.clear();
  segments.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    /// Segment times are in 10 ms units
    double t0 = whisper_full_get_segment_t0(ctx_, i) * 0.01;
    double t1 = whisper_full_get_segment_t1(ctx_, i) * 0.01;
    const char *text = whisper_full_get_segment_text(ctx_, i);
    if (!text || t1 <= t0)
      continue;
    segments.push_back({t0, t1, text});
  }
  return true;
}

} // namespace vidcap
