/**
 * @file whisper_backend.hpp
 * @brief whisper.cpp implementation of TranscriptionBackend
 */

#ifndef VIDCAP_WHISPER_BACKEND_HPP
#define VIDCAP_WHISPER_BACKEND_HPP

#include <string>
#include <vector>

#include "transcription_service.hpp"

struct whisper_context;

namespace vidcap {

/**
 * @class WhisperBackend
 * @brief Owns one whisper_context. Audio is decoded with decode_audio_mono16k.
 */
class WhisperBackend : public TranscriptionBackend {
public:
  /**
   * @param model_path ggml model file
   * @param threads Inference threads
   * @param language Language hint ("auto" to detect)
   */
  WhisperBackend(std::string model_path, int threads, std::string language);
  ~WhisperBackend() override;

  WhisperBackend(const WhisperBackend &) = delete;
  WhisperBackend &operator=(const WhisperBackend &) = delete;

  bool accelerator_available() const override;
  bool load(Device device) override;
  void unload() override;
  bool transcribe(const std::string &audio_path,
                  std::vector<CaptionSegment> &segments) override;

private:
  std::string model_path_;
  int threads_;
  std::string language_;
  whisper_context *ctx_ = nullptr;
};

} // namespace vidcap

#endif // VIDCAP_WHISPER_BACKEND_HPP
