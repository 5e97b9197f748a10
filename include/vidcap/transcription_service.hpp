/**
 * @file transcription_service.hpp
 * @brief Speech-to-text with a one-shot accelerated -> fallback device retry
 *
 * @details The service owns device selection. The first load tries the
 *          accelerated device when the backend reports one. Any load or
 *          inference failure there disables the accelerated path for the
 *          lifetime of the service and the request is retried once on the
 *          fallback device. A failure on the fallback device is fatal.
 *
 * @attention THREAD MODEL:
 *            - One service per worker slot. A service is never shared
 *              between concurrently running jobs.
 */

#ifndef VIDCAP_TRANSCRIPTION_SERVICE_HPP
#define VIDCAP_TRANSCRIPTION_SERVICE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

namespace vidcap {

/**
 * @enum Device
 * @brief Execution target for the speech model.
 */
enum class Device { Accelerated, Fallback };

const char *to_string(Device device);

/**
 * @class TranscriptionError
 * @brief Thrown when neither device could produce a transcript.
 */
class TranscriptionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class TranscriptionBackend
 * @brief Black-box speech model. Implementations report failure by return
 *        value and log the cause.
 */
class TranscriptionBackend {
public:
  virtual ~TranscriptionBackend() = default;

  /// True if an accelerated device exists on this machine
  virtual bool accelerator_available() const = 0;

  /// Load the model onto a device (replacing any loaded model)
  virtual bool load(Device device) = 0;

  /// Release the loaded model
  virtual void unload() = 0;

  /**
   * @brief Transcribe with word-level timing enabled.
   * @param segments Receives time-ordered segments
   */
  virtual bool transcribe(const std::string &audio_path,
                          std::vector<CaptionSegment> &segments) = 0;
};

/**
 * @class TranscriptionService
 * @brief Device selection and the single fallback retry.
 */
class TranscriptionService {
public:
  /**
   * @enum AcceleratorState
   * @brief Accelerated path state. Failed is terminal.
   */
  enum class AcceleratorState { NotYetTried, Active, Failed };

  /**
   * @param backend Model implementation (owned)
   * @param allow_accelerator false forces the fallback device
   * @param slot_id Worker slot index for logging (-1 = no prefix)
   */
  TranscriptionService(std::unique_ptr<TranscriptionBackend> backend,
                       bool allow_accelerator, int slot_id = -1);

  /**
   * @brief Transcribe an audio file.
   * @throws TranscriptionError if the fallback device also fails
   */
  std::vector<CaptionSegment> transcribe(const std::string &audio_path);

  AcceleratorState accelerator_state() const { return accel_state_; }

  /// Device of the currently loaded model (valid once loaded)
  Device device() const { return device_; }

  bool loaded() const { return loaded_; }

private:
  std::unique_ptr<TranscriptionBackend> backend_;
  AcceleratorState accel_state_;
  Device device_ = Device::Fallback;
  bool loaded_ = false;
  int slot_id_;

  /// Load on the preferred device, dropping to fallback on failure
  bool ensure_loaded();

  /// Mark the accelerated path dead and reload on the fallback device
  bool switch_to_fallback();
};

} // namespace vidcap

#endif // VIDCAP_TRANSCRIPTION_SERVICE_HPP
