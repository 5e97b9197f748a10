/**
 * @file media_probe.hpp
 * @brief Container duration and image size lookup via libavformat
 *
 * @attention THREAD MODEL:
 *            - Each call opens its own AVFormatContext, so probes may run
 *              from any worker concurrently.
 */

#ifndef VIDCAP_MEDIA_PROBE_HPP
#define VIDCAP_MEDIA_PROBE_HPP

#include <string>

#include "types.hpp"

struct AVFormatContext;

namespace vidcap {

/**
 * @class MediaProbe
 * @brief Owns one opened input for the lifetime of the object.
 *
 * @note The destructor closes the input even when open() failed halfway.
 */
class MediaProbe {
  AVFormatContext *fmt_ctx = nullptr;

public:
  MediaProbe() = default;
  ~MediaProbe();

  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the file and read stream info.
   * @return false on any libav error (logged)
   */
  bool open(const std::string &path);

  /// Container duration in seconds, or <= 0 if unknown
  double duration() const;

  /**
   * @brief Size of the best video stream (still images decode as one frame).
   * @return false if the file has no video stream
   */
  bool video_size(ImageSize &out) const;
};

/**
 * @brief Duration of an audio file in seconds.
 * @return false if the file cannot be opened or has no duration
 */
bool probe_duration(const std::string &path, double &seconds);

/**
 * @brief Pixel size of an image file.
 */
bool probe_image_size(const std::string &path, ImageSize &size);

} // namespace vidcap

#endif // VIDCAP_MEDIA_PROBE_HPP
