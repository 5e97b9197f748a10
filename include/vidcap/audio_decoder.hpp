/**
 * @file audio_decoder.hpp
 * @brief Decodes any audio file to 16 kHz mono float PCM
 *
 * @details avformat demux -> avcodec decode -> swresample to the format the
 *          speech model consumes. Both the decoder and the resampler are
 *          flushed so the tail of the narration is not lost.
 */

#ifndef VIDCAP_AUDIO_DECODER_HPP
#define VIDCAP_AUDIO_DECODER_HPP

#include <string>
#include <vector>

namespace vidcap {

/// Sample rate expected by the whisper model
constexpr int TRANSCRIBE_SAMPLE_RATE = 16000;

/**
 * @brief Decode an audio file into mono float samples at 16 kHz.
 *
 * @param path Audio file
 * @param samples Receives the PCM data (cleared first)
 * @return false if the file cannot be decoded (logged)
 */
bool decode_audio_mono16k(const std::string &path, std::vector<float> &samples);

} // namespace vidcap

#endif // VIDCAP_AUDIO_DECODER_HPP
