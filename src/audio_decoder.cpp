/**
 * @file audio_decoder.cpp
 * @brief libav audio decode and resample implementation
 */

#include "vidcap/audio_decoder.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

/**
 * @struct DecodeContext
 * @brief All libav state for one decode. Freed in reverse allocation order.
 */
struct DecodeContext {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  SwrContext *swr_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int stream_idx = -1;

  DecodeContext() = default;
  DecodeContext(const DecodeContext &) = delete;
  DecodeContext &operator=(const DecodeContext &) = delete;

  ~DecodeContext() {
    if (pkt)
      av_packet_free(&pkt);
    if (frame)
      av_frame_free(&frame);
    if (swr_ctx)
      swr_free(&swr_ctx);
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
  }
};

/// Convert one frame (or flush the resampler when frame is null)
bool append_resampled(DecodeContext &ctx, const AVFrame *frame,
                      std::vector<float> &samples) {
  int in_samples = frame ? frame->nb_samples : 0;
  int out_capacity =
      swr_get_out_samples(ctx.swr_ctx, in_samples) + 32;
  if (out_capacity <= 0)
    return true;

  size_t offset = samples.size();
  samples.resize(offset + static_cast<size_t>(out_capacity));
  uint8_t *out = reinterpret_cast<uint8_t *>(samples.data() + offset);

  int converted = swr_convert(
      ctx.swr_ctx, &out, out_capacity,
      frame ? const_cast<const uint8_t **>(frame->extended_data) : nullptr,
      in_samples);
  if (converted < 0) {
    samples.resize(offset);
    return false;
  }
  samples.resize(offset + static_cast<size_t>(converted));
  return true;
}

/// Drain all frames currently available from the decoder
bool drain_decoder(DecodeContext &ctx, std::vector<float> &samples) {
  while (true) {
    int ret = avcodec_receive_frame(ctx.dec_ctx, ctx.frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      return true;
    if (ret < 0)
      return false;
    bool ok = append_resampled(ctx, ctx.frame, samples);
    av_frame_unref(ctx.frame);
    if (!ok)
      return false;
  }
}

} // anonymous namespace

bool decode_audio_mono16k(const std::string &path,
                          std::vector<float> &samples) {
  samples.clear();
  DecodeContext ctx;

  if (avformat_open_input(&ctx.fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("Failed to open audio: {}", path);
    return false;
  }
  if (avformat_find_stream_info(ctx.fmt_ctx, nullptr) < 0) {
    LOG_ERROR("Failed to read stream info: {}", path);
    return false;
  }

  ctx.stream_idx =
      av_find_best_stream(ctx.fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (ctx.stream_idx < 0) {
    LOG_ERROR("No audio stream in {}", path);
    return false;
  }

  const AVCodecParameters *par = ctx.fmt_ctx->streams[ctx.stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(par->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder for codec ID {} in {}", static_cast<int>(par->codec_id),
              path);
    return false;
  }

  ctx.dec_ctx = avcodec_alloc_context3(codec);
  if (!ctx.dec_ctx ||
      avcodec_parameters_to_context(ctx.dec_ctx, par) < 0 ||
      avcodec_open2(ctx.dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("Failed to open decoder for {}", path);
    return false;
  }

  AVChannelLayout mono;
  av_channel_layout_default(&mono, 1);
  if (swr_alloc_set_opts2(&ctx.swr_ctx, &mono, AV_SAMPLE_FMT_FLT,
                          TRANSCRIBE_SAMPLE_RATE, &ctx.dec_ctx->ch_layout,
                          ctx.dec_ctx->sample_fmt, ctx.dec_ctx->sample_rate, 0,
                          nullptr) < 0 ||
      swr_init(ctx.swr_ctx) < 0) {
    LOG_ERROR("Failed to set up resampler for {}", path);
    return false;
  }

  ctx.frame = av_frame_alloc();
  ctx.pkt = av_packet_alloc();
  if (!ctx.frame || !ctx.pkt) {
    LOG_ERROR("Failed to allocate frame/packet");
    return false;
  }

  /// Pre-size for the whole narration when the container knows its length
  if (ctx.fmt_ctx->duration > 0) {
    samples.reserve(static_cast<size_t>(
        ctx.fmt_ctx->duration / AV_TIME_BASE * TRANSCRIBE_SAMPLE_RATE + 1));
  }

  while (av_read_frame(ctx.fmt_ctx, ctx.pkt) >= 0) {
    if (ctx.pkt->stream_index != ctx.stream_idx) {
      av_packet_unref(ctx.pkt);
      continue;
    }
    int ret = avcodec_send_packet(ctx.dec_ctx, ctx.pkt);
    av_packet_unref(ctx.pkt);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      /// Skip corrupt packets, keep decoding
      continue;
    }
    if (!drain_decoder(ctx, samples)) {
      LOG_ERROR("Decode error in {}", path);
      return false;
    }
  }

  /// Flush decoder, then resampler
  if (avcodec_send_packet(ctx.dec_ctx, nullptr) < 0) {
    LOG_WARN("Decoder refused flush for {}", path);
  }
  if (!drain_decoder(ctx, samples) ||
      !append_resampled(ctx, nullptr, samples)) {
    LOG_ERROR("Decode flush failed for {}", path);
    return false;
  }

  if (samples.empty()) {
    LOG_ERROR("No audio samples decoded from {}", path);
    return false;
  }
  return true;
}

} // namespace vidcap
