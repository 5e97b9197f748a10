/**
 * @file caption_segmenter.hpp
 * @brief Splits transcribed segments into display-sized caption chunks
 *
 * @details A segment that already fits passes through unchanged. Longer
 *          segments are walked word by word: a chunk is closed when the next
 *          word would exceed either limit, or early at terminal punctuation
 *          once the chunk holds at least half the word limit. Chunk times are
 *          a uniform subdivision of the parent segment.
 */

#ifndef VIDCAP_CAPTION_SEGMENTER_HPP
#define VIDCAP_CAPTION_SEGMENTER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "render_settings.hpp"
#include "types.hpp"

namespace vidcap {

/**
 * @class CaptionSegmenter
 * @brief Stateless splitter bounded by word and character limits.
 */
class CaptionSegmenter {
public:
  /**
   * @param max_words Word limit per chunk (values below 1 act as 1)
   * @param max_chars Character limit per chunk, counted in code points
   */
  CaptionSegmenter(int max_words, int max_chars);

  /**
   * @brief Split every segment and concatenate the resulting chunks.
   * @note Chunks of one segment, joined by single spaces, reproduce the
   *       segment's words in order; their spans tile [start, end] exactly.
   */
  std::vector<CaptionChunk>
  split(const std::vector<CaptionSegment> &segments) const;

  /**
   * @brief Split a single segment.
   */
  std::vector<CaptionChunk> split_segment(const CaptionSegment &segment) const;

  int max_words() const { return max_words_; }
  int max_chars() const { return max_chars_; }

private:
  int max_words_;
  int max_chars_;

  bool fits(const std::vector<std::string> &words) const;
};

// **---- Text helpers ----**

/**
 * @brief Split on any run of whitespace, dropping empty tokens.
 */
std::vector<std::string> split_words(const std::string &text);

/**
 * @brief Number of UTF-8 code points in text.
 */
size_t utf8_length(const std::string &text);

/**
 * @brief True if the word ends in , . ! ? ; or :
 */
bool ends_with_terminal_punctuation(const std::string &word);

/**
 * @brief Apply title-case / upper-case folding (ASCII letters only).
 */
std::string apply_text_case(const std::string &text, TextCase text_case);

/**
 * @brief Insert one line break near the middle of text if it is wider than
 *        width code points.
 * @note The break replaces the space closest to the midpoint. Text without
 *       spaces, or already within width, is returned unchanged.
 */
std::string wrap_line(const std::string &text, int width);

/**
 * @brief Case-fold and optionally wrap every chunk in place.
 * @param wrap_width 0 disables the wrap pass
 */
void finalize_chunks(std::vector<CaptionChunk> &chunks, TextCase text_case,
                     int wrap_width);

} // namespace vidcap

#endif // VIDCAP_CAPTION_SEGMENTER_HPP
