/**
 * @file caption_segmenter.cpp
 * @brief Caption chunking, case folding and line wrapping
 */

#include "vidcap/caption_segmenter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace vidcap {

namespace {

std::string join_words(const std::vector<std::string> &words) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += words[i];
  }
  return out;
}

/// Code points of the words joined by single spaces
size_t joined_length(const std::vector<std::string> &words) {
  size_t n = words.empty() ? 0 : words.size() - 1;
  for (const auto &w : words)
    n += utf8_length(w);
  return n;
}

std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() &&
         std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

} // anonymous namespace

// **---- CaptionSegmenter ----**

CaptionSegmenter::CaptionSegmenter(int max_words, int max_chars)
    : max_words_(std::max(1, max_words)), max_chars_(std::max(1, max_chars)) {}

bool CaptionSegmenter::fits(const std::vector<std::string> &words) const {
  return static_cast<int>(words.size()) <= max_words_ &&
         static_cast<int>(joined_length(words)) <= max_chars_;
}

std::vector<CaptionChunk>
CaptionSegmenter::split_segment(const CaptionSegment &segment) const {
  auto words = split_words(segment.text);
  if (words.empty())
    return {};

  if (fits(words)) {
    return {{segment.start, segment.end, trim(segment.text)}};
  }

  /// Walk words, closing a chunk on a hard limit or a soft punctuation break
  std::vector<std::string> texts;
  std::vector<std::string> pending;
  const size_t soft_min = static_cast<size_t>(max_words_ / 2);

  for (const auto &word : words) {
    if (!pending.empty()) {
      pending.push_back(word);
      bool over = !fits(pending);
      pending.pop_back();
      if (over) {
        texts.push_back(join_words(pending));
        pending.clear();
      }
    }

    /// A lone over-long word still lands here and becomes its own chunk
    pending.push_back(word);

    if (ends_with_terminal_punctuation(word) && pending.size() >= soft_min) {
      texts.push_back(join_words(pending));
      pending.clear();
    }
  }

  if (!pending.empty()) {
    texts.push_back(join_words(pending));
  }

  /// Uniform re-timing over the parent span
  const size_t n = texts.size();
  const double duration = segment.end - segment.start;
  std::vector<CaptionChunk> chunks;
  chunks.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    double start = segment.start + duration * static_cast<double>(i) / n;
    double end = (i + 1 == n)
                     ? segment.end
                     : segment.start + duration * static_cast<double>(i + 1) / n;
    chunks.push_back({start, end, std::move(texts[i])});
  }
  return chunks;
}

std::vector<CaptionChunk>
CaptionSegmenter::split(const std::vector<CaptionSegment> &segments) const {
  std::vector<CaptionChunk> out;
  out.reserve(segments.size());
  for (const auto &segment : segments) {
    auto chunks = split_segment(segment);
    out.insert(out.end(), std::make_move_iterator(chunks.begin()),
               std::make_move_iterator(chunks.end()));
  }
  return out;
}

// **---- Text helpers ----**

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
      ++i;
    size_t start = i;
    while (i < text.size() &&
           !std::isspace(static_cast<unsigned char>(text[i])))
      ++i;
    if (i > start)
      words.push_back(text.substr(start, i - start));
  }
  return words;
}

size_t utf8_length(const std::string &text) {
  size_t n = 0;
  for (unsigned char c : text) {
    /// Count every byte that is not a continuation byte (10xxxxxx)
    if ((c & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

bool ends_with_terminal_punctuation(const std::string &word) {
  if (word.empty())
    return false;
  switch (word.back()) {
  case ',':
  case '.':
  case '!':
  case '?':
  case ';':
  case ':':
    return true;
  default:
    return false;
  }
}

std::string apply_text_case(const std::string &text, TextCase text_case) {
  std::string out = text;
  switch (text_case) {
  case TextCase::Upper:
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    break;
  case TextCase::Title: {
    bool word_start = true;
    for (auto &ch : out) {
      unsigned char c = static_cast<unsigned char>(ch);
      if (std::isalpha(c)) {
        ch = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
        word_start = false;
      } else {
        /// Apostrophes keep the word going ("don't" -> "Don't")
        word_start = (ch != '\'') && !(c & 0x80) && !std::isdigit(c);
      }
    }
    break;
  }
  case TextCase::None:
    break;
  }
  return out;
}

std::string wrap_line(const std::string &text, int width) {
  if (width <= 0 || static_cast<int>(utf8_length(text)) <= width)
    return text;
  if (text.find('\n') != std::string::npos)
    return text;

  const size_t mid = text.size() / 2;
  size_t best = std::string::npos;
  size_t best_dist = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != ' ')
      continue;
    size_t dist = (i > mid) ? i - mid : mid - i;
    if (best == std::string::npos || dist < best_dist) {
      best = i;
      best_dist = dist;
    }
  }

  if (best == std::string::npos)
    return text;

  std::string out = text;
  out[best] = '\n';
  return out;
}

void finalize_chunks(std::vector<CaptionChunk> &chunks, TextCase text_case,
                     int wrap_width) {
  for (auto &chunk : chunks) {
    chunk.text = apply_text_case(chunk.text, text_case);
    if (wrap_width > 0) {
      chunk.text = wrap_line(chunk.text, wrap_width);
    }
  }
}

} // namespace vidcap
