/**
 * @file ffmpeg_executor.hpp
 * @brief Runs the encoder and streams its diagnostic output
 *
 * @details The command runs through the shell with stderr folded into the
 *          pipe. Output is split on both '\r' and '\n' because the encoder
 *          rewrites its stats line in place.
 */

#ifndef VIDCAP_FFMPEG_EXECUTOR_HPP
#define VIDCAP_FFMPEG_EXECUTOR_HPP

#include <functional>
#include <string>
#include <vector>

#include "command_builder.hpp"

namespace vidcap {

/// Diagnostic lines kept for failure reports
constexpr size_t DIAGNOSTIC_TAIL_LINES = 20;

/**
 * @struct EncodeOutcome
 * @brief Exit status plus the last diagnostic lines.
 */
struct EncodeOutcome {
  int exit_code = -1; //< 0 on success, -1 if the process could not start
  std::vector<std::string> tail;
};

/// Called once per diagnostic line, on the calling thread
using LineHandler = std::function<void(const std::string &)>;

/**
 * @brief Execute an encoder command and wait for it to exit.
 *
 * @param command Command to run
 * @param on_line Receives every non-empty output line (may be empty)
 * @param job_id Job index for logging (-1 = no prefix)
 * @return Exit status and output tail
 */
EncodeOutcome execute_encoder(const EncodeCommand &command,
                              const LineHandler &on_line, int job_id = -1);

} // namespace vidcap

#endif // VIDCAP_FFMPEG_EXECUTOR_HPP
