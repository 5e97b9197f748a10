/**
 * @file ffmpeg_executor.cpp
 * @brief Encoder process execution
 */

#include "vidcap/ffmpeg_executor.hpp"

#include <cstdio>
#include <deque>
#include <sys/wait.h>

#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

void emit_line(std::string &line, const LineHandler &on_line,
               std::deque<std::string> &tail) {
  if (line.empty())
    return;
  if (on_line)
    on_line(line);
  tail.push_back(line);
  if (tail.size() > DIAGNOSTIC_TAIL_LINES)
    tail.pop_front();
  line.clear();
}

} // anonymous namespace

EncodeOutcome execute_encoder(const EncodeCommand &command,
                              const LineHandler &on_line, int job_id) {
  EncodeOutcome outcome;
  std::string cmd = command.to_shell() + " 2>&1";

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    if (job_id >= 0) {
      LOG_ERROR("[Job {}] Failed to launch encoder", job_id);
    } else {
      LOG_ERROR("Failed to launch encoder");
    }
    return outcome;
  }

  std::deque<std::string> tail;
  std::string line;
  char buffer[4096];
  size_t n;
  try {
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
      for (size_t i = 0; i < n; ++i) {
        char ch = buffer[i];
        if (ch == '\n' || ch == '\r') {
          emit_line(line, on_line, tail);
        } else {
          line += ch;
        }
      }
    }
    emit_line(line, on_line, tail);
  } catch (...) {
    /// Reap the child before the handler's exception leaves this frame
    if (pclose(pipe) == -1)
      LOG_WARN("Could not reap the encoder process");
    throw;
  }

  int status = pclose(pipe);
  if (status == -1) {
    outcome.exit_code = -1;
  } else if (WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else {
    /// Killed by a signal
    outcome.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }

  outcome.tail.assign(tail.begin(), tail.end());

  if (outcome.exit_code != 0) {
    if (job_id >= 0) {
      LOG_ERROR("[Job {}] Encoder failed with status {}", job_id,
                outcome.exit_code);
    } else {
      LOG_ERROR("Encoder failed with status {}", outcome.exit_code);
    }
  }

  return outcome;
}

} // namespace vidcap
