/**
 * @file main.cpp
 * @brief Entry point for the vidcap batch renderer
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Project discovery (single project or a parent of projects)
 *
 *          - Settings snapshot loading
 *
 *          - Batch rendering with BatchRenderer
 *
 * @note Set PARALLEL_JOBS to control how many projects render at once.
 *       The exit code is the number of failed projects.
 */

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "vidcap/batch_renderer.hpp"
#include "vidcap/config.hpp"
#include "vidcap/logging.hpp"
#include "vidcap/project_scanner.hpp"
#include "vidcap/render_settings.hpp"
#include "vidcap/system.hpp"
#include "vidcap/whisper_backend.hpp"

using namespace vidcap;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    LOG_WARN("Usage: ./vidcap <project-or-parent-folder> [settings.json]");
    return 1;
  }

  std::string input_arg = argv[1];

  RenderSettings settings;
  if (argc >= 3) {
    if (!load_settings_file(argv[2], settings)) {
      return 1;
    }
  } else {
    normalize_settings(settings);
  }

  auto folders = scan_for_projects(input_arg);
  if (folders.empty()) {
    LOG_WARN("No valid projects found in {}", input_arg);
    return 0;
  }

  LOG_INFO("vidcap - Batch Render");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Found {} project(s)", folders.size());
  log_settings(settings);

  const WorkerBudget budget = plan_worker_budget(
      Config::parallel_jobs(), static_cast<int>(folders.size()));
  const int threads = budget.inference_threads;
  LOG_INFO("Speech model: {} ({} threads/worker, language {})",
           Config::whisper_model(), threads, Config::whisper_language());

  BackendFactory factory = [threads](int) {
    return std::make_unique<WhisperBackend>(Config::whisper_model(), threads,
                                            Config::whisper_language());
  };

  BatchRenderer renderer(budget.workers, factory, default_render_services(),
                         Config::use_gpu());

  renderer.set_progress_callback(
      [](const std::string &folder, int pct, const std::string &status) {
        LOG_INFO("[Progress] {}: {}% {}", folder, pct, status);
      });

  auto results = renderer.render(folders, settings);
  return BatchRenderer::count_failures(results);
}
