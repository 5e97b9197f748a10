/**
 * @file project_scanner.cpp
 * @brief Project folder discovery implementation
 */

#include "vidcap/project_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "vidcap/logging.hpp"

namespace vidcap {

namespace fs = std::filesystem;

namespace {

const char *const AUDIO_EXTENSIONS[] = {".mp3", ".wav", ".m4a",
                                        ".aac", ".ogg", ".flac"};
const char *const IMAGE_EXTENSIONS[] = {".png", ".jpg", ".jpeg", ".webp"};
constexpr const char *SCRIPT_NAME = "script.txt";

std::string lower_extension(const fs::path &p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

/// Regular files in a folder, sorted by file name
std::vector<fs::path> list_files(const std::string &folder) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec))
      files.push_back(it->path());
  }
  if (ec) {
    LOG_WARN("Could not list {}: {}", folder, ec.message());
  }
  std::sort(files.begin(), files.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename() < b.filename();
            });
  return files;
}

} // anonymous namespace

ProjectInput discover_project(const std::string &folder) {
  ProjectInput project;
  project.folder = folder;

  auto files = list_files(folder);

  for (const char *ext : AUDIO_EXTENSIONS) {
    auto it = std::find_if(files.begin(), files.end(), [&](const fs::path &p) {
      return lower_extension(p) == ext;
    });
    if (it != files.end()) {
      project.voiceover = it->string();
      break;
    }
  }

  for (const auto &p : files) {
    std::string ext = lower_extension(p);
    if (std::find(std::begin(IMAGE_EXTENSIONS), std::end(IMAGE_EXTENSIONS),
                  ext) != std::end(IMAGE_EXTENSIONS)) {
      project.images.push_back(p.string());
    }
    if (p.filename() == SCRIPT_NAME) {
      project.script = p.string();
    }
  }

  return project;
}

std::pair<bool, std::string> validate_project(const std::string &folder) {
  ProjectInput project = discover_project(folder);

  std::vector<std::string> missing;
  if (project.voiceover.empty())
    missing.emplace_back("voiceover audio");
  if (project.images.empty())
    missing.emplace_back("at least 1 image");

  if (!missing.empty()) {
    std::string list;
    for (size_t i = 0; i < missing.size(); ++i) {
      if (i > 0)
        list += ", ";
      list += missing[i];
    }
    return {false, fmt::format("Missing files: {}", list)};
  }

  if (project.images.size() == 1)
    return {true, "Found 1 image (used for the entire video)"};
  return {true, fmt::format("Found {} images (distributed across the video)",
                            project.images.size())};
}

std::vector<std::string> scan_for_projects(const std::string &parent) {
  std::vector<std::string> projects;
  std::error_code ec;
  if (!fs::is_directory(parent, ec)) {
    LOG_ERROR("Not a directory: {}", parent);
    return projects;
  }

  if (validate_project(parent).first) {
    projects.push_back(parent);
    return projects;
  }

  for (fs::directory_iterator it(parent, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory(ec))
      continue;
    std::string sub = it->path().string();
    auto check = validate_project(sub);
    if (check.first) {
      projects.push_back(sub);
    } else {
      LOG_WARN("Skipping {}: {}", it->path().filename().string(),
               check.second);
    }
  }

  std::sort(projects.begin(), projects.end());
  return projects;
}

std::string output_path_for(const std::string &folder) {
  fs::path dir(folder);
  std::string name = dir.filename().string();
  if (name.empty() || name == ".")
    name = fs::absolute(dir).lexically_normal().parent_path().filename().string();
  return (dir / (name + ".mp4")).string();
}

} // namespace vidcap
