/**
 * @file project_scanner.hpp
 * @brief Project folder discovery and validation
 *
 * @details A project folder holds one narration track, one or more images
 *          and optionally a script.txt. Only folders with a voiceover and at
 *          least one image are ever submitted for rendering.
 */

#ifndef VIDCAP_PROJECT_SCANNER_HPP
#define VIDCAP_PROJECT_SCANNER_HPP

#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace vidcap {

/**
 * @brief Collect the project files inside one folder.
 * @note Voiceover = first file with the highest-priority audio extension
 *       (.mp3 .wav .m4a .aac .ogg .flac). Images are sorted by file name.
 */
ProjectInput discover_project(const std::string &folder);

/**
 * @brief Check a folder for the required files.
 * @return (valid, human-readable summary or list of what is missing)
 */
std::pair<bool, std::string> validate_project(const std::string &folder);

/**
 * @brief Find renderable projects.
 * @return The folder itself if it is a valid project, otherwise every valid
 *         immediate sub-folder, sorted by path
 */
std::vector<std::string> scan_for_projects(const std::string &parent);

/**
 * @brief Output path for a project: <folder>/<folder name>.mp4
 */
std::string output_path_for(const std::string &folder);

} // namespace vidcap

#endif // VIDCAP_PROJECT_SCANNER_HPP
