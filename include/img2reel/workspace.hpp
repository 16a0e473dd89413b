/**
 * @file workspace.hpp
 * @brief Temporary-file and output-directory lifecycle
 *
 * @details The WorkspaceManager owns two directories:
 *
 *          - work_dir: staged inputs and intermediate encode segments,
 *            named with random tokens, never served
 *
 *          - output_dir: finished artifacts only (reel-<uuid>.mp4)
 *
 *          Publishing a new artifact purges every previous artifact and
 *          moves the new file in, under a single mutex so concurrent
 *          requests cannot interleave their purge and write steps.
 */

#ifndef IMG2REEL_WORKSPACE_HPP
#define IMG2REEL_WORKSPACE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

#include "types.hpp"

namespace img2reel {

/**
 * @class WorkspaceManager
 * @brief Owns temp naming, directory creation, purge and publish.
 */
class WorkspaceManager {
public:
  /**
   * @param output_dir Public artifact directory
   * @param work_dir Private directory for transient files
   */
  WorkspaceManager(std::filesystem::path output_dir,
                   std::filesystem::path work_dir);

  /**
   * @brief Create the output directory if missing.
   * @note Idempotent and safe to call from several threads.
   */
  bool ensure_output_directory(Error &err);

  /**
   * @brief Create the work directory if missing.
   */
  bool ensure_work_directory(Error &err);

  /**
   * @brief Delete every finished artifact in the output directory, along
   *        with ".part" copies left behind by an interrupted publish.
   * @note Failures are logged and swallowed: stale files are acceptable.
   * @return Number of files removed
   */
  int purge_artifacts();

  /**
   * @brief Best-effort delete of a staged input or intermediate file.
   * @note Never throws; a missing file is not an error.
   */
  void release(const std::string &path) noexcept;

  /**
   * @brief Reserve a unique path in the work directory.
   * @param label Short descriptive label ("src", "intro", "main")
   * @param extension Extension including the dot
   * @param out Output: absolute path (the file is not created)
   */
  bool make_temp_path(const std::string &label, const std::string &extension,
                      std::string &out, Error &err) const;

  /**
   * @brief Publish a finished encode as the current artifact.
   *
   * @details Under the publish mutex: ensure the output directory exists,
   *          purge all previous artifacts, then move temp_file to
   *          output_dir/filename. A cross-filesystem move copies into a
   *          hidden ".part" file and renames it so the artifact appears
   *          atomically.
   *
   * @param tag Log prefix of the publishing request
   * @param temp_file Finished encode in the work directory
   * @param filename Artifact file name (reel-<id>.mp4)
   * @param final_path Output: absolute path of the published artifact
   */
  bool publish(const std::string &tag, const std::string &temp_file,
               const std::string &filename, std::string &final_path,
               Error &err);

  /// Artifact file name for an identifier
  static std::string artifact_filename(const std::string &id);

  /// True for names matching reel-*.mp4 (case-insensitive extension)
  static bool is_artifact_name(const std::string &name);

  /// True for the hidden ".reel-*.mp4.part" copies made by publish()
  static bool is_partial_name(const std::string &name);

  const std::filesystem::path &output_dir() const { return output_dir_; }
  const std::filesystem::path &work_dir() const { return work_dir_; }

private:
  std::filesystem::path output_dir_;
  std::filesystem::path work_dir_;
  std::mutex publish_mutex_; //< Serializes purge + move into output_dir_

  int purge_locked(const std::string &tag);
};

/**
 * @class TempFileGuard
 * @brief RAII release of a transient file on every exit path.
 */
class TempFileGuard {
public:
  TempFileGuard(WorkspaceManager &workspace, std::string path)
      : workspace_(workspace), path_(std::move(path)) {}
  ~TempFileGuard() {
    if (!path_.empty()) {
      workspace_.release(path_);
    }
  }

  TempFileGuard(const TempFileGuard &) = delete;
  TempFileGuard &operator=(const TempFileGuard &) = delete;

  const std::string &path() const { return path_; }

private:
  WorkspaceManager &workspace_;
  std::string path_;
};

} // namespace img2reel

#endif // IMG2REEL_WORKSPACE_HPP
