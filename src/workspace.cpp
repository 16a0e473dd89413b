/**
 * @file workspace.cpp
 * @brief Workspace lifecycle implementation
 */

#include "img2reel/workspace.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/core.h>

#include "img2reel/logging.hpp"
#include "img2reel/system.hpp"

namespace img2reel {

namespace fs = std::filesystem;

namespace {

constexpr char ARTIFACT_PREFIX[] = "reel-";
constexpr char ARTIFACT_EXTENSION[] = ".mp4";

bool ensure_directory(const fs::path &dir, const char *what, Error &err) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  /// create_directories reports an error when a racing thread created the
  /// directory first; only a missing directory afterwards is a failure
  std::error_code dir_ec;
  if (fs::is_directory(dir, dir_ec)) {
    return true;
  }
  err.set(ErrorKind::Internal,
          fmt::format("Cannot create {} directory: {}", what,
                      ec ? ec.message() : "not a directory"));
  LOG_ERROR("Cannot create {} directory {}: {}", what, dir.string(),
            ec ? ec.message() : "not a directory");
  return false;
}

} // anonymous namespace

WorkspaceManager::WorkspaceManager(fs::path output_dir, fs::path work_dir)
    : output_dir_(std::move(output_dir)), work_dir_(std::move(work_dir)) {}

bool WorkspaceManager::ensure_output_directory(Error &err) {
  return ensure_directory(output_dir_, "output", err);
}

bool WorkspaceManager::ensure_work_directory(Error &err) {
  return ensure_directory(work_dir_, "work", err);
}

// **---- Naming ----**

std::string WorkspaceManager::artifact_filename(const std::string &id) {
  return fmt::format("{}{}{}", ARTIFACT_PREFIX, id, ARTIFACT_EXTENSION);
}

bool WorkspaceManager::is_artifact_name(const std::string &name) {
  const size_t prefix_len = sizeof(ARTIFACT_PREFIX) - 1;
  const size_t ext_len = sizeof(ARTIFACT_EXTENSION) - 1;
  if (name.size() <= prefix_len + ext_len ||
      name.compare(0, prefix_len, ARTIFACT_PREFIX) != 0) {
    return false;
  }
  std::string ext = name.substr(name.size() - ext_len);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ARTIFACT_EXTENSION;
}

bool WorkspaceManager::is_partial_name(const std::string &name) {
  static const std::string PART_SUFFIX = ".part";
  if (name.size() <= 1 + PART_SUFFIX.size() || name[0] != '.' ||
      name.compare(name.size() - PART_SUFFIX.size(), PART_SUFFIX.size(),
                   PART_SUFFIX) != 0) {
    return false;
  }
  return is_artifact_name(
      name.substr(1, name.size() - 1 - PART_SUFFIX.size()));
}

bool WorkspaceManager::make_temp_path(const std::string &label,
                                      const std::string &extension,
                                      std::string &out, Error &err) const {
  std::string token;
  if (!generate_token(12, token)) {
    err.set(ErrorKind::Internal, "Entropy source unavailable");
    return false;
  }
  out = (work_dir_ / fmt::format("img2reel-{}-{}{}", label, token, extension))
            .string();
  return true;
}

// **---- Cleanup ----**

int WorkspaceManager::purge_artifacts() {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return purge_locked("[Workspace]");
}

int WorkspaceManager::purge_locked(const std::string &tag) {
  int removed = 0;
  std::error_code ec;
  fs::directory_iterator it(output_dir_, ec);
  if (ec) {
    LOG_WARN("{} Purge skipped, cannot list {}: {}", tag,
             output_dir_.string(), ec.message());
    return 0;
  }

  const fs::directory_iterator end;
  while (it != end) {
    const fs::directory_entry &entry = *it;
    std::error_code type_ec;
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(type_ec) &&
        (is_artifact_name(name) || is_partial_name(name))) {
      std::error_code rm_ec;
      if (fs::remove(entry.path(), rm_ec)) {
        ++removed;
      } else if (rm_ec) {
        LOG_WARN("{} Failed to purge {}: {}", tag, name, rm_ec.message());
      }
    }

    it.increment(ec);
    if (ec) {
      LOG_WARN("{} Purge stopped early in {}: {}", tag, output_dir_.string(),
               ec.message());
      break;
    }
  }
  return removed;
}

void WorkspaceManager::release(const std::string &path) noexcept {
  if (path.empty())
    return;
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Failed to release {}: {}", fs::path(path).filename().string(),
             ec.message());
  }
}

// **---- Publish ----**

bool WorkspaceManager::publish(const std::string &tag,
                               const std::string &temp_file,
                               const std::string &filename,
                               std::string &final_path, Error &err) {
  const fs::path target = output_dir_ / filename;

  std::lock_guard<std::mutex> lock(publish_mutex_);

  if (!ensure_output_directory(err)) {
    return false;
  }

  int purged = purge_locked(tag);
  if (purged > 0) {
    LOG_INFO("{} Purged {} previous file(s)", tag, purged);
  }

  std::error_code ec;
  fs::rename(temp_file, target, ec);
  if (ec == std::errc::cross_device_link) {
    /// Work dir on another filesystem: copy next to the target, then rename
    /// so the artifact never appears half-written
    const fs::path part = output_dir_ / fmt::format(".{}.part", filename);
    ec.clear();
    fs::copy_file(temp_file, part, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
      fs::rename(part, target, ec);
    }
    if (ec) {
      release(part.string());
    } else {
      release(temp_file);
    }
  }

  if (ec) {
    err.set(ErrorKind::Internal,
            fmt::format("Failed to publish artifact: {}", ec.message()));
    LOG_ERROR("{} Failed to publish {}: {}", tag, filename, ec.message());
    return false;
  }

  final_path = target.string();
  return true;
}

} // namespace img2reel
