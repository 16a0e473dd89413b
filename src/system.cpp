/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Identifier generation backed by OpenSSL RAND_bytes
 *
 *          - Message redaction and duration formatting
 */

#include "img2reel/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <openssl/rand.h>

#include <fmt/core.h>

#include "img2reel/config.hpp"

namespace img2reel {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // anonymous namespace

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  if (line.empty())
    return cpus;

  try {
    size_t pos = 0;
    while (pos < line.size()) {
      size_t end = line.find_first_of(",-", pos);
      if (end == std::string::npos)
        end = line.size();

      int start_cpu = std::stoi(line.substr(pos, end - pos));

      if (end < line.size() && line[end] == '-') {
        /// Range like "0-3"
        pos = end + 1;
        end = line.find(',', pos);
        if (end == std::string::npos)
          end = line.size();
        int end_cpu = std::stoi(line.substr(pos, end - pos));
        for (int cpu = start_cpu; cpu <= end_cpu; ++cpu) {
          cpus.push_back(cpu);
        }
      } else {
        /// Single CPU
        cpus.push_back(start_cpu);
      }

      pos = (end < line.size()) ? end + 1 : line.size();
    }
  } catch (const std::exception &) {
    /// Unparseable cpuset: treat as unknown
    cpus.clear();
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !quota_str.empty() && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_encode_workers() {
  int configured = Config::encode_workers();
  if (configured > 0) {
    return configured;
  }
  return std::max(1, detect_cpu_limit() / 4);
}

// **---- Identifiers ----**

bool generate_uuid_v4(std::string &out) {
  unsigned char id[16];
  if (RAND_bytes(id, sizeof(id)) != 1) {
    return false;
  }

  /// RFC 4122 variant + version 4
  id[6] = static_cast<unsigned char>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<unsigned char>((id[8] & 0x3F) | 0x80);

  out.clear();
  out.reserve(36);
  for (size_t i = 0; i < sizeof(id); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      out += '-';
    out += HEX_DIGITS[id[i] >> 4];
    out += HEX_DIGITS[id[i] & 0x0F];
  }
  return true;
}

bool generate_token(size_t bytes, std::string &out) {
  std::vector<unsigned char> buf(bytes);
  if (bytes == 0 || RAND_bytes(buf.data(), static_cast<int>(bytes)) != 1) {
    return false;
  }
  out.clear();
  out.reserve(bytes * 2);
  for (unsigned char b : buf) {
    out += HEX_DIGITS[b >> 4];
    out += HEX_DIGITS[b & 0x0F];
  }
  return true;
}

// **---- Utilities ----**

std::string redact_paths(std::string message,
                         const std::vector<std::string> &prefixes) {
  for (const auto &raw : prefixes) {
    if (raw.empty())
      continue;
    std::string prefix = raw;
    if (prefix.back() != '/')
      prefix += '/';

    size_t pos = 0;
    while ((pos = message.find(prefix, pos)) != std::string::npos) {
      message.erase(pos, prefix.size());
    }
  }
  return message;
}

std::string format_duration_us(long us) {
  if (us < 1000000) {
    return fmt::format("{}ms", us / 1000);
  }
  return fmt::format("{:.2f}s", us / 1000000.0);
}

} // namespace img2reel
