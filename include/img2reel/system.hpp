/**
 * @file system.hpp
 * @brief System utilities: CPU detection, identifiers, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Encode worker count calculation
 *
 *          - Unpredictable identifier generation (UUID v4 from OpenSSL)
 *
 *          - Redaction of internal paths from user-visible messages
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef IMG2REEL_SYSTEM_HPP
#define IMG2REEL_SYSTEM_HPP

#include <string>
#include <vector>

namespace img2reel {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Calculate the number of encoder processes allowed at once.
 *
 * @note x264 already spreads one encode over several cores, so the auto
 *       value is one worker per four CPUs (at least one). A configured
 *       ENCODE_WORKERS value is used as-is.
 */
int calculate_encode_workers();

/// Parse cpuset strings like "0,2,4-7" into a CPU list
std::vector<int> parse_cpuset_string(const std::string &line);

// **---- Identifiers ----**

/**
 * @brief Generate a random RFC 4122 version 4 UUID.
 * @param out Output: lowercase hyphenated UUID string
 * @return false if the OpenSSL entropy source failed
 */
bool generate_uuid_v4(std::string &out);

/**
 * @brief Generate a short random hex token for temp file names.
 * @param bytes Number of random bytes (token is twice as many hex digits)
 * @param out Output: hex token
 * @return false if the OpenSSL entropy source failed
 */
bool generate_token(size_t bytes, std::string &out);

// **---- Utilities ----**

/**
 * @brief Replace every occurrence of each directory prefix in a message.
 * @note Used to keep temp and output directory paths out of error text
 *       returned to clients.
 */
std::string redact_paths(std::string message,
                         const std::vector<std::string> &prefixes);

/**
 * @brief Format microseconds as a short human string ("1.25s", "340ms").
 */
std::string format_duration_us(long us);

} // namespace img2reel

#endif // IMG2REEL_SYSTEM_HPP
