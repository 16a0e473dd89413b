/**
 * @file content_fetcher.cpp
 * @brief Bounded source acquisition implementation
 *
 * @details One httplib::Client per hop with automatic redirects disabled, so
 *          the hop count, the deadline and the byte ceiling are all enforced
 *          here:
 *
 *          - The response handler sees status and headers before any body
 *            byte; redirects, error statuses, disallowed types and oversized
 *            Content-Length all stop the transfer there
 *
 *          - The content receiver counts bytes and aborts mid-flight when
 *            the count passes the ceiling or the deadline expires
 */

#include "img2reel/content_fetcher.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <thread>

#include <httplib.h>

#include <fmt/core.h>

#include "img2reel/config.hpp"
#include "img2reel/media_type.hpp"

namespace img2reel {

namespace {

constexpr char USER_AGENT[] = "img2reel/1.0";

// **---- Sinks ----**

/**
 * @class StreamedSink
 * @brief Writes each chunk straight to disk.
 */
class StreamedSink : public BodySink {
public:
  explicit StreamedSink(WorkspaceManager &workspace) : workspace_(workspace) {}
  ~StreamedSink() override {
    if (!committed_)
      discard();
  }

  bool open(const std::string &path, Error &err) override {
    path_ = path;
    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_) {
      err.set(ErrorKind::Internal, "Cannot create staging file");
      return false;
    }
    return true;
  }

  bool write(const char *data, size_t len, Error &err) override {
    out_.write(data, static_cast<std::streamsize>(len));
    if (!out_) {
      err.set(ErrorKind::Internal, "Failed writing staging file");
      return false;
    }
    return true;
  }

  bool commit(Error &err) override {
    out_.close();
    if (out_.fail()) {
      err.set(ErrorKind::Internal, "Failed closing staging file");
      return false;
    }
    committed_ = true;
    return true;
  }

  void discard() noexcept override {
    if (out_.is_open())
      out_.close();
    workspace_.release(path_);
    path_.clear();
  }

private:
  WorkspaceManager &workspace_;
  std::string path_;
  std::ofstream out_;
  bool committed_ = false;
};

/**
 * @class BufferedSink
 * @brief Holds the body in memory and writes it out on commit.
 */
class BufferedSink : public BodySink {
public:
  explicit BufferedSink(WorkspaceManager &workspace) : workspace_(workspace) {}
  ~BufferedSink() override {
    if (!committed_)
      discard();
  }

  bool open(const std::string &path, Error &) override {
    path_ = path;
    buffer_.clear();
    return true;
  }

  bool write(const char *data, size_t len, Error &) override {
    buffer_.append(data, len);
    return true;
  }

  bool commit(Error &err) override {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    out.close();
    if (out.fail()) {
      err.set(ErrorKind::Internal, "Failed writing staging file");
      return false;
    }
    committed_ = true;
    std::string().swap(buffer_);
    return true;
  }

  void discard() noexcept override {
    std::string().swap(buffer_);
    workspace_.release(path_);
    path_.clear();
  }

private:
  WorkspaceManager &workspace_;
  std::string path_;
  std::string buffer_;
  bool committed_ = false;
};

/// Per-hop transfer state shared by the httplib callbacks
struct TransferState {
  std::string location;
  ImageType type = ImageType::Jpeg;
  uint64_t received = 0;
  std::string path;
  std::unique_ptr<BodySink> sink;
  Error err;
};

/**
 * @class DeadlineWatchdog
 * @brief Stops an in-flight client request once the fetch deadline passes.
 *
 * @note httplib timeouts apply per socket operation; a peer trickling the
 *       status line or headers resets them on every byte. Shutting the
 *       socket down from this thread bounds the whole exchange.
 */
class DeadlineWatchdog {
public:
  DeadlineWatchdog(httplib::Client &cli,
                   std::chrono::steady_clock::time_point deadline)
      : thread_([this, &cli, deadline] {
          std::unique_lock<std::mutex> lock(mutex_);
          if (!cv_.wait_until(lock, deadline, [this] { return done_; })) {
            expired_ = true;
            cli.stop();
          }
        }) {}

  ~DeadlineWatchdog() { disarm(); }

  DeadlineWatchdog(const DeadlineWatchdog &) = delete;
  DeadlineWatchdog &operator=(const DeadlineWatchdog &) = delete;

  /// Stop watching; safe to call more than once
  void disarm() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
      thread_.join();
  }

  bool expired() const { return expired_.load(); }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;
  std::atomic<bool> expired_{false};
  std::thread thread_;
};

long long remaining_ms(std::chrono::steady_clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             deadline - std::chrono::steady_clock::now())
      .count();
}

} // anonymous namespace

// **---- Strategy ----**

bool parse_fetch_strategy(const std::string &name, FetchStrategy &out) {
  if (name == "streamed") {
    out = FetchStrategy::Streamed;
    return true;
  }
  if (name == "buffered") {
    out = FetchStrategy::Buffered;
    return true;
  }
  return false;
}

const char *to_string(FetchStrategy strategy) {
  return strategy == FetchStrategy::Buffered ? "buffered" : "streamed";
}

std::unique_ptr<BodySink> make_body_sink(FetchStrategy strategy,
                                         WorkspaceManager &workspace) {
  if (strategy == FetchStrategy::Buffered) {
    return std::make_unique<BufferedSink>(workspace);
  }
  return std::make_unique<StreamedSink>(workspace);
}

FetchOptions FetchOptions::from_config() {
  FetchOptions opts;
  opts.max_bytes = Config::max_image_bytes();
  opts.timeout_ms = Config::download_timeout_ms();
  opts.max_redirects = Config::max_redirects();
  /// Config::validate() has already rejected unknown names
  parse_fetch_strategy(Config::fetch_strategy(), opts.strategy);
  return opts;
}

// **---- ContentFetcher ----**

ContentFetcher::ContentFetcher(FetchOptions options,
                               WorkspaceManager &workspace)
    : options_(options), workspace_(workspace) {}

bool ContentFetcher::fetch(const std::string &url, const std::string &label,
                           StagedInput &out, Error &err) {
  Url original;
  if (!parse_url(url, original)) {
    err.set(ErrorKind::ClientInput,
            "Invalid source URL (absolute http or https URL required)");
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(options_.timeout_ms);

  Url current = original;
  for (int redirects = 0;; ++redirects) {
    HopResult hop;
    if (!fetch_hop(current, original, label, deadline, hop, out, err)) {
      return false;
    }
    if (!hop.redirect) {
      return true;
    }

    if (redirects >= options_.max_redirects) {
      err.set(ErrorKind::Upstream,
              fmt::format("Fetch failed: too many redirects (limit {})",
                          options_.max_redirects));
      return false;
    }

    Url next;
    if (!resolve_location(current, hop.location, next)) {
      err.set(ErrorKind::Upstream,
              "Fetch failed: redirect to an invalid or non-http(s) location");
      return false;
    }
    current = next;
  }
}

bool ContentFetcher::fetch_hop(const Url &current, const Url &original,
                               const std::string &label,
                               std::chrono::steady_clock::time_point deadline,
                               HopResult &hop, StagedInput &out, Error &err) {
  const long long budget_ms = remaining_ms(deadline);
  if (budget_ms <= 0) {
    err.set(ErrorKind::Upstream,
            fmt::format("Fetch failed: timed out after {} ms",
                        options_.timeout_ms));
    return false;
  }

  httplib::Client cli(current.origin());
  if (!cli.is_valid()) {
    err.set(ErrorKind::Upstream,
            fmt::format("Fetch failed: cannot open {} connections",
                        current.scheme));
    return false;
  }
  cli.set_follow_location(false);
  cli.set_connection_timeout(std::chrono::milliseconds(budget_ms));
  cli.set_read_timeout(std::chrono::milliseconds(budget_ms));
  cli.set_write_timeout(std::chrono::milliseconds(budget_ms));

  httplib::Headers headers = {
      {"User-Agent", USER_AGENT},
      {"Accept", "image/png,image/jpeg;q=0.9,*/*;q=0.1"}};

  /// Prefer the extension of the final URL, fall back to the requested one
  ImageType probe_type;
  const std::string &ext_path =
      image_type_from_extension(current.path, probe_type) ? current.path
                                                          : original.path;

  TransferState st;

  auto on_response = [&](const httplib::Response &res) {
    if (res.status >= 300 && res.status < 400 && res.has_header("Location")) {
      st.location = res.get_header_value("Location");
      return false;
    }
    if (res.status < 200 || res.status >= 300) {
      st.err.set(ErrorKind::Upstream,
                 fmt::format("Fetch failed: {} {}", res.status, res.reason));
      return false;
    }

    if (!resolve_source_type(res.get_header_value("Content-Type"), ext_path,
                             st.type, st.err)) {
      return false;
    }

    if (res.has_header("Content-Length")) {
      const std::string declared_str = res.get_header_value("Content-Length");
      errno = 0;
      unsigned long long declared =
          std::strtoull(declared_str.c_str(), nullptr, 10);
      if (errno == 0 && declared > options_.max_bytes) {
        st.err.set(ErrorKind::TooLarge,
                   fmt::format("Image too large: declared {} bytes exceeds "
                               "limit of {} bytes",
                               declared, options_.max_bytes));
        return false;
      }
    }

    if (!workspace_.make_temp_path(label, extension_for(st.type), st.path,
                                   st.err)) {
      return false;
    }
    st.sink = make_body_sink(options_.strategy, workspace_);
    return st.sink->open(st.path, st.err);
  };

  auto on_content = [&](const char *data, size_t len) {
    if (std::chrono::steady_clock::now() > deadline) {
      st.err.set(ErrorKind::Upstream,
                 fmt::format("Fetch failed: timed out after {} ms",
                             options_.timeout_ms));
      return false;
    }
    st.received += len;
    if (st.received > options_.max_bytes) {
      st.err.set(ErrorKind::TooLarge,
                 fmt::format("Image too large: received {} bytes, exceeds "
                             "limit of {} bytes",
                             st.received, options_.max_bytes));
      return false;
    }
    return st.sink->write(data, len, st.err);
  };

  DeadlineWatchdog watchdog(cli, deadline);
  auto res = cli.Get(current.target(), headers, on_response, on_content);
  watchdog.disarm();

  if (!st.location.empty()) {
    hop.redirect = true;
    hop.location = st.location;
    return true;
  }

  if (st.err.is_set() || !res) {
    if (st.sink) {
      st.sink->discard();
    }
    if (st.err.is_set()) {
      err = st.err;
    } else if (watchdog.expired() || remaining_ms(deadline) <= 0) {
      err.set(ErrorKind::Upstream,
              fmt::format("Fetch failed: timed out after {} ms",
                          options_.timeout_ms));
    } else {
      err.set(ErrorKind::Upstream,
              fmt::format("Fetch failed: {}", httplib::to_string(res.error())));
    }
    return false;
  }

  if (!st.sink || st.received == 0) {
    if (st.sink) {
      st.sink->discard();
    }
    err.set(ErrorKind::Validation, "Source returned an empty body");
    return false;
  }

  if (!st.sink->commit(err)) {
    st.sink->discard();
    return false;
  }

  out.path = st.path;
  out.type = st.type;
  out.size_bytes = st.received;
  return true;
}

bool ContentFetcher::validate_upload_name(const std::string &filename,
                                          ImageType &type, Error &err) {
  if (!image_type_from_extension(filename, type)) {
    err.set(ErrorKind::Validation, "Only PNG or JPG files are allowed.");
    return false;
  }
  return true;
}

bool ContentFetcher::stage_upload(const UploadedFile &upload,
                                  const std::string &label, StagedInput &out,
                                  Error &err) {
  ImageType type;
  if (!validate_upload_name(upload.filename, type, err)) {
    return false;
  }
  if (upload.content.empty()) {
    err.set(ErrorKind::Validation, "Uploaded file is empty");
    return false;
  }

  std::string path;
  if (!workspace_.make_temp_path(label, extension_for(type), path, err)) {
    return false;
  }

  auto sink = make_body_sink(FetchStrategy::Streamed, workspace_);
  if (!sink->open(path, err) ||
      !sink->write(upload.content.data(), upload.content.size(), err) ||
      !sink->commit(err)) {
    sink->discard();
    return false;
  }

  out.path = path;
  out.type = type;
  out.size_bytes = upload.content.size();
  return true;
}

} // namespace img2reel
