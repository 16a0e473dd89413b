/**
 * @file ffmpeg_encoder.cpp
 * @brief FFmpeg execution implementation
 */

#include "img2reel/ffmpeg_encoder.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#include <fmt/core.h>

#include "img2reel/logging.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace img2reel {

namespace {

/// Bytes of ffmpeg stderr kept for the error message
constexpr size_t STDERR_TAIL_BYTES = 2048;

void append_tail(std::string &tail, const char *data, size_t len) {
  tail.append(data, len);
  if (tail.size() > STDERR_TAIL_BYTES) {
    tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
  }
}

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

/// Last non-empty line of the captured stderr
std::string last_line(const std::string &tail) {
  std::string text = trim(tail);
  const auto nl = text.find_last_of('\n');
  return nl == std::string::npos ? text : trim(text.substr(nl + 1));
}

} // anonymous namespace

// **---- Argument builders ----**

std::vector<std::string> build_still_clip_args(const EncodeJob &job) {
  const CodecProfile &p = job.profile;
  const bool baseline = p.kind == ProfileKind::Baseline;

  std::vector<std::string> args = {"-y", "-hide_banner", "-loglevel", "error"};

  /// Input 0: the still image, looped
  args.insert(args.end(), {"-loop", "1", "-i", job.inputs.front()});

  /// Input 1: silent audio
  args.insert(args.end(),
              {"-f", "lavfi", "-i",
               baseline ? "anullsrc=channel_layout=stereo:sample_rate=44100"
                        : "anullsrc=channel_layout=mono:sample_rate=44100"});

  args.insert(args.end(), {"-map", "0:v:0", "-map", "1:a:0"});
  args.insert(args.end(), {"-vf", job.filters.to_string()});
  args.insert(args.end(), {"-t", std::to_string(job.duration_sec)});

  if (baseline) {
    args.insert(args.end(), {"-c:v", "libx264", "-pix_fmt", "yuv420p"});
    args.insert(args.end(), {"-c:a", "aac", "-b:a", "128k"});
  } else {
    const std::string gop = std::to_string(p.keyint);
    args.insert(args.end(),
                {"-c:v", p.codec, "-preset", p.preset, "-crf",
                 std::to_string(p.crf), "-maxrate",
                 fmt::format("{}k", p.maxrate_kbps), "-bufsize",
                 fmt::format("{}k", p.bufsize_kbps), "-g", gop, "-keyint_min",
                 gop, "-sc_threshold", "0", "-pix_fmt", "yuv420p", "-tag:v",
                 p.codec_tag()});
    args.insert(args.end(), {"-c:a", "aac", "-b:a",
                             fmt::format("{}k", p.audio_kbps), "-ac", "1"});
  }

  args.insert(args.end(),
              {"-movflags", "+faststart", "-shortest", job.output_path});
  return args;
}

std::vector<std::string> build_concat_args(const EncodeJob &job,
                                           const std::string &list_path) {
  return {"-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-f",
          "concat",
          "-safe",
          "0",
          "-protocol_whitelist",
          "file,pipe,fd",
          "-i",
          list_path,
          "-c",
          "copy",
          "-avoid_negative_ts",
          "make_zero",
          "-movflags",
          "+faststart",
          job.output_path};
}

std::string build_concat_list(const std::vector<std::string> &inputs) {
  std::string list_content;
  list_content.reserve(256 * inputs.size());

  for (const auto &input : inputs) {
    std::string abs_path = std::filesystem::absolute(input).string();
    std::string quoted;
    quoted.reserve(abs_path.size());
    for (char c : abs_path) {
      if (c == '\'')
        quoted += "'\\''";
      else
        quoted += c;
    }
    list_content += fmt::format("file '{}'\n", quoted);
  }
  return list_content;
}

// **---- Process execution ----**

ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec) {
  ProcessResult result;

  /// Everything the child touches is prepared before fork
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    result.stderr_tail = fmt::format("pipe: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.stderr_tail = fmt::format("fork: {}", std::strerror(errno));
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(cargv[0], cargv.data());
    static const char msg[] = "exec failed: program not found or not runnable\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  }

  close(err_pipe[1]);
  result.started = true;

  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + std::chrono::seconds(timeout_sec);

  char buf[4096];
  for (;;) {
    int wait_ms = 250;
    if (timeout_sec > 0) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - std::chrono::steady_clock::now())
                      .count();
      if (left <= 0) {
        kill(pid, SIGKILL);
        result.timed_out = true;
        break;
      }
      if (left < wait_ms)
        wait_ms = static_cast<int>(left);
    }

    pollfd pfd{err_pipe[0], POLLIN, 0};
    int rc = poll(&pfd, 1, wait_ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0)
      continue;

    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      append_tail(result.stderr_tail, buf, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      break; // EOF: child closed stderr (exited)
    }
  }
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      result.exit_code = -1;
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = -1;
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

// **---- FfmpegEncoder ----**

FfmpegEncoder::FfmpegEncoder(std::string ffmpeg_path, int timeout_sec)
    : ffmpeg_path_(std::move(ffmpeg_path)), timeout_sec_(timeout_sec) {}

EncodeOutcome FfmpegEncoder::run(const EncodeJob &job) {
  if (job.inputs.empty()) {
    EncodeOutcome outcome;
    outcome.error = "no inputs";
    return outcome;
  }
  if (job.kind == JobKind::Concat) {
    return run_concat(job);
  }
  return execute(job, build_still_clip_args(job));
}

EncodeOutcome FfmpegEncoder::run_concat(const EncodeJob &job) {
  EncodeOutcome outcome;
  const std::string list_content = build_concat_list(job.inputs);

  /// Create memory file for concat list
  int fd = static_cast<int>(
      syscall(SYS_memfd_create, "concat_list_mem", MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("{} Failed to create memory file!", job.tag);
    outcome.error = "cannot create concat list";
    return outcome;
  }

  if (write(fd, list_content.c_str(), list_content.size()) !=
      static_cast<ssize_t>(list_content.size())) {
    LOG_ERROR("{} Failed to write to memory file", job.tag);
    close(fd);
    outcome.error = "cannot write concat list";
    return outcome;
  }

  std::string mem_file_path = fmt::format("/proc/{}/fd/{}", getpid(), fd);
  outcome = execute(job, build_concat_args(job, mem_file_path));
  close(fd);
  return outcome;
}

EncodeOutcome FfmpegEncoder::execute(const EncodeJob &job,
                                     std::vector<std::string> args) {
  EncodeOutcome outcome;
  args.insert(args.begin(), ffmpeg_path_);

  LOG_INFO("{} [FFmpeg] {} -> {}", job.tag,
           job.kind == JobKind::Concat ? "concat" : "encode",
           std::filesystem::path(job.output_path).filename().string());

  const auto start = std::chrono::steady_clock::now();
  ProcessResult proc = run_process(args, timeout_sec_);
  outcome.elapsed_us = static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - start)
          .count());

  if (!proc.started) {
    outcome.error = fmt::format("could not start ffmpeg: {}", proc.stderr_tail);
  } else if (proc.timed_out) {
    outcome.error =
        fmt::format("ffmpeg timed out after {} seconds", timeout_sec_);
  } else if (proc.exit_code != 0) {
    std::string detail = last_line(proc.stderr_tail);
    if (proc.term_signal != 0) {
      outcome.error = fmt::format("ffmpeg killed by signal {}", proc.term_signal);
    } else if (detail.empty()) {
      outcome.error = fmt::format("ffmpeg exited with status {}", proc.exit_code);
    } else {
      outcome.error = fmt::format("ffmpeg exited with status {}: {}",
                                  proc.exit_code, detail);
    }
  } else {
    outcome.ok = true;
    return outcome;
  }

  LOG_ERROR("{} FFmpeg failed: {}", job.tag, outcome.error);
  return outcome;
}

} // namespace img2reel
