/**
 * @file main.cpp
 * @brief Entry point for the img2reel service
 *
 * @details Startup sequence:
 *
 *          - Resolve and validate the environment configuration
 *
 *          - Create the output and work directories
 *
 *          - Build fetcher, encoder pool, orchestrator and handler
 *
 *          - Serve HTTP until SIGINT / SIGTERM
 *
 * @note The encode pool is shut down after the server stops, so requests
 *       already inside an encode finish before the process exits.
 */

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <thread>

#include "img2reel/config.hpp"
#include "img2reel/content_fetcher.hpp"
#include "img2reel/encode_queue.hpp"
#include "img2reel/ffmpeg_encoder.hpp"
#include "img2reel/filter_graph.hpp"
#include "img2reel/http_server.hpp"
#include "img2reel/logging.hpp"
#include "img2reel/media_probe.hpp"
#include "img2reel/orchestrator.hpp"
#include "img2reel/request_handler.hpp"
#include "img2reel/system.hpp"
#include "img2reel/workspace.hpp"

using namespace img2reel;

static volatile std::sig_atomic_t g_running = 1;

void handle_signal(int) { g_running = 0; }

// **---- MAIN ----**

int main() {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);
  std::signal(SIGPIPE, SIG_IGN);

  quiet_libav_logging();

  if (!Config::validate()) {
    LOG_ERROR("Invalid configuration, refusing to start");
    return 1;
  }
  Config::print_summary();

  try {
    WorkspaceManager workspace(Config::video_dir(), Config::work_dir());
    Error err;
    if (!workspace.ensure_output_directory(err) ||
        !workspace.ensure_work_directory(err)) {
      LOG_ERROR("{}", err.message);
      return 1;
    }

    ContentFetcher fetcher(FetchOptions::from_config(), workspace);
    FfmpegEncoder encoder(Config::ffmpeg_path(), Config::encode_timeout_sec());
    EncodeQueue queue(encoder, calculate_encode_workers());
    EncodeOrchestrator orchestrator(queue, workspace,
                                    CodecProfile::from_config());
    RequestHandler handler(fetcher, workspace, orchestrator,
                           HandlerOptions::from_config());
    HttpServer server(handler, ServerOptions::from_config());

    /// Handlers are installed before the server binds
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int bound = server.bind();
    if (bound < 0) {
      LOG_ERROR("Cannot bind {}:{}", Config::listen_addr(), Config::port());
      return 1;
    }

    std::thread listener([&server] {
      if (!server.listen()) {
        LOG_ERROR("HTTP server stopped unexpectedly");
      }
      g_running = 0;
    });

    LOG_SUCCESS("img2reel listening on {}:{} ({} encode workers)",
                Config::listen_addr(), bound, queue.workers());

    while (g_running)
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

    LOG_INFO("Shutting down");
    server.stop();
    listener.join();
    queue.shutdown();
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal error: {}", e.what());
    return 2;
  }

  return 0;
}
