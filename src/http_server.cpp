/**
 * @file http_server.cpp
 * @brief HTTP routing implementation
 */

#include "img2reel/http_server.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include <httplib.h>

#include <fmt/core.h>

#include "img2reel/config.hpp"
#include "img2reel/logging.hpp"

namespace img2reel {

namespace {

constexpr char JSON_TYPE[] = "application/json";

void send_json(httplib::Response &res, int status, const nlohmann::json &body) {
  res.status = status;
  res.set_content(body.dump(), JSON_TYPE);
}

} // anonymous namespace

ServerOptions ServerOptions::from_config() {
  ServerOptions opts;
  opts.listen_addr = Config::listen_addr();
  opts.port = Config::port();
  opts.threads = Config::server_threads();
  opts.max_upload_bytes = Config::max_upload_bytes();
  opts.video_dir = Config::video_dir();
  return opts;
}

std::string transport_error_message(int status, uint64_t max_upload_bytes) {
  switch (status) {
  case 400:
    return "Malformed request";
  case 404:
    return "Not found";
  case 405:
    return "Method not allowed";
  case 413:
    return fmt::format("Upload exceeds the limit of {} bytes (MAX_UPLOAD_BYTES)",
                       max_upload_bytes);
  default:
    return fmt::format("Request failed with status {}", status);
  }
}

std::string first_header_token(const std::string &value) {
  std::string token = value.substr(0, value.find(','));
  const auto first = token.find_first_not_of(" \t");
  if (first == std::string::npos)
    return {};
  const auto last = token.find_last_not_of(" \t");
  return token.substr(first, last - first + 1);
}

RequestInputs to_request_inputs(const httplib::Request &req) {
  RequestInputs in;

  /// Multipart text fields first, so query parameters overwrite them
  for (const auto &entry : req.files) {
    const httplib::MultipartFormData &part = entry.second;
    if (part.filename.empty()) {
      in.fields[entry.first] = part.content;
    }
  }
  for (const auto &param : req.params) {
    in.fields[param.first] = param.second;
  }

  if (req.has_file("file")) {
    const auto &part = req.get_file_value("file");
    if (!part.filename.empty()) {
      in.file = UploadedFile{part.filename, part.content};
    }
  }
  if (req.has_file("intro")) {
    const auto &part = req.get_file_value("intro");
    if (!part.filename.empty()) {
      in.intro_file = UploadedFile{part.filename, part.content};
    }
  }

  std::string proto = first_header_token(req.get_header_value("X-Forwarded-Proto"));
  in.scheme = proto.empty() ? "http" : proto;

  std::string host = first_header_token(req.get_header_value("X-Forwarded-Host"));
  in.host = host.empty() ? req.get_header_value("Host") : host;
  return in;
}

// **---- HttpServer ----**

HttpServer::HttpServer(RequestHandler &handler, ServerOptions options)
    : handler_(handler), options_(std::move(options)),
      server_(std::make_unique<httplib::Server>()) {
  const size_t threads = options_.threads > 0 ? options_.threads : 1;
  server_->new_task_queue = [threads] {
    return new httplib::ThreadPool(threads);
  };
  server_->set_payload_max_length(options_.max_upload_bytes);
  server_->set_read_timeout(60, 0);
  server_->set_write_timeout(60, 0);
  register_routes();
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::register_routes() {
  server_->set_file_extension_and_mimetype_mapping("mp4", "video/mp4");
  if (!server_->set_mount_point("/videos", options_.video_dir)) {
    LOG_ERROR("Cannot serve {} at /videos", options_.video_dir);
  }

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    send_json(res, 200, RequestHandler::health_body());
  });

  server_->Post("/image-to-video", [this](const httplib::Request &req,
                                          httplib::Response &res) {
    try {
      HandlerResponse out = handler_.handle(to_request_inputs(req));
      send_json(res, out.status, out.body);
    } catch (const std::exception &e) {
      LOG_ERROR("Unhandled error in /image-to-video: {}", e.what());
      send_json(res, 500, RequestHandler::error_body("Internal server error"));
    }
  });

  /// Failures raised by httplib itself (no route, payload cap, bad
  /// multipart) arrive with an empty body
  server_->set_error_handler([this](const httplib::Request &,
                                    httplib::Response &res) {
    if (!res.body.empty())
      return;
    send_json(res, res.status,
              RequestHandler::error_body(transport_error_message(
                  res.status, options_.max_upload_bytes)));
  });

  server_->set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
    LOG_INFO("{} {} {} -> {}", req.remote_addr, req.method, req.path,
             res.status);
  });
}

int HttpServer::bind() {
  if (options_.port == 0) {
    return server_->bind_to_any_port(options_.listen_addr);
  }
  if (!server_->bind_to_port(options_.listen_addr, options_.port)) {
    return -1;
  }
  return options_.port;
}

bool HttpServer::listen() { return server_->listen_after_bind(); }

void HttpServer::stop() {
  if (server_ && server_->is_running()) {
    server_->stop();
  }
}

bool HttpServer::is_running() const { return server_->is_running(); }

bool HttpServer::wait_until_running(int timeout_ms) const {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  while (!server_->is_running()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

} // namespace img2reel
