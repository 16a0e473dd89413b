/**
 * @file http_server.hpp
 * @brief HTTP surface of the service (cpp-httplib)
 *
 * @details Routes:
 *
 *          - POST /image-to-video  encode request (query and/or multipart)
 *
 *          - GET  /health          liveness probe
 *
 *          - GET  /videos/<file>   read-only artifact serving (video/mp4)
 */

#ifndef IMG2REEL_HTTP_SERVER_HPP
#define IMG2REEL_HTTP_SERVER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "request_handler.hpp"

namespace httplib {
class Server;
struct Request;
} // namespace httplib

namespace img2reel {

struct ServerOptions {
  std::string listen_addr = "0.0.0.0";
  int port = 3001;
  int threads = 8;
  uint64_t max_upload_bytes = 25ull * 1024 * 1024;
  std::string video_dir;

  static ServerOptions from_config();
};

/**
 * @brief Flatten an httplib request into transport-neutral inputs.
 * @note Query parameters win over multipart text fields of the same name.
 */
RequestInputs to_request_inputs(const httplib::Request &req);

/**
 * @brief First element of a comma-separated header value, trimmed.
 */
std::string first_header_token(const std::string &value);

/**
 * @brief Message for an error status produced by the HTTP layer rather than
 *        a route handler (unknown path, oversized payload, ...).
 */
std::string transport_error_message(int status, uint64_t max_upload_bytes);

/**
 * @class HttpServer
 * @brief Owns the httplib::Server and wires the routes to a RequestHandler.
 */
class HttpServer {
public:
  HttpServer(RequestHandler &handler, ServerOptions options);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Bind the listening socket.
   * @return Bound port (useful with port 0), or -1 on failure
   */
  int bind();

  /// Serve until stop() is called (blocking)
  bool listen();

  /// Ask listen() to return; safe from another thread
  void stop();

  bool is_running() const;

  /// Block until listen() is accepting, at most timeout_ms
  bool wait_until_running(int timeout_ms) const;

private:
  RequestHandler &handler_;
  ServerOptions options_;
  std::unique_ptr<httplib::Server> server_;

  void register_routes();
};

} // namespace img2reel

#endif // IMG2REEL_HTTP_SERVER_HPP
