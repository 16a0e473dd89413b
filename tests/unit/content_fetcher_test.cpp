#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include <httplib.h>

#include "img2reel/content_fetcher.hpp"
#include "test_support.hpp"

namespace {

using img2reel::ContentFetcher;
using img2reel::Error;
using img2reel::ErrorKind;
using img2reel::FetchOptions;
using img2reel::FetchStrategy;
using img2reel::ImageType;
using img2reel::StagedInput;
using img2reel::UploadedFile;
using img2reel::WorkspaceManager;
using img2reel_test::CountEntries;
using img2reel_test::ScratchDir;
namespace fs = std::filesystem;

constexpr uint64_t kCap = 1024;

// In-process origin server on an ephemeral loopback port.
class Origin {
 public:
  Origin() {
    const std::string png = img2reel_test::Png16x16();

    server_.Get("/photo.png", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "image/png"); });
    server_.Get("/photo.jpg", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "text/html"); });
    server_.Get("/page", [](const httplib::Request&, httplib::Response& res) { res.set_content("<html></html>", "text/html"); });
    server_.Get("/render", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "image/jpeg; q=1"); });
    server_.Get("/blob/pic.jpeg", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "application/octet-stream"); });
    server_.Get("/blob/pic", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "application/octet-stream"); });
    server_.Get("/empty.png", [](const httplib::Request&, httplib::Response& res) { res.set_content("", "image/png"); });
    server_.Get("/missing.png", [](const httplib::Request&, httplib::Response& res) {
      res.status = 404;
      res.set_content("nope", "text/plain");
    });
    server_.Get("/big.png", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(std::string(4 * kCap, 'x'), "image/png");
    });
    server_.Get("/chunked.png", [](const httplib::Request&, httplib::Response& res) {
      res.set_chunked_content_provider("image/png", [](size_t offset, httplib::DataSink& sink) {
        if (offset >= 4 * kCap) {
          sink.done();
          return true;
        }
        std::string chunk(256, 'y');
        return sink.write(chunk.data(), chunk.size());
      });
    });
    server_.Get(R"(/hop/(\d+))", [](const httplib::Request& req, httplib::Response& res) {
      int left = std::stoi(req.matches[1]);
      if (left == 0) {
        res.set_redirect("/photo.png");
      } else {
        res.set_redirect("/hop/" + std::to_string(left - 1));
      }
    });
    server_.Get("/rel/start", [](const httplib::Request&, httplib::Response& res) { res.set_redirect("image.png"); });
    server_.Get("/rel/image.png", [png](const httplib::Request&, httplib::Response& res) { res.set_content(png, "image/png"); });
    server_.Get("/slow.png", [png](const httplib::Request&, httplib::Response& res) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1500));
      res.set_content(png, "image/png");
    });

    port_   = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    server_.wait_until_ready();
  }

  ~Origin() {
    server_.stop();
    thread_.join();
  }

  std::string Url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

 private:
  httplib::Server server_;
  int             port_ = -1;
  std::thread     thread_;
};

// Raw origin that accepts one connection and trickles its response headers,
// one byte every 100 ms, so no single socket read ever times out.
class DripOrigin {
 public:
  DripOrigin() {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    assert(fd_ >= 0);

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    int rc = bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    rc = listen(fd_, 1);
    assert(rc == 0);

    socklen_t len = sizeof(addr);
    rc            = getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    assert(rc == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { Serve(); });
  }

  ~DripOrigin() {
    stop_ = true;
    shutdown(fd_, SHUT_RDWR);
    close(fd_);
    thread_.join();
  }

  std::string Url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

 private:
  void Serve() {
    int client = accept(fd_, nullptr, nullptr);
    if (client < 0) return;

    const std::string head = "HTTP/1.1 200 OK\r\nX-Slow: ";
    if (send(client, head.data(), head.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(head.size())) {
      for (int i = 0; i < 100 && !stop_; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (send(client, "a", 1, MSG_NOSIGNAL) != 1) break;
      }
    }
    close(client);
  }

  int               fd_   = -1;
  int               port_ = 0;
  std::atomic<bool> stop_{false};
  std::thread       thread_;
};

FetchOptions Options(FetchStrategy strategy) {
  FetchOptions opts;
  opts.max_bytes     = kCap;
  opts.timeout_ms    = 3000;
  opts.max_redirects = 3;
  opts.strategy      = strategy;
  return opts;
}

const char* Name(FetchStrategy s) { return img2reel::to_string(s); }

void TestAcceptedSources(const Origin& origin, FetchStrategy strategy) {
  ScratchDir       root(std::string("fetch-ok-") + Name(strategy));
  WorkspaceManager ws(root / "out", root.path());
  ContentFetcher   fetcher(Options(strategy), ws);

  StagedInput staged;
  Error       err;
  assert(fetcher.fetch(origin.Url("/photo.png"), "src", staged, err));
  assert(staged.type == ImageType::Png);
  assert(staged.size_bytes == img2reel_test::Png16x16().size());
  assert(fs::path(staged.path).extension() == ".png");
  assert(img2reel_test::ReadFile(staged.path) == img2reel_test::Png16x16());

  StagedInput by_type;
  assert(fetcher.fetch(origin.Url("/render"), "src", by_type, err));
  assert(by_type.type == ImageType::Jpeg);
  assert(fs::path(by_type.path).extension() == ".jpg");

  StagedInput by_extension;
  assert(fetcher.fetch(origin.Url("/blob/pic.jpeg"), "src", by_extension, err));
  assert(by_extension.type == ImageType::Jpeg);

  StagedInput relative;
  assert(fetcher.fetch(origin.Url("/rel/start"), "src", relative, err));

  assert(!err.is_set());
  assert(CountEntries(root.path()) == 4);
}

void ExpectRejected(ContentFetcher& fetcher, const std::string& url, ErrorKind kind, const fs::path& work,
                    const std::string& fragment = "") {
  StagedInput staged;
  Error       err;
  assert(!fetcher.fetch(url, "src", staged, err));
  assert(err.kind == kind);
  if (!fragment.empty()) {
    assert(err.message.find(fragment) != std::string::npos);
  }
  assert(staged.path.empty());
  assert(CountEntries(work) == 0);
}

void TestRejectedSources(const Origin& origin, FetchStrategy strategy) {
  ScratchDir       root(std::string("fetch-bad-") + Name(strategy));
  WorkspaceManager ws(root / "out", root.path());
  ContentFetcher   fetcher(Options(strategy), ws);
  const fs::path&  work = root.path();

  ExpectRejected(fetcher, origin.Url("/page"), ErrorKind::Validation, work, "text/html");
  ExpectRejected(fetcher, origin.Url("/photo.jpg"), ErrorKind::Validation, work, "text/html");
  ExpectRejected(fetcher, origin.Url("/blob/pic"), ErrorKind::Validation, work);
  ExpectRejected(fetcher, origin.Url("/empty.png"), ErrorKind::Validation, work);
  ExpectRejected(fetcher, origin.Url("/missing.png"), ErrorKind::Upstream, work, "404");
  ExpectRejected(fetcher, origin.Url("/big.png"), ErrorKind::TooLarge, work, "declared 4096 bytes exceeds limit of 1024");
  ExpectRejected(fetcher, origin.Url("/chunked.png"), ErrorKind::TooLarge, work, "limit of 1024 bytes");
  ExpectRejected(fetcher, "not a url", ErrorKind::ClientInput, work);
  ExpectRejected(fetcher, "file:///etc/passwd", ErrorKind::ClientInput, work);
}

void TestRedirectLimit(const Origin& origin) {
  ScratchDir       root("fetch-redirects");
  WorkspaceManager ws(root / "out", root.path());
  ContentFetcher   fetcher(Options(FetchStrategy::Streamed), ws);

  // hop/2 -> hop/1 -> hop/0 -> photo.png: three redirects, at the limit.
  StagedInput staged;
  Error       err;
  assert(fetcher.fetch(origin.Url("/hop/2"), "src", staged, err));
  ws.release(staged.path);

  ExpectRejected(fetcher, origin.Url("/hop/3"), ErrorKind::Upstream, root.path(), "too many redirects");
}

void TestTimeout(const Origin& origin) {
  ScratchDir       root("fetch-timeout");
  WorkspaceManager ws(root / "out", root.path());
  FetchOptions     opts = Options(FetchStrategy::Streamed);
  opts.timeout_ms       = 300;
  ContentFetcher fetcher(opts, ws);

  auto start = std::chrono::steady_clock::now();
  ExpectRejected(fetcher, origin.Url("/slow.png"), ErrorKind::Upstream, root.path());
  auto elapsed = std::chrono::steady_clock::now() - start;
  assert(elapsed < std::chrono::milliseconds(1400));
}

void TestTricklingHeadersHitDeadline() {
  DripOrigin       origin;
  ScratchDir       root("fetch-drip");
  WorkspaceManager ws(root / "out", root.path());
  FetchOptions     opts = Options(FetchStrategy::Streamed);
  opts.timeout_ms       = 500;
  ContentFetcher fetcher(opts, ws);

  auto start = std::chrono::steady_clock::now();
  ExpectRejected(fetcher, origin.Url("/slow.png"), ErrorKind::Upstream, root.path(), "timed out");
  auto elapsed = std::chrono::steady_clock::now() - start;
  assert(elapsed < std::chrono::milliseconds(1500));
}

void TestUploads() {
  ScratchDir       root("fetch-upload");
  WorkspaceManager ws(root / "out", root.path());
  ContentFetcher   fetcher(Options(FetchStrategy::Streamed), ws);

  std::string png = img2reel_test::Png16x16();
  StagedInput staged;
  Error       err;
  assert(fetcher.stage_upload(UploadedFile{"Holiday.JPEG", png}, "src", staged, err));
  assert(staged.type == ImageType::Jpeg);
  assert(staged.size_bytes == png.size());
  // Upload size is bounded by the HTTP layer, not the fetch cap.
  assert(staged.size_bytes > 0);

  StagedInput rejected;
  Error       gif_err;
  assert(!fetcher.stage_upload(UploadedFile{"photo.gif", png}, "src", rejected, gif_err));
  assert(gif_err.kind == ErrorKind::Validation);
  assert(gif_err.message == "Only PNG or JPG files are allowed.");

  Error empty_err;
  assert(!fetcher.stage_upload(UploadedFile{"photo.png", ""}, "src", rejected, empty_err));
  assert(empty_err.kind == ErrorKind::Validation);

  assert(CountEntries(root.path()) == 1);
}

void TestStrategyNames() {
  FetchStrategy s = FetchStrategy::Streamed;
  assert(img2reel::parse_fetch_strategy("buffered", s) && s == FetchStrategy::Buffered);
  assert(img2reel::parse_fetch_strategy("streamed", s) && s == FetchStrategy::Streamed);
  assert(!img2reel::parse_fetch_strategy("mmap", s));
}

}  // namespace

int main() {
  Origin origin;

  TestAcceptedSources(origin, FetchStrategy::Streamed);
  TestAcceptedSources(origin, FetchStrategy::Buffered);
  TestRejectedSources(origin, FetchStrategy::Streamed);
  TestRejectedSources(origin, FetchStrategy::Buffered);
  TestRedirectLimit(origin);
  TestTimeout(origin);
  TestTricklingHeadersHitDeadline();
  TestUploads();
  TestStrategyNames();

  std::cout << "img2reel_unit_content_fetcher: pass\n";
  return 0;
}
