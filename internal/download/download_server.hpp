#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "internal/download/token_table.hpp"
#include "internal/util/time.hpp"

namespace soundscribe::download {

struct DownloadServerOptions {
  std::string host    = "127.0.0.1";
  uint16_t    port    = 8000;
  unsigned    threads = 2;
  // Replaces http://host:port in generated links when set.
  std::string               public_base_url;
  std::chrono::milliseconds token_ttl{std::chrono::hours(1)};
  std::chrono::milliseconds shutdown_grace{5000};
};

struct HealthStatus {
  std::string status = "healthy";
  std::size_t active_tokens = 0;
};

/*
  Embedded HTTP server for ephemeral artifact downloads.

    GET /                  liveness message
    GET /download/{token}  file stream, or 404 with a reason
    GET /health            status and live token count

  Start() returns once the listener is bound; requests are served on
  background I/O threads.
*/
class DownloadServer {
 public:
  explicit DownloadServer(DownloadServerOptions options, util::ClockFn clock = util::SystemClock());
  ~DownloadServer();

  DownloadServer(const DownloadServer&)            = delete;
  DownloadServer& operator=(const DownloadServer&) = delete;

  // Throws std::runtime_error if the address cannot be bound. No-op when running.
  void Start();

  // Graceful shutdown bounded by shutdown_grace. Idempotent.
  void Stop();

  bool IsRunning() const {
    return running_.load();
  }

  // Bound port while running (resolves port 0), configured port otherwise.
  uint16_t Port() const;

  std::string BaseUrl() const;

  // Throws util::FileNotFound when path does not exist.
  std::string CreateLink(const std::filesystem::path& path);

  RedeemResult Redeem(const std::string& token);

  HealthStatus Health() const;

 private:
  class HttpSession;

  void DoAccept();
  void SessionOpened(HttpSession* session, std::weak_ptr<HttpSession> handle);
  void SessionClosed(HttpSession* session);

  DownloadServerOptions options_;
  DownloadTokenTable    tokens_;

  std::mutex                                      lifecycle_mutex_;
  std::unique_ptr<boost::asio::io_context>        ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread>                        threads_;
  std::atomic<bool>                               running_{false};
  std::atomic<bool>                               stopping_{false};
  std::atomic<uint16_t>                           bound_port_{0};

  // Live connections, so Stop can drop the idle keep-alive ones.
  std::mutex                                                   sessions_mutex_;
  std::condition_variable                                      sessions_cv_;
  std::unordered_map<HttpSession*, std::weak_ptr<HttpSession>> sessions_;
};

} // namespace soundscribe::download
