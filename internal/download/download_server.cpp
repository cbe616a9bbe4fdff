#include "download_server.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <tuple>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/token.hpp"
#include "soundscribe/download/v1/download.pb.h"

namespace soundscribe::download {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using observability::IntField;
using observability::StringField;

namespace {

constexpr char kServerName[]         = "soundscribe";
constexpr char kDownloadPrefix[]     = "/download/";
constexpr auto kReadTimeout          = std::chrono::seconds(30);

std::string ContentTypeFor(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == ".mp3") return "audio/mpeg";
  if (ext == ".wav") return "audio/wav";
  if (ext == ".ogg" || ext == ".opus") return "audio/ogg";
  if (ext == ".m4a") return "audio/mp4";
  return "application/octet-stream";
}

std::string AttachmentHeader(const std::filesystem::path& path) {
  auto name = path.filename().string();
  std::replace(name.begin(), name.end(), '"', '_');
  std::replace(name.begin(), name.end(), '\\', '_');
  return "attachment; filename=\"" + name + "\"";
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names   = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize response: " + std::string(status.message()));
  }
  return json;
}

http::response<http::string_body> JsonResponse(http::status status, unsigned version, bool keep_alive,
                                               const google::protobuf::Message& body) {
  http::response<http::string_body> res{status, version};
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, "application/json");
  res.keep_alive(keep_alive);
  res.body() = ToJson(body);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> ErrorResponse(http::status status, unsigned version, bool keep_alive, std::string_view detail) {
  soundscribe::download::v1::ErrorResponse body;
  body.set_detail(std::string(detail));
  return JsonResponse(status, version, keep_alive, body);
}

std::string_view ToStdView(beast::string_view sv) {
  return {sv.data(), sv.size()};
}

std::string StripQuery(std::string_view target) {
  const auto q = target.find('?');
  return std::string(q == std::string_view::npos ? target : target.substr(0, q));
}

} // namespace

// ------------------------------------------------------------
// HttpSession: one connection, strand-bound
// ------------------------------------------------------------

class DownloadServer::HttpSession : public std::enable_shared_from_this<DownloadServer::HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, DownloadServer& server) : stream_(std::move(socket)), server_(server) {
  }

  ~HttpSession() {
    server_.SessionClosed(this);
  }

  void Run() {
    server_.SessionOpened(this, weak_from_this());
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

  // Called once stopping_ is set. A connection parked in a keep-alive
  // read is cancelled; one that is writing finishes and then closes.
  void CloseIfIdle() {
    net::dispatch(stream_.get_executor(), [self = shared_from_this()] {
      if (self->reading_) {
        self->stream_.cancel();
      }
    });
  }

 private:
  void DoRead() {
    if (server_.stopping_) {
      DoClose();
      return;
    }

    req_     = {};
    reading_ = true;
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, req_, beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    reading_ = false;
    if (ec == http::error::end_of_stream) {
      DoClose();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        SOUNDSCRIBE_LOG_DEBUG("HTTP read failed", {StringField("error", ec.message())});
      }
      return;
    }

    try {
      HandleRequest();
    } catch (const std::exception& e) {
      SOUNDSCRIBE_LOG_ERROR("HTTP handler failed", {StringField("target", ToStdView(req_.target())), StringField("error", e.what())});
      Send(ErrorResponse(http::status::internal_server_error, req_.version(), false, "Internal Server Error"));
    }
  }

  void HandleRequest() {
    const auto target     = StripQuery(ToStdView(req_.target()));
    const bool keep_alive = req_.keep_alive() && !server_.stopping_;
    const bool is_get     = req_.method() == http::verb::get;

    const bool is_root     = target == "/";
    const bool is_health   = target == "/health";
    const bool is_download = target.rfind(kDownloadPrefix, 0) == 0;

    if (!is_root && !is_health && !is_download) {
      Send(ErrorResponse(http::status::not_found, req_.version(), keep_alive, "Not Found"));
      return;
    }
    if (!is_get) {
      auto res = ErrorResponse(http::status::method_not_allowed, req_.version(), keep_alive, "Method Not Allowed");
      res.set(http::field::allow, "GET");
      Send(std::move(res));
      return;
    }

    if (is_root) {
      soundscribe::download::v1::RootResponse body;
      body.set_message("SoundScribe Download Server");
      Send(JsonResponse(http::status::ok, req_.version(), keep_alive, body));
      return;
    }

    if (is_health) {
      const auto                                health = server_.Health();
      soundscribe::download::v1::HealthResponse body;
      body.set_status(health.status);
      body.set_active_tokens(static_cast<uint32_t>(health.active_tokens));
      Send(JsonResponse(http::status::ok, req_.version(), keep_alive, body));
      return;
    }

    const auto token = target.substr(sizeof(kDownloadPrefix) - 1);
    ServeDownload(token, keep_alive);
  }

  void ServeDownload(const std::string& token, bool keep_alive) {
    if (!util::IsWellFormedToken(token)) {
      Send(ErrorResponse(http::status::not_found, req_.version(), keep_alive, RedeemResult{}.Reason()));
      return;
    }

    const auto result = server_.Redeem(token);
    if (!result.ok()) {
      Send(ErrorResponse(http::status::not_found, req_.version(), keep_alive, result.Reason()));
      return;
    }

    beast::error_code          ec;
    http::file_body::value_type body;
    body.open(result.path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
      // deleted between redemption and open
      Send(ErrorResponse(http::status::not_found, req_.version(), keep_alive, "File not found"));
      return;
    }

    const auto size = body.size();
    http::response<http::file_body> res{std::piecewise_construct, std::make_tuple(std::move(body)),
                                        std::make_tuple(http::status::ok, req_.version())};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, ContentTypeFor(result.path));
    res.set(http::field::content_disposition, AttachmentHeader(result.path));
    res.content_length(size);
    res.keep_alive(keep_alive);

    SOUNDSCRIBE_LOG_INFO("Serving download", {StringField("file", result.path.filename().string()), IntField("bytes", static_cast<int64_t>(size))});
    Send(std::move(res));
  }

  template <class Body>
  void Send(http::response<Body>&& msg) {
    auto sp = std::make_shared<http::response<Body>>(std::move(msg));
    res_    = sp;

    // Large files on slow links must not trip the read deadline.
    stream_.expires_never();
    http::async_write(stream_, *sp, beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), sp->need_eof()));
  }

  void OnWrite(bool close, beast::error_code ec, std::size_t) {
    res_ = nullptr;
    if (ec) {
      SOUNDSCRIBE_LOG_DEBUG("HTTP write failed", {StringField("error", ec.message())});
      return;
    }
    if (close || server_.stopping_) {
      DoClose();
      return;
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream                 stream_;
  beast::flat_buffer                buffer_;
  http::request<http::string_body>  req_;
  std::shared_ptr<void>             res_;
  bool                              reading_ = false;
  DownloadServer&                   server_;
};

// ------------------------------------------------------------
// DownloadServer
// ------------------------------------------------------------

DownloadServer::DownloadServer(DownloadServerOptions options, util::ClockFn clock)
    : options_(std::move(options)),
      tokens_(std::move(clock)) {
}

DownloadServer::~DownloadServer() {
  Stop();
}

void DownloadServer::Start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (ioc_) return;

  const auto threads = std::max(1u, options_.threads);
  auto       ioc     = std::make_unique<net::io_context>(static_cast<int>(threads));
  auto       acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*ioc));

  const auto host = options_.host == "localhost" ? std::string("127.0.0.1") : options_.host;

  beast::error_code ec;
  const auto        address = net::ip::make_address(host, ec);
  if (ec) {
    throw std::runtime_error("invalid download server host '" + options_.host + "': " + ec.message());
  }

  const tcp::endpoint endpoint{address, options_.port};
  const auto          where = options_.host + ":" + std::to_string(options_.port);

  acceptor->open(endpoint.protocol(), ec);
  if (ec) throw std::runtime_error("Failed to open download server socket: " + ec.message());

  acceptor->set_option(net::socket_base::reuse_address(true), ec);
  if (ec) throw std::runtime_error("Failed to configure download server socket: " + ec.message());

  acceptor->bind(endpoint, ec);
  if (ec) throw std::runtime_error("Failed to bind download server on " + where + ": " + ec.message());

  acceptor->listen(net::socket_base::max_listen_connections, ec);
  if (ec) throw std::runtime_error("Failed to listen on " + where + ": " + ec.message());

  bound_port_ = acceptor->local_endpoint().port();
  ioc_        = std::move(ioc);
  acceptor_   = std::move(acceptor);
  stopping_   = false;
  running_    = true;

  DoAccept();

  threads_.reserve(threads);
  for (unsigned i = 0; i < threads; ++i) {
    threads_.emplace_back([this] {
      try {
        ioc_->run();
      } catch (const std::exception& e) {
        SOUNDSCRIBE_LOG_ERROR("Download server I/O thread failed", {StringField("error", e.what())});
      }
    });
  }

  SOUNDSCRIBE_LOG_INFO("Download server started", {StringField("url", BaseUrl())});
}

void DownloadServer::Stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (!ioc_) return;

  stopping_ = true;
  net::post(acceptor_->get_executor(), [this] {
    beast::error_code ec;
    acceptor_->close(ec);
  });

  std::vector<std::shared_ptr<HttpSession>> live;
  {
    std::lock_guard lock(sessions_mutex_);
    for (const auto& entry : sessions_) {
      if (auto session = entry.second.lock()) live.push_back(std::move(session));
    }
  }
  for (auto& session : live) {
    session->CloseIfIdle();
  }
  live.clear();

  {
    std::unique_lock lock(sessions_mutex_);
    if (!sessions_cv_.wait_for(lock, options_.shutdown_grace, [this] { return sessions_.empty(); })) {
      SOUNDSCRIBE_LOG_WARN("Download server shutdown timed out, cancelling connections",
                           {IntField("open_connections", static_cast<int64_t>(sessions_.size()))});
    }
  }

  ioc_->stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();

  acceptor_.reset();
  ioc_.reset();

  running_    = false;
  bound_port_ = 0;
  SOUNDSCRIBE_LOG_INFO("Download server stopped");
}

void DownloadServer::DoAccept() {
  acceptor_->async_accept(net::make_strand(*ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted || !acceptor_->is_open()) return;
      SOUNDSCRIBE_LOG_WARN("Accept failed", {StringField("error", ec.message())});
    } else {
      std::make_shared<HttpSession>(std::move(socket), *this)->Run();
    }

    if (!stopping_ && acceptor_->is_open()) {
      DoAccept();
    }
  });
}

void DownloadServer::SessionOpened(HttpSession* session, std::weak_ptr<HttpSession> handle) {
  std::lock_guard lock(sessions_mutex_);
  sessions_.emplace(session, std::move(handle));
}

void DownloadServer::SessionClosed(HttpSession* session) {
  {
    std::lock_guard lock(sessions_mutex_);
    sessions_.erase(session);
  }
  sessions_cv_.notify_all();
}

uint16_t DownloadServer::Port() const {
  const auto bound = bound_port_.load();
  return bound != 0 ? bound : options_.port;
}

std::string DownloadServer::BaseUrl() const {
  if (!options_.public_base_url.empty()) {
    auto base = options_.public_base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base;
  }

  const bool ipv6 = options_.host.find(':') != std::string::npos;
  return "http://" + (ipv6 ? "[" + options_.host + "]" : options_.host) + ":" + std::to_string(Port());
}

std::string DownloadServer::CreateLink(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw util::FileNotFound("File not found: " + path.string());
  }

  const auto absolute = std::filesystem::absolute(path, ec);
  const auto token    = tokens_.Insert(ec ? path : absolute, options_.token_ttl);

  SOUNDSCRIBE_LOG_DEBUG("Created download link", {StringField("file", path.filename().string()),
                                                  IntField("expires_in_ms", static_cast<int64_t>(options_.token_ttl.count()))});
  return BaseUrl() + kDownloadPrefix + token.token;
}

RedeemResult DownloadServer::Redeem(const std::string& token) {
  auto result = tokens_.Redeem(token);
  if (!result.ok()) {
    SOUNDSCRIBE_LOG_DEBUG("Download rejected", {StringField("reason", result.Reason())});
  }
  return result;
}

HealthStatus DownloadServer::Health() const {
  HealthStatus health;
  health.active_tokens = tokens_.Size();
  return health;
}

} // namespace soundscribe::download
