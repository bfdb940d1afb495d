/**
 * HTTP Server Implementation
 */

#include "http_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace logowatch {

namespace {

const char* kBoundary = "frame";
const size_t kMaxHeaderBytes = 64 * 1024;

// Closes the client descriptor when the handler returns
class ClientSocket {
public:
  explicit ClientSocket(int fd) : fd_(fd) {}
  ~ClientSocket() {
    if (fd_ != -1) {
      ::close(fd_);
    }
  }

  ClientSocket(const ClientSocket&) = delete;
  ClientSocket& operator=(const ClientSocket&) = delete;

private:
  int fd_;
};

bool sendAll(int fd, const char* data, size_t length) {
  while (length > 0) {
    ssize_t sent = ::send(fd, data, length, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    length -= static_cast<size_t>(sent);
  }
  return true;
}

bool sendAll(int fd, const std::string& data) {
  return sendAll(fd, data.data(), data.size());
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 307: return "Temporary Redirect";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 503: return "Service Unavailable";
  }
  return "Internal Server Error";
}

bool sendResponse(int fd, int status, const std::string& contentType,
                  const std::string& body,
                  const std::string& extraHeaders = std::string()) {
  std::ostringstream head;
  head << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n"
       << "Content-Type: " << contentType << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Cache-Control: no-cache\r\n"
       << extraHeaders
       << "Connection: close\r\n\r\n";
  return sendAll(fd, head.str()) && sendAll(fd, body);
}

bool sendJson(int fd, int status, const nlohmann::json& body) {
  return sendResponse(fd, status, "application/json", body.dump());
}

void setSocketTimeouts(int fd, int timeoutMs) {
  timeval tv{};
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    std::cerr << "[Server] setsockopt timeout failed: " << std::strerror(errno)
              << std::endl;
  }
}

std::string contentTypeFor(const std::string& path) {
  size_t dot = path.rfind('.');
  std::string ext = dot == std::string::npos ? std::string() : path.substr(dot + 1);
  if (ext == "html" || ext == "htm") return "text/html; charset=utf-8";
  if (ext == "js") return "application/javascript";
  if (ext == "css") return "text/css";
  if (ext == "json") return "application/json";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "svg") return "image/svg+xml";
  if (ext == "ico") return "image/x-icon";
  return "application/octet-stream";
}

std::string htmlEscape(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '<': escaped += "&lt;"; break;
      case '>': escaped += "&gt;"; break;
      case '&': escaped += "&amp;"; break;
      default:  escaped.push_back(c);
    }
  }
  return escaped;
}

} // namespace

bool peerClosed(int fd) {
  char peek;
  ssize_t received = ::recv(fd, &peek, 1, MSG_PEEK | MSG_DONTWAIT);
  if (received == 0) {
    return true;
  }
  if (received < 0) {
    return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
  }
  return false;
}

nlohmann::json statsToJson(const Statistics& stats, const LoopStatus& status) {
  nlohmann::json out;
  out["fps"] = stats.fps;

  nlohmann::json matches = nlohmann::json::object();
  for (const auto& entry : stats.matches) {
    out[entry.first + "_matches"] = entry.second;
    matches[entry.first] = entry.second;
  }
  out["matches"] = matches;

  out["last_update"] = stats.lastUpdate;
  if (stats.hasMemory) {
    out["mem_mb"] = stats.memoryMb;
  }
  out["frames_captured"] = stats.framesCaptured;
  out["frames_processed"] = stats.framesProcessed;
  out["frames_published"] = stats.framesPublished;
  out["encode_failures"] = stats.encodeFailures;
  out["state"] = status.state;
  out["last_error"] = errorName(status.lastError);
  if (!status.detail.empty()) {
    out["detail"] = status.detail;
  }
  return out;
}

ReloadOutcome reloadReferences(ReferenceSet& references,
                               const std::vector<FormField>& fields) {
  ReloadOutcome outcome;
  nlohmann::json slots = nlohmann::json::object();
  int attempted = 0;
  int succeeded = 0;

  for (const auto& slot : references.slotNames()) {
    const FormField* file = nullptr;
    const FormField* path = nullptr;
    for (const auto& field : fields) {
      if (field.name == slot + "_file" && !field.value.empty()) {
        file = &field;
      } else if (field.name == slot + "_path" && !field.value.empty()) {
        path = &field;
      }
    }

    ErrorCode result;
    if (file) {
      std::vector<uint8_t> bytes(file->value.begin(), file->value.end());
      result = references.loadBytes(slot, bytes);
    } else if (path) {
      result = references.loadFile(slot, path->value);
    } else {
      continue;
    }

    ++attempted;
    if (result == ErrorCode::None) {
      ++succeeded;
      slots[slot] = "ok";
    } else {
      slots[slot] = errorName(result);
    }
  }

  if (attempted == 0) {
    outcome.httpStatus = 400;
    outcome.body = {{"status", "error"}, {"detail", "no logo supplied"}};
    return outcome;
  }

  if (succeeded == attempted) {
    outcome.httpStatus = 200;
    outcome.body["status"] = "ok";
  } else if (succeeded > 0) {
    outcome.httpStatus = 200;
    outcome.body["status"] = "partial";
  } else {
    outcome.httpStatus = 422;
    outcome.body["status"] = "error";
  }
  outcome.body["slots"] = slots;
  return outcome;
}

HttpServer::HttpServer(const ServerConfig& config,
                       std::shared_ptr<SharedState> shared,
                       std::shared_ptr<ReferenceSet> references)
  : config_(config),
    shared_(std::move(shared)),
    references_(std::move(references)),
    listenFd_(-1),
    running_(false) {}

HttpServer::~HttpServer() {
  stop();
}

bool HttpServer::start() {
  if (running_) {
    return true;
  }

  listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listenFd_ < 0) {
    std::cerr << "[Server] socket failed: " << std::strerror(errno) << std::endl;
    return false;
  }

  int opt = 1;
  if (::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    std::cerr << "[Server] SO_REUSEADDR failed: " << std::strerror(errno) << std::endl;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<uint16_t>(config_.port));

  if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[Server] Failed to bind port " << config_.port << ": "
              << std::strerror(errno) << std::endl;
    ::close(listenFd_);
    listenFd_ = -1;
    return false;
  }

  if (::listen(listenFd_, 16) < 0) {
    std::cerr << "[Server] listen failed: " << std::strerror(errno) << std::endl;
    ::close(listenFd_);
    listenFd_ = -1;
    return false;
  }

  running_ = true;
  acceptThread_ = std::thread(&HttpServer::acceptLoop, this);
  std::cout << "[Server] Listening on port " << config_.port << std::endl;
  return true;
}

void HttpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (acceptThread_.joinable()) {
    acceptThread_.join();
  }
  if (listenFd_ >= 0) {
    ::close(listenFd_);
    listenFd_ = -1;
  }

  {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    for (int fd : clientFds_) {
      ::shutdown(fd, SHUT_RDWR);
    }
  }
  shared_->notifyAll();
  reapClients(true);
  std::cout << "[Server] Stopped" << std::endl;
}

void HttpServer::acceptLoop() {
  while (running_) {
    pollfd pfd{};
    pfd.fd = listenFd_;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, 200);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[Server] poll failed: " << std::strerror(errno) << std::endl;
      break;
    }
    reapClients(false);
    if (ready == 0) {
      continue;
    }

    sockaddr_in clientAddr{};
    socklen_t clientLen = sizeof(clientAddr);
    int fd = ::accept(listenFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
    if (fd < 0) {
      if (running_ && errno != EINTR && errno != EAGAIN) {
        std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
      }
      continue;
    }
    setSocketTimeouts(fd, config_.socketTimeoutMs);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(clientsMutex_);
    clientFds_.insert(fd);
    clients_.push_back({std::thread([this, fd, done] {
                          handleClient(fd);
                          *done = true;
                        }),
                        done});
  }
}

void HttpServer::reapClients(bool joinAll) {
  std::vector<ClientWorker> finished;
  {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (joinAll || *it->done) {
        finished.push_back(std::move(*it));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Joined outside the lock, handlers take it to unregister their socket
  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void HttpServer::handleClient(int fd) {
  {
    ClientSocket socket(fd);
    HttpRequest request;
    int errorStatus = 400;
    if (readRequest(fd, request, errorStatus)) {
      route(fd, request);
    } else if (errorStatus != 0) {
      sendJson(fd, errorStatus, {{"detail", reasonPhrase(errorStatus)}});
    }
    std::lock_guard<std::mutex> lock(clientsMutex_);
    clientFds_.erase(fd);
  }
}

bool HttpServer::readRequest(int fd, HttpRequest& request, int& errorStatus) {
  std::string data;
  char buffer[4096];
  size_t headerEnd = std::string::npos;

  while (headerEnd == std::string::npos) {
    ssize_t received = ::recv(fd, buffer, sizeof(buffer), 0);
    if (received <= 0) {
      errorStatus = 0;  // peer gone or timed out, nothing to answer
      return false;
    }
    data.append(buffer, static_cast<size_t>(received));
    headerEnd = data.find("\r\n\r\n");
    if (headerEnd == std::string::npos && data.size() > kMaxHeaderBytes) {
      errorStatus = 400;
      return false;
    }
  }

  if (!parseRequestHead(data.substr(0, headerEnd), request)) {
    errorStatus = 400;
    return false;
  }

  size_t length = request.contentLength();
  if (length > config_.maxUploadBytes) {
    errorStatus = 413;
    return false;
  }

  request.body = data.substr(headerEnd + 4);
  while (request.body.size() < length) {
    ssize_t received = ::recv(fd, buffer, sizeof(buffer), 0);
    if (received <= 0) {
      errorStatus = 400;
      return false;
    }
    request.body.append(buffer, static_cast<size_t>(received));
  }
  if (request.body.size() > length) {
    request.body.resize(length);
  }
  return true;
}

void HttpServer::route(int fd, const HttpRequest& request) {
  const std::string& target = request.target;
  const std::string& method = request.method;

  if (target == "/reload-logos") {
    if (method == "POST") {
      serveReload(fd, request);
    } else {
      sendJson(fd, 405, {{"detail", "POST only"}});
    }
    return;
  }

  bool known = target == "/stream" || target == "/stats" ||
               target == "/stats_html" || target == "/" ||
               target.compare(0, 8, "/static/") == 0;
  if (!known) {
    sendJson(fd, 404, {{"detail", "Not Found"}});
    return;
  }
  if (method != "GET") {
    sendJson(fd, 405, {{"detail", "GET only"}});
    return;
  }

  if (target == "/stream") {
    serveStream(fd);
  } else if (target == "/stats") {
    serveStats(fd);
  } else if (target == "/stats_html") {
    serveStatsHtml(fd);
  } else if (target == "/") {
    sendResponse(fd, 307, "text/plain", "", "Location: /static/index.html\r\n");
  } else {
    serveStatic(fd, target.substr(8));
  }
}

void HttpServer::serveStream(int fd) {
  std::string head =
    std::string("HTTP/1.1 200 OK\r\n") +
    "Content-Type: multipart/x-mixed-replace; boundary=" + kBoundary + "\r\n"
    "Cache-Control: no-cache\r\n"
    "Pragma: no-cache\r\n"
    "Connection: close\r\n\r\n";
  if (!sendAll(fd, head)) {
    return;
  }

  uint64_t lastSequence = 0;
  int partsSent = 0;
  while (running_) {
    auto latest = shared_->waitForUpdate(lastSequence, std::chrono::milliseconds(500));
    if (!latest) {
      // Nothing to send while the loop is idle, so a dropped viewer shows only here
      if (peerClosed(fd)) {
        break;
      }
      continue;
    }
    lastSequence = latest->sequence;
    if (!latest->frame || latest->frame->empty()) {
      continue;
    }

    const EncodedImage& jpeg = *latest->frame;
    std::string partHead =
      std::string("--") + kBoundary + "\r\n"
      "Content-Type: image/jpeg\r\n"
      "Content-Length: " + std::to_string(jpeg.size()) + "\r\n\r\n";

    if (!sendAll(fd, partHead) ||
        !sendAll(fd, reinterpret_cast<const char*>(jpeg.data()), jpeg.size()) ||
        !sendAll(fd, "\r\n")) {
      break;
    }
    ++partsSent;

    if (config_.streamIntervalMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.streamIntervalMs));
    }
  }
  std::cout << "[Server] Stream client left after " << partsSent << " frames"
            << std::endl;
}

void HttpServer::serveStats(int fd) {
  sendJson(fd, 200, statsToJson(shared_->readStats(), shared_->readStatus()));
}

void HttpServer::serveStatsHtml(int fd) {
  std::string pretty =
    statsToJson(shared_->readStats(), shared_->readStatus()).dump(2);
  std::string html =
    "<!DOCTYPE html>\n"
    "<html><head>\n"
    "<meta charset='utf-8'>\n"
    "<meta http-equiv='refresh' content='1'>\n"
    "<style>\n"
    "body { margin:0; background:#111; color:#eee; font-family: monospace; font-size:14px; }\n"
    "pre  { padding:8px; }\n"
    "</style>\n"
    "</head><body>\n"
    "<pre>" + htmlEscape(pretty) + "</pre>\n"
    "</body></html>";
  sendResponse(fd, 200, "text/html; charset=utf-8", html);
}

void HttpServer::serveReload(int fd, const HttpRequest& request) {
  std::vector<FormField> fields;
  if (!parseForm(request, fields)) {
    sendJson(fd, 400, {{"status", "error"}, {"detail", "unreadable form body"}});
    return;
  }

  ReloadOutcome outcome = reloadReferences(*references_, fields);
  std::cout << "[Server] Reload: " << outcome.body.dump() << std::endl;
  sendJson(fd, outcome.httpStatus, outcome.body);
}

void HttpServer::serveStatic(int fd, const std::string& relative) {
  std::string path = relative.empty() ? "index.html" : urlDecode(relative);
  if (path.find("..") != std::string::npos || path.front() == '/') {
    sendJson(fd, 404, {{"detail", "Not Found"}});
    return;
  }

  std::ifstream file(config_.staticDir + "/" + path, std::ios::binary);
  if (!file.is_open()) {
    sendJson(fd, 404, {{"detail", "Not Found"}});
    return;
  }
  std::ostringstream content;
  content << file.rdbuf();
  sendResponse(fd, 200, contentTypeFor(path), content.str());
}

} // namespace logowatch
