/**
 * HTTP Server - stream, statistics and reload endpoints
 * One thread per client; clients only read the shared state
 */

#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "http_request.hpp"
#include "reference_set.hpp"
#include "shared_state.hpp"

namespace logowatch {

struct ServerConfig {
  int port = 8000;
  std::string staticDir = "static";
  size_t maxUploadBytes = 16 * 1024 * 1024;
  int streamIntervalMs = 0;   // minimum gap between parts, 0 = every publish
  int socketTimeoutMs = 5000; // per-client send/receive timeout

  ServerConfig() = default;
};

// True once the remote end has closed or reset the connection; never blocks
bool peerClosed(int fd);

nlohmann::json statsToJson(const Statistics& stats, const LoopStatus& status);

/**
 * Reload outcome per slot; "ok" or the error name
 */
struct ReloadOutcome {
  int httpStatus = 400;
  nlohmann::json body;
};

ReloadOutcome reloadReferences(ReferenceSet& references,
                               const std::vector<FormField>& fields);

class HttpServer {
public:
  HttpServer(const ServerConfig& config,
             std::shared_ptr<SharedState> shared,
             std::shared_ptr<ReferenceSet> references);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  bool start();
  void stop();
  bool isRunning() const { return running_; }

private:
  struct ClientWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  ServerConfig config_;
  std::shared_ptr<SharedState> shared_;
  std::shared_ptr<ReferenceSet> references_;

  int listenFd_;
  std::atomic<bool> running_;
  std::thread acceptThread_;

  std::mutex clientsMutex_;
  std::vector<ClientWorker> clients_;
  std::set<int> clientFds_;

  void acceptLoop();
  void reapClients(bool joinAll);
  void handleClient(int fd);

  bool readRequest(int fd, HttpRequest& request, int& errorStatus);
  void route(int fd, const HttpRequest& request);

  void serveStream(int fd);
  void serveStats(int fd);
  void serveStatsHtml(int fd);
  void serveReload(int fd, const HttpRequest& request);
  void serveStatic(int fd, const std::string& target);
};

} // namespace logowatch

#endif // HTTP_SERVER_HPP
