#pragma once
#include <memory>
#include <string>

namespace httplib { class Server; }

namespace rpub {

struct Config;
class RadarPublisher;

// Read-only HTTP front of the output directories:
//   GET /health
//   GET /api/latest/<stream>   newest published artifacts plus product bounds
//   /output/...                 current stream PNGs
//   /output_forecast/...        forecast stream PNGs
class HttpServer {
public:
  HttpServer(const Config& cfg, RadarPublisher& publisher);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Blocks until stop(). Returns false if the address could not be bound.
  bool listen(const std::string& host, int port);

  // Binds an ephemeral port and returns it (-1 on failure); serve() then blocks.
  int bindToAnyPort(const std::string& host);
  bool serve();

  void stop();
  bool isRunning() const;

private:
  void registerRoutes();

  const Config& cfg_;
  RadarPublisher& publisher_;
  std::unique_ptr<httplib::Server> svr_;
};

} // namespace rpub
