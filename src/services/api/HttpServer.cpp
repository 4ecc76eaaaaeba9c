#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "core/config/Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/naming/Naming.hpp"
#include "core/pipeline/RadarPublisher.hpp"

using nlohmann::json;

namespace rpub {

namespace {

const char* mountFor(Stream s) {
  return s == Stream::Current ? "/output" : "/output_forecast";
}

json boundsJson(const GeoBounds& b) {
  return json{{"lon_min", b.lon_min}, {"lon_max", b.lon_max},
              {"lat_min", b.lat_min}, {"lat_max", b.lat_max}};
}

} // namespace

HttpServer::HttpServer(const Config& cfg, RadarPublisher& publisher)
  : cfg_(cfg), publisher_(publisher), svr_(std::make_unique<httplib::Server>()) {
  registerRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::registerRoutes() {
  httplib::Server& svr = *svr_;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /api/latest/<stream>
  // Lists every variant and scale of the newest timestamp (issuance for the
  // forecast stream) so a map client can build its overlay URLs.
  svr.Get(R"(/api/latest/([a-z]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Stream stream;
    try {
      stream = parseStream(req.matches[1]);
    } catch (const ConfigError& e) {
      res.status = 404;
      res.set_content(e.what(), "text/plain");
      return;
    }

    std::vector<PublishedArtifact> latest;
    try {
      latest = publisher_.latestArtifacts(stream);
    } catch (const std::exception& e) {
      spdlog::error("listing {} failed: {}", streamName(stream), e.what());
      res.status = 500;
      res.set_content("listing failed", "text/plain");
      return;
    }

    json items = json::array();
    for (const auto& a : latest) {
      const std::string file = artifactFilename(a.key);
      items.push_back({
        {"file", file},
        {"url", std::string(mountFor(stream)) + "/" + file},
        {"variant", a.key.variant},
        {"scale", a.key.scale},
        {"lead_minutes", a.key.lead_minutes},
        {"bytes", a.bytes}
      });
    }

    json out = {
      {"stream", streamName(stream)},
      {"timestamp", latest.empty() ? json(nullptr) : json(formatUtc(latest.front().key.timestamp))},
      {"bounds", boundsJson(cfg_.product.bounds)},
      {"artifacts", items}
    };
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  for (Stream s : {Stream::Current, Stream::Forecast}) {
    const std::string dir = cfg_.outputDir(s);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (!svr.set_mount_point(mountFor(s), dir)) {
      spdlog::warn("cannot serve {} from {}", mountFor(s), dir);
    }
  }

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

bool HttpServer::listen(const std::string& host, int port) {
  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr_->listen(host, port)) {
    spdlog::error("Failed to bind {}:{}", host, port);
    return false;
  }
  return true;
}

int HttpServer::bindToAnyPort(const std::string& host) {
  const int port = svr_->bind_to_any_port(host);
  if (port < 0) spdlog::error("Failed to bind an ephemeral port on {}", host);
  return port;
}

bool HttpServer::serve() {
  return svr_->listen_after_bind();
}

void HttpServer::stop() {
  svr_->stop();
}

bool HttpServer::isRunning() const {
  return svr_->is_running();
}

} // namespace rpub
