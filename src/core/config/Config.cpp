#include "Config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace rpub {

namespace {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

int env_int_or(const char* key, int defval) {
  const std::string s = get_env_or(key, "");
  if (s.empty()) return defval;
  try {
    return std::stoi(s);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + " is not an integer: " + s);
  }
}

template <typename T>
void read_into(const json& j, const char* key, T& out) {
  if (j.contains(key)) out = j.at(key).get<T>();
}

void read_source(const json& j, const char* key, StreamSource& out) {
  if (!j.contains(key)) return;
  const json& s = j.at(key);
  read_into(s, "enabled", out.enabled);
  read_into(s, "base_url", out.base_url);
}

} // namespace

const char* streamName(Stream s) {
  return s == Stream::Current ? "current" : "forecast";
}

Stream parseStream(const std::string& name) {
  if (name == "current") return Stream::Current;
  if (name == "forecast") return Stream::Forecast;
  throw ConfigError("unknown stream: " + name);
}

const StreamSource& Config::source(Stream s) const {
  return s == Stream::Current ? streams.current : streams.forecast;
}

std::string Config::dataDir(Stream s) const {
  return (std::filesystem::path(storage.data_root) / streamName(s)).string();
}

std::string Config::outputDir(Stream s) const {
  return (std::filesystem::path(storage.output_root) / streamName(s)).string();
}

std::vector<Stream> Config::enabledStreams() const {
  std::vector<Stream> out;
  if (streams.current.enabled) out.push_back(Stream::Current);
  if (streams.forecast.enabled) out.push_back(Stream::Forecast);
  return out;
}

Config defaultConfig() {
  Config cfg;
  cfg.workers.pool_size = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  return cfg;
}

Config loadConfigFile(const std::string& path) {
  Config cfg = defaultConfig();
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file: " + path);

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }

  try {
    if (j.contains("schedule")) {
      const json& s = j["schedule"];
      read_into(s, "interval_seconds", cfg.schedule.interval_seconds);
      read_into(s, "shutdown_grace_seconds", cfg.schedule.shutdown_grace_seconds);
    }
    if (j.contains("workers")) read_into(j["workers"], "pool_size", cfg.workers.pool_size);
    if (j.contains("retry")) {
      const json& r = j["retry"];
      read_into(r, "attempts", cfg.retry.attempts);
      read_into(r, "backoff_base_ms", cfg.retry.backoff_base_ms);
      read_into(r, "backoff_max_ms", cfg.retry.backoff_max_ms);
      read_into(r, "cooldown_seconds", cfg.retry.cooldown_seconds);
      read_into(r, "timeout_seconds", cfg.retry.timeout_seconds);
    }
    if (j.contains("output")) {
      read_into(j["output"], "scales", cfg.output.scales);
      read_into(j["output"], "png_compression", cfg.output.png_compression);
    }
    if (j.contains("streams")) {
      read_source(j["streams"], "current", cfg.streams.current);
      read_source(j["streams"], "forecast", cfg.streams.forecast);
    }
    if (j.contains("product")) {
      const json& p = j["product"];
      read_into(p, "code", cfg.product.code);
      read_into(p, "xsize", cfg.product.xsize);
      read_into(p, "ysize", cfg.product.ysize);
      read_into(p, "bounds_tolerance", cfg.product.bounds_tolerance);
      if (p.contains("bounds")) {
        const json& b = p["bounds"];
        read_into(b, "lon_min", cfg.product.bounds.lon_min);
        read_into(b, "lon_max", cfg.product.bounds.lon_max);
        read_into(b, "lat_min", cfg.product.bounds.lat_min);
        read_into(b, "lat_max", cfg.product.bounds.lat_max);
      }
    }
    if (j.contains("storage")) {
      const json& s = j["storage"];
      read_into(s, "data_root", cfg.storage.data_root);
      read_into(s, "output_root", cfg.storage.output_root);
      read_into(s, "db_path", cfg.storage.db_path);
      read_into(s, "schema_path", cfg.storage.schema_path);
      read_into(s, "listing_window", cfg.storage.listing_window);
      read_into(s, "retained_timestamps", cfg.storage.retained_timestamps);
    }
    if (j.contains("forecast")) {
      read_into(j["forecast"], "lead_minutes", cfg.forecast.lead_minutes);
      read_into(j["forecast"], "keep_issuances", cfg.forecast.keep_issuances);
    }
    if (j.contains("server")) {
      const json& s = j["server"];
      read_into(s, "enabled", cfg.server.enabled);
      read_into(s, "host", cfg.server.host);
      read_into(s, "port", cfg.server.port);
    }
    if (j.contains("logging")) read_into(j["logging"], "level", cfg.logging.level);
  } catch (const json::exception& e) {
    throw ConfigError("bad value in " + path + ": " + e.what());
  }

  spdlog::info("Loaded configuration from {}", path);
  return cfg;
}

void applyEnvOverrides(Config& cfg) {
  cfg.storage.data_root   = get_env_or("RPUB_DATA_ROOT",   cfg.storage.data_root);
  cfg.storage.output_root = get_env_or("RPUB_OUTPUT_ROOT", cfg.storage.output_root);
  cfg.storage.db_path     = get_env_or("RPUB_DB_PATH",     cfg.storage.db_path);
  cfg.storage.schema_path = get_env_or("RPUB_SCHEMA_PATH", cfg.storage.schema_path);
  cfg.logging.level       = get_env_or("RPUB_LOG_LEVEL",   cfg.logging.level);
  cfg.server.port               = env_int_or("RPUB_PORT",     cfg.server.port);
  cfg.workers.pool_size         = env_int_or("RPUB_WORKERS",  cfg.workers.pool_size);
  cfg.schedule.interval_seconds = env_int_or("RPUB_INTERVAL", cfg.schedule.interval_seconds);
}

void validateConfig(const Config& cfg) {
  auto require = [](bool ok, const std::string& key, const std::string& why) {
    if (!ok) throw ConfigError("invalid config " + key + ": " + why);
  };

  require(cfg.schedule.interval_seconds > 0, "schedule.interval_seconds", "must be > 0");
  require(cfg.schedule.shutdown_grace_seconds >= 0, "schedule.shutdown_grace_seconds", "must be >= 0");
  require(cfg.workers.pool_size >= 1, "workers.pool_size", "must be >= 1");
  require(cfg.retry.attempts >= 1, "retry.attempts", "must be >= 1");
  require(cfg.retry.backoff_base_ms >= 0, "retry.backoff_base_ms", "must be >= 0");
  require(cfg.retry.backoff_max_ms >= cfg.retry.backoff_base_ms, "retry.backoff_max_ms",
          "must be >= backoff_base_ms");
  require(cfg.retry.cooldown_seconds >= 0, "retry.cooldown_seconds", "must be >= 0");
  require(cfg.retry.timeout_seconds > 0, "retry.timeout_seconds", "must be > 0");

  require(!cfg.output.scales.empty(), "output.scales", "must not be empty");
  std::set<int> seen;
  for (int s : cfg.output.scales) {
    require(s >= 1 && s <= 8, "output.scales", "each scale must be in 1..8");
    require(seen.insert(s).second, "output.scales", "duplicate scale " + std::to_string(s));
  }
  require(cfg.output.png_compression >= 0 && cfg.output.png_compression <= 9,
          "output.png_compression", "must be in 0..9");

  require(!cfg.enabledStreams().empty(), "streams", "at least one stream must be enabled");
  for (Stream s : cfg.enabledStreams()) {
    const std::string& url = cfg.source(s).base_url;
    require(url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0,
            std::string("streams.") + streamName(s) + ".base_url", "must be an http(s) URL");
    require(url.back() == '/', std::string("streams.") + streamName(s) + ".base_url",
            "must end with '/'");
  }

  require(cfg.product.xsize > 0 && cfg.product.ysize > 0, "product.xsize/ysize", "must be > 0");
  require(cfg.product.bounds.isWebMercatorCompatible(), "product.bounds",
          "must be Web Mercator compatible");
  require(cfg.product.bounds_tolerance >= 0.0, "product.bounds_tolerance", "must be >= 0");

  require(!cfg.storage.data_root.empty(), "storage.data_root", "must not be empty");
  require(!cfg.storage.output_root.empty(), "storage.output_root", "must not be empty");
  require(!cfg.storage.db_path.empty(), "storage.db_path", "must not be empty");
  require(cfg.storage.listing_window >= 1, "storage.listing_window", "must be >= 1");
  require(cfg.storage.retained_timestamps >= 0, "storage.retained_timestamps", "must be >= 0");
  require(cfg.storage.retained_timestamps == 0 ||
              cfg.storage.retained_timestamps >= cfg.storage.listing_window,
          "storage.retained_timestamps", "must be 0 or >= storage.listing_window");

  require(!cfg.forecast.lead_minutes.empty(), "forecast.lead_minutes", "must not be empty");
  std::set<int> leads;
  for (int m : cfg.forecast.lead_minutes) {
    require(m > 0 && m <= 99, "forecast.lead_minutes", "each lead must be in 1..99");
    require(leads.insert(m).second, "forecast.lead_minutes", "duplicate lead " + std::to_string(m));
  }
  require(cfg.forecast.keep_issuances >= 0, "forecast.keep_issuances", "must be >= 0");

  require(cfg.server.port > 0 && cfg.server.port < 65536, "server.port", "must be in 1..65535");
  require(spdlog::level::from_str(cfg.logging.level) != spdlog::level::off ||
              cfg.logging.level == "off",
          "logging.level", "unknown level " + cfg.logging.level);
}

} // namespace rpub
