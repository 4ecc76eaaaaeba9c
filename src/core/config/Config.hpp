#pragma once
#include <string>
#include <vector>

#include "core/decode/ReflectivityGrid.hpp"

namespace rpub {

enum class Stream { Current, Forecast };

const char* streamName(Stream s);
// Throws ConfigError for anything but "current" / "forecast".
Stream parseStream(const std::string& name);

struct ScheduleConfig {
  int interval_seconds = 300;
  int shutdown_grace_seconds = 30;
};

struct WorkerConfig {
  int pool_size = 4;
};

struct RetryConfig {
  int attempts = 4;
  int backoff_base_ms = 2000;
  int backoff_max_ms = 30000;
  int cooldown_seconds = 900;
  int timeout_seconds = 30;
};

struct OutputConfig {
  std::vector<int> scales{1, 2};   // pixel density multipliers
  int png_compression = 9;
};

struct StreamSource {
  bool enabled = true;
  std::string base_url;
};

struct StreamsConfig {
  StreamSource current{true, "https://opendata.chmi.cz/meteorology/weather/radar/composite/maxz/hdf5/"};
  StreamSource forecast{true, "https://opendata.chmi.cz/meteorology/weather/radar/composite/fct_maxz/hdf5/"};
};

// Layout every input of the product must match.
struct ProductContract {
  std::string code = "PABV23";
  int xsize = 598;
  int ysize = 378;
  GeoBounds bounds{11.267, 19.624, 48.047, 51.458};
  double bounds_tolerance = 1e-3;
};

struct StorageConfig {
  std::string data_root = "data/radar";
  std::string output_root = "data/output";
  std::string db_path = "data/manifest.db";
  std::string schema_path = "schema.sql";
  int listing_window = 12;          // newest remote entries considered per cycle
  int retained_timestamps = 600;    // current-stream timestamps kept on disk
};

struct ForecastConfig {
  std::vector<int> lead_minutes{10, 20, 30, 40, 50, 60};
  int keep_issuances = 0;           // older issuances kept after a full replacement
};

struct ServerConfig {
  bool enabled = true;
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct LoggingConfig {
  std::string level = "info";
};

// Built once at startup, validated, then shared by const reference.
struct Config {
  ScheduleConfig schedule;
  WorkerConfig workers;
  RetryConfig retry;
  OutputConfig output;
  StreamsConfig streams;
  ProductContract product;
  StorageConfig storage;
  ForecastConfig forecast;
  ServerConfig server;
  LoggingConfig logging;

  const StreamSource& source(Stream s) const;
  std::string dataDir(Stream s) const;
  std::string outputDir(Stream s) const;
  std::vector<Stream> enabledStreams() const;
};

Config defaultConfig();
// Reads a JSON file on top of the defaults. Missing keys keep their default.
Config loadConfigFile(const std::string& path);
void applyEnvOverrides(Config& cfg);
void validateConfig(const Config& cfg);

} // namespace rpub
